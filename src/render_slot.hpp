// render_slot.hpp
#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <future>
#include <mutex>
#include <optional>
#include <ostream>
#include <thread>

#include "board.hpp"

namespace chessarena {

// Squares (0..63) to highlight in a refresh, -1 for none.
struct RenderRequest {
    int highlightFrom = -1;
    int highlightTo = -1;
};

/**
 * @brief Single-slot rendezvous between the game loop and the render context.
 *
 * At most one request is in flight. post() hands a request over and returns the
 * one-shot completion signal for it; posting again before that signal fires is a
 * logic error. The render context blocks in take() and answers with complete()
 * or fail().
 */
class RenderSlot {
public:
    // @throws std::logic_error if a request is outstanding or the slot is closed.
    std::future<void> post(const RenderRequest& request);

    // Blocks until a request arrives. Empty once the slot is closed.
    std::optional<RenderRequest> take();

    void complete();
    void fail(std::exception_ptr error);

    // Wakes the render context for good; an outstanding request fails.
    void close();

    bool outstanding() const;

private:
    void finish(std::exception_ptr error);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<RenderRequest> request_;
    std::optional<std::promise<void>> promise_;
    bool closed_ = false;
};

// ───────────────────────── Render surfaces ─────────────────────────

class RenderSurface {
public:
    virtual ~RenderSurface() = default;

    // Asynchronous redraw; the returned future is ready once the frame is shown.
    virtual std::future<void> refresh(int highlightFrom, int highlightTo) = 0;
};

/**
 * @brief Draws the board diagram to a stream from its own render thread.
 *
 * The board is only read on the render thread, and only while the game loop is
 * waiting on the refresh it asked for.
 */
class ConsoleRenderSurface final : public RenderSurface {
public:
    ConsoleRenderSurface(const Board& board, std::ostream& out);
    ~ConsoleRenderSurface() override;

    ConsoleRenderSurface(const ConsoleRenderSurface&) = delete;
    ConsoleRenderSurface& operator=(const ConsoleRenderSurface&) = delete;

    std::future<void> refresh(int highlightFrom, int highlightTo) override;

    std::size_t framesDrawn() const { return framesDrawn_; }

private:
    void renderLoop();

    const Board& board_;
    std::ostream& out_;
    RenderSlot slot_;
    std::atomic<std::size_t> framesDrawn_{0};
    std::thread renderThread_;
};

// Completes every refresh at once without drawing.
class ImmediateRenderSurface final : public RenderSurface {
public:
    std::future<void> refresh(int highlightFrom, int highlightTo) override;

    std::size_t framesDrawn() const { return framesDrawn_; }

private:
    std::size_t framesDrawn_ = 0;
};

} // namespace chessarena
