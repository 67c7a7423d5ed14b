#include "render_slot.hpp"

#include <stdexcept>
#include <utility>

namespace chessarena {

// ───────────────────────── RenderSlot ─────────────────────────

std::future<void> RenderSlot::post(const RenderRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) throw std::logic_error("Render slot is closed");
    if (promise_) throw std::logic_error("A render request is still outstanding");

    promise_.emplace();
    request_ = request;
    std::future<void> done = promise_->get_future();
    cv_.notify_one();
    return done;
}

std::optional<RenderRequest> RenderSlot::take() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return closed_ || request_.has_value(); });
    if (closed_) return std::nullopt;

    std::optional<RenderRequest> taken = request_;
    request_.reset();
    return taken;
}

void RenderSlot::complete() {
    finish(nullptr);
}

void RenderSlot::fail(std::exception_ptr error) {
    finish(std::move(error));
}

void RenderSlot::finish(std::exception_ptr error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!promise_) return; // abandoned by close()

    if (error) promise_->set_exception(error);
    else promise_->set_value();
    promise_.reset();
}

void RenderSlot::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    request_.reset();
    if (promise_) {
        promise_->set_exception(std::make_exception_ptr(std::runtime_error("Render surface closed")));
        promise_.reset();
    }
    cv_.notify_all();
}

bool RenderSlot::outstanding() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return promise_.has_value();
}

// ───────────────────────── ConsoleRenderSurface ─────────────────────────

ConsoleRenderSurface::ConsoleRenderSurface(const Board& board, std::ostream& out)
    : board_(board), out_(out) {
    renderThread_ = std::thread(&ConsoleRenderSurface::renderLoop, this);
}

ConsoleRenderSurface::~ConsoleRenderSurface() {
    slot_.close();
    if (renderThread_.joinable()) renderThread_.join();
}

std::future<void> ConsoleRenderSurface::refresh(int highlightFrom, int highlightTo) {
    return slot_.post(RenderRequest{highlightFrom, highlightTo});
}

void ConsoleRenderSurface::renderLoop() {
    while (std::optional<RenderRequest> request = slot_.take()) {
        try {
            out_ << board_.pretty(request->highlightFrom, request->highlightTo) << std::flush;
            ++framesDrawn_;
            slot_.complete();
        } catch (...) {
            slot_.fail(std::current_exception()); // rethrown to the game loop by future::get()
        }
    }
}

// ───────────────────────── ImmediateRenderSurface ─────────────────────────

std::future<void> ImmediateRenderSurface::refresh(int, int) {
    std::promise<void> done;
    done.set_value();
    ++framesDrawn_;
    return done.get_future();
}

} // namespace chessarena
