// uci_engine.hpp
#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <sys/types.h>

#include "move_history.hpp"
#include "move_strategy.hpp"

namespace chessarena {

// I/O failure while talking to the engine process.
class EngineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ───────────────────────── Engine connection ─────────────────────────
// Line oriented channel to a UCI engine.
class EngineConnection {
public:
    virtual ~EngineConnection() = default;

    virtual void start() = 0;
    virtual void send(const std::string& command) = 0;

    // Reads engine output until a line starting with `prefix`, which is returned.
    // @throws EngineError when the engine stops producing output first.
    virtual std::string readUntil(const std::string& prefix) = 0;

    virtual void stop() = 0;
    virtual bool running() const = 0;
};

/**
 * @brief Engine executable run as a child process over stdin/stdout pipes.
 */
class UciEngineProcess final : public EngineConnection {
public:
    explicit UciEngineProcess(std::string enginePath);
    ~UciEngineProcess() override;

    UciEngineProcess(const UciEngineProcess&) = delete;
    UciEngineProcess& operator=(const UciEngineProcess&) = delete;

    void start() override;
    void send(const std::string& command) override;
    std::string readUntil(const std::string& prefix) override;
    void stop() override;
    bool running() const override { return pid_ > 0; }

private:
    bool readLine(std::string& line);

    std::string enginePath_;
    pid_t pid_ = -1;
    int toEngine_ = -1;
    int fromEngine_ = -1;
    std::string pending_;
};

// ───────────────────────── Engine strategy ─────────────────────────
/**
 * @brief Asks an external UCI engine for every move.
 *
 * Each proposal replays the whole game so far with
 * "position startpos moves ..." and then searches with a fixed "go movetime".
 */
class UciEngineStrategy final : public MoveStrategy {
public:
    static constexpr int DEFAULT_MOVE_TIME_MS = 1000;

    UciEngineStrategy(EngineConnection& engine, const MoveHistory& history,
                      int moveTimeMs = DEFAULT_MOVE_TIME_MS, bool verbose = true);

    std::optional<Move> proposeMove(const Board& board) override;
    std::string name() const override { return "UCI engine"; }

    // Starts the engine and performs the uci / isready handshake.
    void prepare() override;

    // Sends "quit" and stops the engine. Failures are logged, not thrown.
    void release() override;

    int moveTimeMs() const { return moveTimeMs_; }

    // The move token of a "bestmove ..." line; empty for "(none)", "0000" or a bare "bestmove".
    static std::optional<Move> parseBestMove(const std::string& line);

private:
    EngineConnection& engine_;
    const MoveHistory& history_;
    int moveTimeMs_;
    bool verbose_;
};

} // namespace chessarena
