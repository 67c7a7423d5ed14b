#include "game_manager.hpp"

#include <exception>
#include <future>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <utility>

namespace chessarena {

namespace {

// Prepares both strategies and releases them when the game leaves scope,
// whichever way it leaves.
class StrategySession {
public:
    StrategySession(MoveStrategy& white, MoveStrategy& black) : white_(white), black_(black) {}

    ~StrategySession() {
        releaseQuietly(white_);
        if (&black_ != &white_) releaseQuietly(black_);
    }

    StrategySession(const StrategySession&) = delete;
    StrategySession& operator=(const StrategySession&) = delete;

    void prepare() {
        white_.prepare();
        if (&black_ != &white_) black_.prepare();
    }

private:
    static void releaseQuietly(MoveStrategy& strategy) {
        try {
            strategy.release();
        } catch (const std::exception& e) {
            std::cerr << "Error releasing " << strategy.name() << ": " << e.what() << std::endl;
        }
    }

    MoveStrategy& white_;
    MoveStrategy& black_;
};

// Returns the orchestrator to IDLE when a game leaves startGame(), however it leaves.
class IdleOnExit {
public:
    explicit IdleOnExit(std::atomic<GameState>& state) : state_(state) {}
    ~IdleOnExit() { state_ = GameState::IDLE; }

    IdleOnExit(const IdleOnExit&) = delete;
    IdleOnExit& operator=(const IdleOnExit&) = delete;

private:
    std::atomic<GameState>& state_;
};

} // namespace

std::string terminationToString(TerminationReason r) {
    switch (r) {
        case TerminationReason::NO_MOVE: return "No move";
        case TerminationReason::STALLED: return "Stalled";
        case TerminationReason::CHECKMATE: return "Checkmate";
        case TerminationReason::PLY_LIMIT: return "Ply limit";
        case TerminationReason::STOPPED: return "Stopped";
        default: return "Unknown";
    }
}

// ───────────────────────── OutcomeRecorder ─────────────────────────

std::string OutcomeRecorder::classify(const Board& board, Side learnerSide) {
    if (board.isCheckmate(learnerSide)) return "loss";
    if (board.isCheckmate(opposite(learnerSide))) return "win";
    return "draw";
}

void OutcomeRecorder::onGameEnd(RandomPlayoutStrategy& statistics) {
    const std::string result = classify(board_, learnerSide_);
    statistics.recordOutcome(result);
    for (const Move& m : statistics.movesProposedFor(learnerSide_)) {
        statistics.updateMoveStatistics(m, result == "win");
    }
}

// ───────────────────────── GameOrchestrator ─────────────────────────

GameOrchestrator::GameOrchestrator(Board& board, MoveHistory& history,
                                   MoveStrategy& white, MoveStrategy& black,
                                   RenderSurface& surface, RandomPlayoutStrategy& learner,
                                   GameConfig config)
    : board_(board), history_(history), white_(white), black_(black),
      surface_(surface), learner_(learner), config_(std::move(config)) {}

GameSummary GameOrchestrator::startGame() {
    GameState expected = GameState::IDLE;
    if (!state_.compare_exchange_strong(expected, GameState::INITIALIZING)) {
        throw std::logic_error("A game is already running");
    }
    IdleOnExit idle(state_);
    {
        std::lock_guard<std::mutex> lock(stopMutex_);
        stopRequested_ = false;
    }

    board_.resetToInitial();
    history_.clear();
    tree_ = std::make_unique<GameTree>(board_);

    if (config_.verbose) {
        std::cout << "New game: " << white_.name() << " (White) vs "
                  << black_.name() << " (Black)\n";
    }

    // A strategy that cannot start ends the call here; nothing is saved.
    StrategySession session(white_, black_);
    session.prepare();

    GameSummary summary;
    try {
        playTurns(summary);
    } catch (...) {
        summary.reason = TerminationReason::STOPPED;
        finalize(summary);
        throw;
    }
    finalize(summary);
    return summary;
}

void GameOrchestrator::requestStop() {
    {
        std::lock_guard<std::mutex> lock(stopMutex_);
        stopRequested_ = true;
    }
    stopCv_.notify_all();
}

bool GameOrchestrator::stopRequested() const {
    std::lock_guard<std::mutex> lock(stopMutex_);
    return stopRequested_;
}

bool GameOrchestrator::pace() {
    std::unique_lock<std::mutex> lock(stopMutex_);
    return !stopCv_.wait_for(lock, config_.pacingDelay, [this] { return stopRequested_; });
}

void GameOrchestrator::playTurns(GameSummary& summary) {
    while (true) {
        if (stopRequested()) {
            summary.reason = TerminationReason::STOPPED;
            return;
        }

        // --- Ask the side to move ---
        state_ = GameState::AWAITING_MOVE;
        const Side mover = board_.currentMover();
        MoveStrategy& strategy = strategyFor(mover);
        const std::string before = board_.snapshot();

        std::optional<Move> move = strategy.proposeMove(board_);
        if (!move) {
            summary.reason = TerminationReason::NO_MOVE;
            return;
        }

        // --- Commit it ---
        state_ = GameState::APPLYING;
        if (!board_.applyMove(*move)) {
            std::cerr << "Warning: " << strategy.name() << " moved from empty square "
                      << board_.toCoordinateLabel(move->fromRank(), move->fromFile()) << "\n";
        }
        board_.advanceTurn();
        history_.append(*move);
        tree_->addChild(tree_->current(), board_, *move);
        tree_->moveToChild(*move);

        if (config_.verbose) {
            std::cout << "Move #" << history_.size() << " (" << sideToString(mover) << "): "
                      << move->toUci() << "\n";
        }

        // --- Wait until the surface shows it ---
        state_ = GameState::RENDERING;
        std::future<void> rendered = surface_.refresh(move->fromSquare(), move->toSquare());
        rendered.get();

        // --- Is the game over? ---
        state_ = GameState::CHECKING_TERMINATION;
        if (board_.snapshot() == before) {
            if (config_.verbose) std::cout << "Board did not change. Game over.\n";
            summary.reason = TerminationReason::STALLED;
            return;
        }
        if (board_.isCheckmate(board_.currentMover())) {
            if (config_.verbose) std::cout << "Checkmate! " << sideToString(mover) << " wins.\n";
            summary.reason = TerminationReason::CHECKMATE;
            return;
        }
        if (config_.maxPlies > 0 && static_cast<int>(history_.size()) >= config_.maxPlies) {
            if (config_.verbose) std::cout << "Game aborted (too long).\n";
            summary.reason = TerminationReason::PLY_LIMIT;
            return;
        }

        if (!pace()) {
            summary.reason = TerminationReason::STOPPED;
            return;
        }
    }
}

void GameOrchestrator::finalize(GameSummary& summary) {
    state_ = GameState::FINALIZING;
    summary.plies = static_cast<int>(history_.size());
    summary.outcome = board_.outcome();

    if (config_.verbose) {
        std::cout << "Game ended after " << summary.plies << " plies: "
                  << terminationToString(summary.reason) << " ("
                  << outcomeToString(summary.outcome) << ")\n";
    }

    for (GameEndListener* listener : listeners_) {
        try {
            listener->onGameEnd(learner_);
        } catch (const std::exception& e) {
            std::cerr << "Game end listener failed: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Game end listener failed: unknown error" << std::endl;
        }
    }

    try {
        summary.savedPath = saveGame(history_, board_, config_.gamesDirectory);
        if (config_.verbose) std::cout << "Game saved to: " << summary.savedPath.string() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Failed to save game: " << e.what() << std::endl;
        summary.savedPath.clear();
    }

    board_.resetToInitial();
}

} // namespace chessarena
