// game_manager.hpp
#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "board.hpp"
#include "game_saver.hpp"
#include "game_tree.hpp"
#include "move_history.hpp"
#include "move_strategy.hpp"
#include "random_playout_strategy.hpp"
#include "render_slot.hpp"

namespace chessarena {

enum class GameState {
    IDLE,
    INITIALIZING,
    AWAITING_MOVE,
    APPLYING,
    RENDERING,
    CHECKING_TERMINATION,
    FINALIZING
};

enum class TerminationReason {
    NO_MOVE,    // the side to move had nothing to play
    STALLED,    // the board did not change over a turn
    CHECKMATE,
    PLY_LIMIT,
    STOPPED
};

std::string terminationToString(TerminationReason r);

struct GameConfig {
    std::chrono::milliseconds pacingDelay{500};
    int maxPlies = 400; // 0 = no limit
    bool verbose = true;
    std::filesystem::path gamesDirectory = GAMES_FOLDER_NAME;
};

struct GameSummary {
    Outcome outcome = Outcome::ONGOING;
    TerminationReason reason = TerminationReason::NO_MOVE;
    int plies = 0;
    std::filesystem::path savedPath; // empty if the game could not be saved
};

// Notified once per game, before the game is saved.
class GameEndListener {
public:
    virtual ~GameEndListener() = default;
    virtual void onGameEnd(RandomPlayoutStrategy& statistics) = 0;
};

/**
 * @brief Feeds the result of each game back into the learner's statistics.
 *
 * The final position decides the result from `learnerSide`'s point of view:
 * mated is a loss, mating is a win, anything else a draw. Every move the
 * learner proposed for `learnerSide` during the game is then credited with
 * that result; moves it played for the other side are left alone.
 */
class OutcomeRecorder final : public GameEndListener {
public:
    OutcomeRecorder(const Board& board, Side learnerSide)
        : board_(board), learnerSide_(learnerSide) {}

    void onGameEnd(RandomPlayoutStrategy& statistics) override;

    // "win", "loss" or "draw"
    static std::string classify(const Board& board, Side learnerSide);

private:
    const Board& board_;
    Side learnerSide_;
};

/**
 * @brief Plays one game at a time between two move strategies.
 *
 * Each turn asks the side to move for a move, commits it to the board and the
 * move history, waits for the render surface to show it and then checks for
 * the end of the game. A finished game is announced to the listeners, saved
 * under GameConfig::gamesDirectory and the board is reset.
 *
 * The orchestrator holds references only; the board, history, strategies,
 * surface, learner and listeners must outlive it.
 */
class GameOrchestrator {
public:
    GameOrchestrator(Board& board, MoveHistory& history,
                     MoveStrategy& white, MoveStrategy& black,
                     RenderSurface& surface, RandomPlayoutStrategy& learner,
                     GameConfig config = GameConfig{});

    GameOrchestrator(const GameOrchestrator&) = delete;
    GameOrchestrator& operator=(const GameOrchestrator&) = delete;

    void addListener(GameEndListener& listener) { listeners_.push_back(&listener); }

    // Detaches every registration of `listener`; unknown listeners are ignored.
    void removeListener(GameEndListener& listener) {
        listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), &listener), listeners_.end());
    }

    /**
     * @brief Runs a full game and returns how it ended.
     *
     * Strategies are prepared before the first move and released on every exit
     * path. A strategy that fails to prepare ends the call before anything is
     * played or saved. If the loop throws (engine I/O, render failure) the game
     * played so far is still finalized before the exception propagates.
     *
     * @throws std::logic_error if a game is already running.
     */
    GameSummary startGame();

    // Ends the running game after the current turn. Safe from any thread.
    void requestStop();

    GameState state() const { return state_; }
    const GameConfig& config() const { return config_; }

    // Positions of the last game, one node per committed move. Null before the first game.
    const GameTree* playedLine() const { return tree_.get(); }

private:
    void playTurns(GameSummary& summary);
    void finalize(GameSummary& summary);
    bool pace(); // false when a stop was requested during the delay
    bool stopRequested() const;
    MoveStrategy& strategyFor(Side side) { return side == Side::WHITE ? white_ : black_; }

    Board& board_;
    MoveHistory& history_;
    MoveStrategy& white_;
    MoveStrategy& black_;
    RenderSurface& surface_;
    RandomPlayoutStrategy& learner_;
    GameConfig config_;

    std::vector<GameEndListener*> listeners_;
    std::unique_ptr<GameTree> tree_;
    std::atomic<GameState> state_{GameState::IDLE};

    mutable std::mutex stopMutex_;
    std::condition_variable stopCv_;
    bool stopRequested_ = false;
};

} // namespace chessarena
