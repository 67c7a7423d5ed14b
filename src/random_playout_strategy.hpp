// random_playout_strategy.hpp
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <random>
#include <string>
#include <vector>

#include "move_strategy.hpp"

namespace chessarena {

// A move handed out during the current game and the side it was played for.
struct ProposedMove {
    Side side;
    Move move;
};

struct OutcomeTally {
    int games = 0;
    int wins = 0;
    int losses = 0;
    int draws = 0;
};

/**
 * @brief Plays a uniformly random legal move and keeps learning statistics.
 *
 * Statistics (outcome tally and per-move success counters) live as long as the
 * strategy object and carry over from one game to the next.
 */
class RandomPlayoutStrategy final : public MoveStrategy {
public:
    // With `verbose` off the strategy prints nothing to std::cout.
    explicit RandomPlayoutStrategy(uint32_t seed = std::random_device{}(), bool verbose = true);

    std::optional<Move> proposeMove(const Board& board) override;
    std::string name() const override { return "Random playout"; }

    // Starts a new game: forgets which moves were proposed in the previous one.
    void prepare() override { proposedThisGame_.clear(); }

    /**
     * @brief Counts a finished game.
     *
     * "win", "loss" and "draw" (any case) bump their counter; any other result
     * is counted as a game only.
     */
    void recordOutcome(const std::string& result);

    // Adds one to the move's counter when isSuccess, nothing otherwise.
    void updateMoveStatistics(const std::string& move, bool isSuccess);
    void updateMoveStatistics(const Move& move, bool isSuccess) { updateMoveStatistics(move.toUci(), isSuccess); }

    // Empty when the move was never proposed nor updated.
    std::optional<int> moveStatistic(const std::string& move) const;

    const std::map<std::string, int>& moveStatistics() const { return moveStatistics_; }
    const OutcomeTally& tally() const { return tally_; }
    const std::vector<ProposedMove>& proposedThisGame() const { return proposedThisGame_; }

    // Moves of the current game proposed while `side` was to move, in play order.
    std::vector<Move> movesProposedFor(Side side) const;

    void printStatistics(std::ostream& os) const;

private:
    std::mt19937 rng_;
    OutcomeTally tally_;
    std::map<std::string, int> moveStatistics_; // key: move in coordinate notation
    std::vector<ProposedMove> proposedThisGame_;
    bool verbose_;
};

} // namespace chessarena
