#include "random_playout_strategy.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace chessarena {

RandomPlayoutStrategy::RandomPlayoutStrategy(uint32_t seed, bool verbose)
    : rng_(seed), verbose_(verbose) {}

std::optional<Move> RandomPlayoutStrategy::proposeMove(const Board& board) {
    const Side mover = board.currentMover();
    std::vector<Move> legal = board.legalMoves(mover);

    if (legal.empty()) {
        if (verbose_) std::cout << sideToString(mover) << " has no legal moves. Game over.\n";
        return std::nullopt;
    }

    std::uniform_int_distribution<std::size_t> dist(0, legal.size() - 1);
    const Move chosen = legal[dist(rng_)];

    moveStatistics_.emplace(chosen.toUci(), 0); // keeps an existing counter
    proposedThisGame_.push_back(ProposedMove{mover, chosen});
    return chosen;
}

std::vector<Move> RandomPlayoutStrategy::movesProposedFor(Side side) const {
    std::vector<Move> moves;
    for (const ProposedMove& p : proposedThisGame_) {
        if (p.side == side) moves.push_back(p.move);
    }
    return moves;
}

void RandomPlayoutStrategy::recordOutcome(const std::string& result) {
    std::string key = result;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    tally_.games++;
    if (key == "win") tally_.wins++;
    else if (key == "loss") tally_.losses++;
    else if (key == "draw") tally_.draws++;

    if (verbose_) std::cout << "Game result recorded: " << result << "\n";
}

void RandomPlayoutStrategy::updateMoveStatistics(const std::string& move, bool isSuccess) {
    moveStatistics_[move] += (isSuccess ? 1 : 0);
}

std::optional<int> RandomPlayoutStrategy::moveStatistic(const std::string& move) const {
    auto it = moveStatistics_.find(move);
    if (it == moveStatistics_.end()) return std::nullopt;
    return it->second;
}

void RandomPlayoutStrategy::printStatistics(std::ostream& os) const {
    os << "Games Played: " << tally_.games << "\n"
       << "Wins: " << tally_.wins << "\n"
       << "Losses: " << tally_.losses << "\n"
       << "Draws: " << tally_.draws << "\n"
       << "Move Success Rates: {";
    bool first = true;
    for (const auto& [move, count] : moveStatistics_) {
        if (!first) os << ", ";
        os << move << "=" << count;
        first = false;
    }
    os << "}\n";
}

} // namespace chessarena
