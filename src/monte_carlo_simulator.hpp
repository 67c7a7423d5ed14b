// monte_carlo_simulator.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <random>

#include "board.hpp"
#include "game_tree.hpp"
#include "move.hpp"
#include "node.hpp"
#include "uct_selector.hpp"

namespace chessarena {

struct SimulatorConfig {
    double explorationConstant = UctSelector::DEFAULT_EXPLORATION;
    int iterations = 1000;
    int playoutPlyCap = 200; // a playout cut at the cap scores as a draw
};

/**
 * @brief Monte Carlo tree search over a GameTree.
 *
 * Every iteration walks down from tree.current() with the UCT selector, adds
 * one untried move, plays random moves to the end (or the ply cap) and feeds
 * the result back up the path. A node's win score is kept from the point of
 * view of the side that played its move: 1 for a win, 0.5 for a draw, 0 for a
 * loss.
 */
class MonteCarloSimulator {
public:
    explicit MonteCarloSimulator(SimulatorConfig config = SimulatorConfig{},
                                 uint32_t seed = std::random_device{}());

    void simulate(GameTree& tree);

    // Move of the most visited child (first one on ties); empty without children.
    static std::optional<Move> bestMove(const Node& node);

    const SimulatorConfig& config() const { return config_; }

private:
    Node& select(Node& from) const;
    Node& expand(GameTree& tree, Node& leaf);
    std::optional<Side> playout(const Board& start); // winner, empty for a draw
    static void backpropagate(Node& leaf, std::optional<Side> winner);

    SimulatorConfig config_;
    UctSelector selector_;
    std::mt19937 rng_;
};

} // namespace chessarena
