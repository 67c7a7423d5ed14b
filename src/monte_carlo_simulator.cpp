#include "monte_carlo_simulator.hpp"

#include <vector>

namespace chessarena {

MonteCarloSimulator::MonteCarloSimulator(SimulatorConfig config, uint32_t seed)
    : config_(config), selector_(config.explorationConstant), rng_(seed) {}

void MonteCarloSimulator::simulate(GameTree& tree) {
    for (int i = 0; i < config_.iterations; ++i) {
        Node& leaf = select(tree.current());
        Node& expanded = expand(tree, leaf);
        std::optional<Side> winner = playout(expanded.boardState());
        backpropagate(expanded, winner);
    }
}

std::optional<Move> MonteCarloSimulator::bestMove(const Node& node) {
    const Node* best = nullptr;
    for (const auto& child : node.children()) {
        if (best == nullptr || child->visitCount() > best->visitCount()) best = child.get();
    }
    if (best == nullptr) return std::nullopt;
    return best->move();
}

// Descends while every legal move of the node already has a child.
Node& MonteCarloSimulator::select(Node& from) const {
    Node* node = &from;
    while (node->hasChildren()) {
        const Board& board = node->boardState();
        if (node->children().size() < board.legalMoves(board.currentMover()).size()) break;
        node = selector_.selectChild(*node);
    }
    return *node;
}

Node& MonteCarloSimulator::expand(GameTree& tree, Node& leaf) {
    const Board& board = leaf.boardState();
    for (const Move& m : board.legalMoves(board.currentMover())) {
        if (leaf.findChild(m) != nullptr) continue;

        Board next = board;
        next.applyMove(m);
        next.advanceTurn();
        return tree.addChild(leaf, next, m);
    }
    return leaf; // terminal position
}

std::optional<Side> MonteCarloSimulator::playout(const Board& start) {
    Board board = start;
    for (int ply = 0; config_.playoutPlyCap <= 0 || ply < config_.playoutPlyCap; ++ply) {
        const Side mover = board.currentMover();
        const Outcome outcome = board.outcome();
        if (outcome == Outcome::CHECKMATE) return opposite(mover);
        if (outcome != Outcome::ONGOING) return std::nullopt;

        std::vector<Move> legal = board.legalMoves(mover);
        std::uniform_int_distribution<std::size_t> dist(0, legal.size() - 1);
        board.applyMove(legal[dist(rng_)]);
        board.advanceTurn();
    }
    return std::nullopt;
}

void MonteCarloSimulator::backpropagate(Node& leaf, std::optional<Side> winner) {
    for (Node* node = &leaf; node != nullptr; node = node->parent()) {
        node->incrementVisitCount();
        // The side that moved into this node is the one not on move in it.
        const Side movedBy = opposite(node->boardState().currentMover());
        if (!winner) node->addWinScore(0.5);
        else if (*winner == movedBy) node->addWinScore(1.0);
    }
}

} // namespace chessarena
