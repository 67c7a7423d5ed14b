// game_tree.hpp
#pragma once

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>

#include "board.hpp"
#include "move.hpp"
#include "node.hpp"

namespace chessarena {

// Raised when moveToChild() is asked for a move the current node was never expanded with.
class UnreachableMoveError : public std::invalid_argument {
public:
    explicit UnreachableMoveError(const Move& move)
        : std::invalid_argument("Move not found among children: " + move.toUci()), move_(move) {}

    const Move& move() const { return move_; }

private:
    Move move_;
};

/**
 * @brief Tree of board states rooted at the starting position.
 *
 * Owns every node. `current` is a cursor into the tree used to follow the
 * line actually being played; it only ever points at a node reachable from
 * the root.
 */
class GameTree {
public:
    explicit GameTree(const Board& initialBoard);

    Node& root() { return *root_; }
    const Node& root() const { return *root_; }
    Node& current() { return *current_; }
    const Node& current() const { return *current_; }

    // Links a new position under `parent`. The move is not checked for legality.
    Node& addChild(Node& parent, const Board& newBoard, const Move& move);

    // Advances `current` to the child reached by `move`.
    // @throws UnreachableMoveError if no such child exists.
    void moveToChild(const Move& move);

    void resetToRoot() { current_ = root_.get(); }

    std::size_t nodeCount() const { return nodeCount_; }

private:
    std::unique_ptr<Node> root_;
    Node* current_;
    std::size_t nodeCount_ = 1;
};

} // namespace chessarena
