// node.hpp
#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "board.hpp"
#include "move.hpp"

namespace chessarena {

/**
 * @brief One board position reached while exploring a game tree.
 *
 * A node owns its board snapshot and its children. The parent link is a
 * non-owning back reference; the root has neither parent nor move.
 */
class Node {
public:
    Node(const Board& boardState, Node* parent, std::optional<Move> move);

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    const Board& boardState() const { return boardState_; }
    const std::optional<Move>& move() const { return move_; }
    Node* parent() const { return parent_; }
    bool isRoot() const { return parent_ == nullptr; }

    const std::vector<std::unique_ptr<Node>>& children() const { return children_; }
    bool hasChildren() const { return !children_.empty(); }

    // Child reached by `move`, or nullptr.
    Node* findChild(const Move& move) const;

    // Takes ownership of `child`, whose parent must be this node.
    Node& addChild(std::unique_ptr<Node> child);

    int visitCount() const { return visitCount_; }
    double winScore() const { return winScore_; }
    void incrementVisitCount() { ++visitCount_; }
    void addWinScore(double score) { winScore_ += score; }

private:
    Board boardState_;
    Node* parent_;
    std::optional<Move> move_;
    std::vector<std::unique_ptr<Node>> children_;
    int visitCount_ = 0;
    double winScore_ = 0.0;
};

} // namespace chessarena
