#include "game_tree.hpp"

namespace chessarena {

GameTree::GameTree(const Board& initialBoard)
    : root_(std::make_unique<Node>(initialBoard, nullptr, std::nullopt)),
      current_(root_.get()) {}

Node& GameTree::addChild(Node& parent, const Board& newBoard, const Move& move) {
    Node& child = parent.addChild(std::make_unique<Node>(newBoard, &parent, move));
    ++nodeCount_;
    return child;
}

void GameTree::moveToChild(const Move& move) {
    Node* child = current_->findChild(move);
    if (child == nullptr) {
        throw UnreachableMoveError(move);
    }
    current_ = child;
}

} // namespace chessarena
