#include "node.hpp"

#include <stdexcept>
#include <utility>

namespace chessarena {

Node::Node(const Board& boardState, Node* parent, std::optional<Move> move)
    : boardState_(boardState), parent_(parent), move_(std::move(move)) {
    if ((parent_ == nullptr) != !move_.has_value()) {
        throw std::invalid_argument("Only the root node may lack a parent and a move");
    }
}

Node* Node::findChild(const Move& move) const {
    for (const auto& child : children_) {
        if (child->move() && *child->move() == move) return child.get();
    }
    return nullptr;
}

Node& Node::addChild(std::unique_ptr<Node> child) {
    if (!child || child->parent() != this) {
        throw std::invalid_argument("Child node must be linked to this parent");
    }
    if (findChild(*child->move()) != nullptr) {
        throw std::invalid_argument("Duplicate child move: " + child->move()->toUci());
    }
    children_.push_back(std::move(child));
    return *children_.back();
}

} // namespace chessarena
