// uct_selector.hpp
#pragma once

#include "node.hpp"

namespace chessarena {

/**
 * @brief Picks the child with the highest Upper Confidence bound applied to Trees.
 *
 *   uct = winScore / visits + c * sqrt(ln(parentVisits) / visits)
 *
 * An unvisited child scores +infinity, so every child is tried once before any
 * is exploited. Ties go to the first child in iteration order.
 */
class UctSelector {
public:
    static constexpr double DEFAULT_EXPLORATION = 1.4142135623730951; // sqrt(2)

    explicit UctSelector(double explorationConstant = DEFAULT_EXPLORATION);

    double explorationConstant() const { return explorationConstant_; }
    void setExplorationConstant(double c) { explorationConstant_ = c; }

    double score(const Node& child, int parentVisits) const;

    // nullptr when `parent` has no children.
    Node* selectChild(const Node& parent) const;

private:
    double explorationConstant_;
};

} // namespace chessarena
