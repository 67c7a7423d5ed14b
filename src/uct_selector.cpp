#include "uct_selector.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace chessarena {

UctSelector::UctSelector(double explorationConstant)
    : explorationConstant_(explorationConstant) {}

double UctSelector::score(const Node& child, int parentVisits) const {
    if (child.visitCount() == 0) {
        return std::numeric_limits<double>::infinity();
    }
    const double visits = static_cast<double>(child.visitCount());
    const double exploitation = child.winScore() / visits;
    // A parent is visited at least as often as any child; clamp keeps ln() finite.
    const double logParent = std::log(static_cast<double>(std::max(parentVisits, 1)));
    return exploitation + explorationConstant_ * std::sqrt(logParent / visits);
}

Node* UctSelector::selectChild(const Node& parent) const {
    Node* best = nullptr;
    double bestScore = -std::numeric_limits<double>::infinity();

    for (const auto& child : parent.children()) {
        double s = score(*child, parent.visitCount());
        if (best == nullptr || s > bestScore) {
            best = child.get();
            bestScore = s;
        }
    }
    return best;
}

} // namespace chessarena
