#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "board.hpp"
#include "game_tree.hpp"
#include "uct_selector.hpp"

using namespace chessarena;

namespace {

void visit(Node& node, int visits, double score) {
    for (int i = 0; i < visits; ++i) node.incrementVisitCount();
    node.addWinScore(score);
}

class UctSelectorTest : public ::testing::Test {
protected:
    Node& child(const char* uci) {
        return tree.addChild(tree.root(), board, *Move::fromUci(uci));
    }

    Board board;
    GameTree tree{board};
    UctSelector selector;
};

} // namespace

TEST_F(UctSelectorTest, NoChildrenSelectsNothing) {
    EXPECT_EQ(selector.selectChild(tree.root()), nullptr);
}

TEST_F(UctSelectorTest, UnvisitedChildScoresInfinity) {
    Node& c = child("e2e4");
    EXPECT_EQ(selector.score(c, 10), std::numeric_limits<double>::infinity());
}

TEST_F(UctSelectorTest, ScoreCombinesMeanAndExploration) {
    Node& c = child("e2e4");
    visit(c, 4, 2.0);

    const double expected = 0.5 + std::sqrt(2.0) * std::sqrt(std::log(16.0) / 4.0);
    EXPECT_NEAR(selector.score(c, 16), expected, 1e-12);
}

TEST_F(UctSelectorTest, UnvisitedChildBeatsStrongVisitedSibling) {
    Node& strong = child("e2e4");
    Node& fresh = child("d2d4");
    visit(strong, 50, 50.0);
    visit(tree.root(), 50, 0.0);

    EXPECT_EQ(selector.selectChild(tree.root()), &fresh);
}

TEST_F(UctSelectorTest, FirstUnvisitedChildWins) {
    Node& visited = child("e2e4");
    Node& firstFresh = child("d2d4");
    child("c2c4");
    visit(visited, 1, 1.0);
    visit(tree.root(), 1, 0.0);

    EXPECT_EQ(selector.selectChild(tree.root()), &firstFresh);
}

TEST_F(UctSelectorTest, TiesGoToFirstChild) {
    Node& first = child("e2e4");
    Node& second = child("d2d4");
    visit(first, 3, 1.5);
    visit(second, 3, 1.5);
    visit(tree.root(), 6, 0.0);

    EXPECT_EQ(selector.selectChild(tree.root()), &first);
}

TEST_F(UctSelectorTest, ExploitsBetterMeanWithoutExploration) {
    Node& weak = child("e2e4");
    Node& good = child("d2d4");
    visit(weak, 10, 2.0);
    visit(good, 10, 8.0);
    visit(tree.root(), 20, 0.0);

    selector.setExplorationConstant(0.0);
    EXPECT_EQ(selector.selectChild(tree.root()), &good);
}

TEST_F(UctSelectorTest, LargeExplorationFavoursLessVisitedChild) {
    Node& wellKnown = child("e2e4");
    Node& rarelyTried = child("d2d4");
    visit(wellKnown, 90, 60.0);
    visit(rarelyTried, 10, 5.0);
    visit(tree.root(), 100, 0.0);

    selector.setExplorationConstant(10.0);
    EXPECT_EQ(selector.selectChild(tree.root()), &rarelyTried);
}
