#include <gtest/gtest.h>

#include <algorithm>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "board.hpp"
#include "random_playout_strategy.hpp"

using namespace chessarena;

namespace {

// White king a1 boxed in by the rook on b8: a1a2 is the only move.
const char* ONE_MOVE_FEN = "1r5k/8/8/8/8/8/8/K7 w - - 0 1";

Board foolsMate() {
    Board board;
    for (const char* uci : {"f2f3", "e7e5", "g2g4", "d8h4"}) {
        board.applyMove(*Move::fromUci(uci));
        board.advanceTurn();
    }
    return board;
}

} // namespace

TEST(RandomPlayoutStrategyTest, OnlyLegalMoveIsAlwaysChosen) {
    Board board;
    board.loadFen(ONE_MOVE_FEN);
    ASSERT_EQ(board.legalMoves(Side::WHITE).size(), 1u);

    for (uint32_t seed = 0; seed < 10; ++seed) {
        RandomPlayoutStrategy strategy(seed);
        std::optional<Move> m = strategy.proposeMove(board);
        ASSERT_TRUE(m.has_value());
        EXPECT_EQ(m->toUci(), "a1a2");
    }
}

TEST(RandomPlayoutStrategyTest, NoLegalMoveProposesNothing) {
    RandomPlayoutStrategy strategy(3);
    EXPECT_FALSE(strategy.proposeMove(foolsMate()).has_value());

    Board stalemate;
    stalemate.loadFen("7k/5Q2/6K1/8/8/8/8/8 b - - 0 1");
    EXPECT_FALSE(strategy.proposeMove(stalemate).has_value());
    EXPECT_TRUE(strategy.moveStatistics().empty());
}

TEST(RandomPlayoutStrategyTest, ProposalIsLegalForMover) {
    Board board;
    RandomPlayoutStrategy strategy(11);
    std::vector<Move> legal = board.legalMoves(Side::WHITE);

    for (int i = 0; i < 20; ++i) {
        std::optional<Move> m = strategy.proposeMove(board);
        ASSERT_TRUE(m.has_value());
        EXPECT_NE(std::find(legal.begin(), legal.end(), *m), legal.end()) << m->toUci();
    }
}

TEST(RandomPlayoutStrategyTest, SameSeedSameMoves) {
    Board board;
    RandomPlayoutStrategy a(42);
    RandomPlayoutStrategy b(42);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(a.proposeMove(board), b.proposeMove(board));
    }
}

TEST(RandomPlayoutStrategyTest, ProposalRegistersMoveAtZero) {
    Board board;
    board.loadFen(ONE_MOVE_FEN);
    RandomPlayoutStrategy strategy(1);

    EXPECT_FALSE(strategy.moveStatistic("a1a2").has_value());
    ASSERT_TRUE(strategy.proposeMove(board).has_value());
    ASSERT_TRUE(strategy.moveStatistic("a1a2").has_value());
    EXPECT_EQ(*strategy.moveStatistic("a1a2"), 0);
    EXPECT_EQ(strategy.proposedThisGame().size(), 1u);
}

TEST(RandomPlayoutStrategyTest, ProposalNeverResetsCounter) {
    Board board;
    board.loadFen(ONE_MOVE_FEN);
    RandomPlayoutStrategy strategy(1);

    ASSERT_TRUE(strategy.proposeMove(board).has_value());
    strategy.updateMoveStatistics("a1a2", true);
    strategy.updateMoveStatistics("a1a2", true);
    ASSERT_TRUE(strategy.proposeMove(board).has_value());
    EXPECT_EQ(strategy.moveStatistic("a1a2"), 2);
}

TEST(RandomPlayoutStrategyTest, UpdateIncrementsOnlyOnSuccess) {
    RandomPlayoutStrategy strategy(1);
    int last = 0;
    const bool outcomes[] = {true, false, true, false, false, true};
    for (bool success : outcomes) {
        strategy.updateMoveStatistics(Move(1, 4, 3, 4), success);
        int now = *strategy.moveStatistic("e2e4");
        EXPECT_GE(now, last);
        last = now;
    }
    EXPECT_EQ(last, 3);

    strategy.updateMoveStatistics("d2d4", false);
    EXPECT_EQ(strategy.moveStatistic("d2d4"), 0);
    EXPECT_FALSE(strategy.moveStatistic("c2c4").has_value());
}

TEST(RandomPlayoutStrategyTest, RecordOutcomeIsCaseInsensitive) {
    RandomPlayoutStrategy strategy(1);
    strategy.recordOutcome("WIN");
    strategy.recordOutcome("Loss");
    strategy.recordOutcome("draw");
    strategy.recordOutcome("abandoned");

    const OutcomeTally& tally = strategy.tally();
    EXPECT_EQ(tally.games, 4);
    EXPECT_EQ(tally.wins, 1);
    EXPECT_EQ(tally.losses, 1);
    EXPECT_EQ(tally.draws, 1);
}

TEST(RandomPlayoutStrategyTest, PrepareForgetsLastGameButKeepsStatistics) {
    Board board;
    RandomPlayoutStrategy strategy(5);
    ASSERT_TRUE(strategy.proposeMove(board).has_value());
    strategy.recordOutcome("win");

    strategy.prepare();
    EXPECT_TRUE(strategy.proposedThisGame().empty());
    EXPECT_EQ(strategy.moveStatistics().size(), 1u);
    EXPECT_EQ(strategy.tally().wins, 1);
}

TEST(RandomPlayoutStrategyTest, PrintsStatistics) {
    RandomPlayoutStrategy strategy(1);
    strategy.recordOutcome("win");
    strategy.updateMoveStatistics("e2e4", true);

    std::ostringstream os;
    strategy.printStatistics(os);
    EXPECT_NE(os.str().find("Games Played: 1"), std::string::npos);
    EXPECT_NE(os.str().find("Wins: 1"), std::string::npos);
    EXPECT_NE(os.str().find("e2e4=1"), std::string::npos);
}

TEST(RandomPlayoutStrategyTest, QuietStrategyPrintsNothing) {
    RandomPlayoutStrategy strategy(3, false);
    std::ostringstream captured;
    std::streambuf* previous = std::cout.rdbuf(captured.rdbuf());

    std::optional<Move> m = strategy.proposeMove(foolsMate());
    strategy.recordOutcome("loss");

    std::cout.rdbuf(previous);
    EXPECT_FALSE(m.has_value());
    EXPECT_EQ(strategy.tally().losses, 1);
    EXPECT_EQ(captured.str(), "");
}

TEST(RandomPlayoutStrategyTest, ProposalsRememberTheSideToMove) {
    RandomPlayoutStrategy strategy(8, false);
    Board board;
    std::optional<Move> first = strategy.proposeMove(board);
    ASSERT_TRUE(first.has_value());
    board.applyMove(*first);
    board.advanceTurn();
    ASSERT_TRUE(strategy.proposeMove(board).has_value());

    ASSERT_EQ(strategy.proposedThisGame().size(), 2u);
    EXPECT_EQ(strategy.proposedThisGame()[0].side, Side::WHITE);
    EXPECT_EQ(strategy.proposedThisGame()[0].move, *first);
    EXPECT_EQ(strategy.proposedThisGame()[1].side, Side::BLACK);
    EXPECT_EQ(strategy.movesProposedFor(Side::WHITE).size(), 1u);
}
