#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

#include "board.hpp"

using namespace chessarena;

namespace {

void play(Board& board, const std::vector<std::string>& moves) {
    for (const std::string& uci : moves) {
        ASSERT_TRUE(board.applyMove(*Move::fromUci(uci))) << uci;
        board.advanceTurn();
    }
}

bool contains(const std::vector<Move>& moves, const std::string& uci) {
    return std::find(moves.begin(), moves.end(), *Move::fromUci(uci)) != moves.end();
}

} // namespace

TEST(BoardTest, StartsInInitialPosition) {
    Board board;
    EXPECT_EQ(board.pieceAt(0, 4), KING);
    EXPECT_EQ(board.pieceAt(0, 0), ROOK);
    EXPECT_EQ(board.pieceAt(0, 1), KNIGHT);
    EXPECT_EQ(board.pieceAt(1, 3), PAWN);
    EXPECT_EQ(board.pieceAt(7, 3), -QUEEN);
    EXPECT_EQ(board.pieceAt(6, 7), -PAWN);
    EXPECT_EQ(board.pieceAt(3, 3), EMPTY);
    EXPECT_EQ(board.currentMover(), Side::WHITE);
    EXPECT_EQ(board.outcome(), Outcome::ONGOING);
}

TEST(BoardTest, SnapshotListsPlacementFromEighthRank) {
    Board board;
    EXPECT_EQ(board.snapshot(),
              "rnbqkbnr/pppppppp/......../......../......../......../PPPPPPPP/RNBQKBNR");
}

TEST(BoardTest, PerftFromStartPosition) {
    Board board;
    EXPECT_EQ(board.perft(1), 20u);
    EXPECT_EQ(board.perft(2), 400u);
    EXPECT_EQ(board.perft(3), 8902u);
}

TEST(BoardTest, PerftKiwipeteDepthOne) {
    Board board;
    board.loadFen("r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1");
    EXPECT_EQ(board.perft(1), 48u);
}

TEST(BoardTest, ApplyMoveDoesNotPassTheTurn) {
    Board board;
    ASSERT_TRUE(board.applyMove(1, 4, 3, 4));
    EXPECT_EQ(board.pieceAt(3, 4), PAWN);
    EXPECT_EQ(board.pieceAt(1, 4), EMPTY);
    EXPECT_EQ(board.currentMover(), Side::WHITE);

    board.advanceTurn();
    EXPECT_EQ(board.currentMover(), Side::BLACK);
}

TEST(BoardTest, ApplyMoveFromEmptySquareChangesNothing) {
    Board board;
    const std::string before = board.snapshot();
    EXPECT_FALSE(board.applyMove(3, 3, 4, 3));
    EXPECT_EQ(board.snapshot(), before);
}

TEST(BoardTest, SnapshotIgnoresSideToMove) {
    Board board;
    const std::string before = board.snapshot();
    board.advanceTurn();
    EXPECT_EQ(board.snapshot(), before);
}

TEST(BoardTest, CoordinateLabels) {
    Board board;
    EXPECT_EQ(board.toCoordinateLabel(0, 0), "a1");
    EXPECT_EQ(board.toCoordinateLabel(3, 4), "e4");
    EXPECT_EQ(board.toCoordinateLabel(7, 7), "h8");
    EXPECT_EQ(board.toCoordinateLabel(8, 0), "??");
}

TEST(BoardTest, KingTwoFilesCastles) {
    Board board;
    board.loadFen("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");

    std::vector<Move> legal = board.legalMoves(Side::WHITE);
    EXPECT_TRUE(contains(legal, "e1g1"));
    EXPECT_TRUE(contains(legal, "e1c1"));

    ASSERT_TRUE(board.applyMove(0, 4, 0, 6));
    EXPECT_EQ(board.pieceAt(0, 6), KING);
    EXPECT_EQ(board.pieceAt(0, 5), ROOK);
    EXPECT_EQ(board.pieceAt(0, 7), EMPTY);
    EXPECT_EQ(board.pieceAt(0, 4), EMPTY);
}

TEST(BoardTest, QueenSideCastleForBlack) {
    Board board;
    board.loadFen("r3k2r/8/8/8/8/8/8/R3K2R b KQkq - 0 1");
    ASSERT_TRUE(board.applyMove(7, 4, 7, 2));
    EXPECT_EQ(board.pieceAt(7, 2), -KING);
    EXPECT_EQ(board.pieceAt(7, 3), -ROOK);
    EXPECT_EQ(board.pieceAt(7, 0), EMPTY);
}

TEST(BoardTest, CannotCastleThroughAttackedSquare) {
    Board board;
    board.loadFen("4kr2/8/8/8/8/8/8/4K2R w K - 0 1");
    EXPECT_FALSE(contains(board.legalMoves(Side::WHITE), "e1g1"));
}

TEST(BoardTest, EnPassantCapture) {
    Board board;
    play(board, {"e2e4", "a7a6", "e4e5", "d7d5"});

    std::vector<Move> legal = board.legalMoves(Side::WHITE);
    ASSERT_TRUE(contains(legal, "e5d6"));

    ASSERT_TRUE(board.applyMove(*Move::fromUci("e5d6")));
    EXPECT_EQ(board.pieceAt(5, 3), PAWN);
    EXPECT_EQ(board.pieceAt(4, 3), EMPTY);
    EXPECT_EQ(board.pieceAt(4, 4), EMPTY);
}

TEST(BoardTest, PromotionDefaultsToQueen) {
    Board board;
    board.loadFen("8/P7/8/8/8/8/8/k6K w - - 0 1");

    std::vector<Move> legal = board.legalMoves(Side::WHITE);
    EXPECT_TRUE(contains(legal, "a7a8q"));
    EXPECT_TRUE(contains(legal, "a7a8n"));
    EXPECT_FALSE(contains(legal, "a7a8"));

    Board queen = board;
    ASSERT_TRUE(queen.applyMove(6, 0, 7, 0));
    EXPECT_EQ(queen.pieceAt(7, 0), QUEEN);

    ASSERT_TRUE(board.applyMove(6, 0, 7, 0, 'n'));
    EXPECT_EQ(board.pieceAt(7, 0), KNIGHT);
}

TEST(BoardTest, FoolsMateIsCheckmate) {
    Board board;
    play(board, {"f2f3", "e7e5", "g2g4", "d8h4"});

    EXPECT_EQ(board.currentMover(), Side::WHITE);
    EXPECT_TRUE(board.isInCheck(Side::WHITE));
    EXPECT_TRUE(board.isCheckmate(Side::WHITE));
    EXPECT_FALSE(board.isCheckmate(Side::BLACK));
    EXPECT_TRUE(board.legalMoves(Side::WHITE).empty());
    EXPECT_EQ(board.outcome(), Outcome::CHECKMATE);
}

TEST(BoardTest, Stalemate) {
    Board board;
    board.loadFen("7k/5Q2/6K1/8/8/8/8/8 b - - 0 1");
    EXPECT_FALSE(board.isInCheck(Side::BLACK));
    EXPECT_TRUE(board.isStalemate(Side::BLACK));
    EXPECT_FALSE(board.isCheckmate(Side::BLACK));
    EXPECT_EQ(board.outcome(), Outcome::STALEMATE);
}

TEST(BoardTest, ThreefoldRepetition) {
    Board board;
    play(board, {"g1f3", "g8f6", "f3g1", "f6g8"});
    EXPECT_EQ(board.outcome(), Outcome::ONGOING);
    play(board, {"g1f3", "g8f6", "f3g1", "f6g8"});
    EXPECT_EQ(board.outcome(), Outcome::DRAW_THREEFOLD_REPETITION);
}

TEST(BoardTest, ResetRestoresStartPosition) {
    Board board;
    const std::string initial = board.snapshot();
    const uint64_t initialHash = board.hash();
    play(board, {"e2e4", "e7e5"});
    ASSERT_NE(board.snapshot(), initial);

    board.resetToInitial();
    EXPECT_EQ(board.snapshot(), initial);
    EXPECT_EQ(board.hash(), initialHash);
    EXPECT_EQ(board.currentMover(), Side::WHITE);
}

TEST(BoardTest, PrettyMarksHighlightedSquares) {
    Board board;
    ASSERT_TRUE(board.applyMove(1, 4, 3, 4));
    const std::string diagram = board.pretty(12, 28);
    EXPECT_NE(diagram.find("P<"), std::string::npos);
    EXPECT_NE(diagram.find("*<"), std::string::npos);
    EXPECT_NE(diagram.find("a b c d e f g h"), std::string::npos);
}

TEST(BoardTest, LoadFenRejectsMalformedInput) {
    Board board;
    EXPECT_THROW(board.loadFen("8/8/8 w - - 0 1"), std::invalid_argument);
    EXPECT_THROW(board.loadFen("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR x KQkq - 0 1"),
                 std::invalid_argument);
    EXPECT_THROW(board.loadFen("rnbqkbnr/ppppXppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1"),
                 std::invalid_argument);
}
