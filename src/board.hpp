// board.hpp
#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "move.hpp"

namespace chessarena {

// ───────────────────────── Basic Types ─────────────────────────
using Bitboard = uint64_t;

enum class Side { WHITE, BLACK };

inline Side opposite(Side s) { return s == Side::WHITE ? Side::BLACK : Side::WHITE; }
std::string sideToString(Side s);

// ───────────────────────── Piece codes ──────────────────────────
// Values returned by Board::pieceAt. Positive = White, negative = Black.
constexpr int EMPTY  = 0;
constexpr int PAWN   = 1;
constexpr int ROOK   = 2;
constexpr int KNIGHT = 3;
constexpr int BISHOP = 4;
constexpr int QUEEN  = 5;
constexpr int KING   = 6;

// Internal piece index used by the bitboards
enum Piece {
    W_PAWN, W_KNIGHT, W_BISHOP, W_ROOK, W_QUEEN, W_KING,
    B_PAWN, B_KNIGHT, B_BISHOP, B_ROOK, B_QUEEN, B_KING,
    NO_PIECE
};

// ───────────────────────── Game Outcome ────────────────────────────
enum class Outcome {
    ONGOING,
    CHECKMATE,
    STALEMATE,
    DRAW_FIFTY_MOVE,
    DRAW_THREEFOLD_REPETITION
};

std::string outcomeToString(Outcome o);

// ───────────────────────── Board ────────────────────────────────
/**
 * @brief Chess position with legal move generation and check detection.
 *
 * Moving a piece and passing the turn are separate steps: applyMove() relocates
 * pieces (castling, en passant and promotion are inferred from the coordinates),
 * advanceTurn() hands the move to the other side.
 */
class Board {
public:
    Board();

    void resetToInitial();

    // Replaces the position with a FEN record. Move counters default to 0 and 1.
    // @throws std::invalid_argument for a malformed placement or side-to-move field.
    void loadFen(const std::string& fen);

    int pieceAt(int rank, int file) const;
    bool applyMove(int fromRank, int fromFile, int toRank, int toFile, char promotion = 0);
    bool applyMove(const Move& m);
    void advanceTurn();
    Side currentMover() const { return whiteToMove ? Side::WHITE : Side::BLACK; }

    std::vector<Move> legalMoves(Side side) const;
    bool isInCheck(Side side) const;
    bool isCheckmate(Side side) const;
    bool isStalemate(Side side) const;
    Outcome outcome() const;

    std::string toCoordinateLabel(int rank, int file) const;

    // Piece placement only; two boards with the same pieces on the same squares
    // produce the same snapshot regardless of whose turn it is.
    std::string snapshot() const;

    // Diagram for the console; highlighted squares (0..63, or -1) are marked with "<".
    std::string pretty(int highlightFrom = -1, int highlightTo = -1) const;

    uint64_t hash() const { return currentHash; }
    uint64_t perft(int depth) const;

private:
    using EncodedMove = uint32_t;

    void updateOccupancies();
    void syncMailboxFromBitboards();
    void computeAndSetHash();

    void generateMoves(bool is_white, std::vector<EncodedMove>& moves) const;
    void add_pawn_moves(bool is_white, int from_sq, std::vector<EncodedMove>& moves, Bitboard target_mask) const;
    void add_knight_moves(bool is_white, int from_sq, std::vector<EncodedMove>& moves, Bitboard target_mask) const;
    void add_sliding_moves(bool is_white, int from_sq, bool is_bishop, bool is_rook, std::vector<EncodedMove>& moves, Bitboard target_mask) const;
    void add_king_moves(bool is_white, int from_sq, std::vector<EncodedMove>& moves) const;

    bool isSquareAttacked(int sq, bool by_white) const;
    bool isSquareAttacked(int sq, bool by_white, Bitboard blockers) const;
    Bitboard get_attackers(int sq, bool by_white) const;
    void applyEncoded(EncodedMove m);

    std::array<Bitboard, 12> bb{};
    std::array<Piece, 64> mailbox{};
    Bitboard occWhite = 0, occBlack = 0, occ = 0;
    uint8_t castlingRights = 0;
    static constexpr uint8_t WK_CASTLE_MASK = 0b0001;
    static constexpr uint8_t WQ_CASTLE_MASK = 0b0010;
    static constexpr uint8_t BK_CASTLE_MASK = 0b0100;
    static constexpr uint8_t BQ_CASTLE_MASK = 0b1000;
    int epSquare = -1;
    bool whiteToMove = true;
    int halfmoveClock = 0;
    int fullmoveNumber = 1;
    uint64_t currentHash = 0;
    std::vector<uint64_t> hashHistory;
};

} // namespace chessarena
