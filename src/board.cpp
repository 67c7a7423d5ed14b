#include "board.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// Helpers for bit counting and bit scanning
#if defined(__GNUC__) || defined(__clang__)
inline int popcount(uint64_t bb) { return __builtin_popcountll(bb); }
inline int lsb_idx(uint64_t bb) { return bb ? __builtin_ctzll(bb) : -1; }
#else
inline int popcount(uint64_t bb) {
    int count = 0;
    while (bb > 0) {
        bb &= (bb - 1);
        count++;
    }
    return count;
}
inline int lsb_idx(uint64_t bb) {
    if (bb == 0) return -1;
    int count = 0;
    while (!((bb >> count) & 1)) count++;
    return count;
}
#endif

namespace chessarena {

// ───────────────────────── Board helpers (Square 0=a1, 63=h8) ──────
namespace {

inline int file_of(int sq) { return sq & 7; }
inline int rank_of(int sq) { return sq >> 3; }
inline int square(int r, int f) { return r * 8 + f; }
inline bool on_board_rf(int r, int f) { return r >= 0 && r < 8 && f >= 0 && f < 8; }
inline bool on_board(int sq) { return sq >= 0 && sq < 64; }
inline bool is_white_piece(Piece p) { return p >= W_PAWN && p <= W_KING; }

constexpr Bitboard RANK_1 = 0xFFULL;
constexpr Bitboard RANK_2 = RANK_1 << (8 * 1);
constexpr Bitboard RANK_7 = RANK_1 << (8 * 6);
constexpr Bitboard RANK_8 = RANK_1 << (8 * 7);

const std::array<char, 13> PIECE_CHAR_REPR = {
    'P', 'N', 'B', 'R', 'Q', 'K',
    'p', 'n', 'b', 'r', 'q', 'k', ' '
};

// Piece index -> signed code of the Board capability
const std::array<int, 13> PIECE_CODE = {
     PAWN,  KNIGHT,  BISHOP,  ROOK,  QUEEN,  KING,
    -PAWN, -KNIGHT, -BISHOP, -ROOK, -QUEEN, -KING, EMPTY
};

// ───────────────────────── Attack Generation ─────────────────────────
namespace attacks {
    std::array<Bitboard, 64> knight_attacks_table;
    std::array<Bitboard, 64> king_attacks_table;
    std::array<std::array<Bitboard, 64>, 2> pawn_attacks_table; // [color][square]
    std::array<Bitboard, 64> ray_n, ray_s, ray_e, ray_w;
    std::array<Bitboard, 64> ray_ne, ray_nw, ray_se, ray_sw;
    std::array<std::array<Bitboard, 64>, 64> line_between_bb;

    inline Bitboard get_ray_between(int sq1, int sq2) {
        return line_between_bb[sq1][sq2] & (~((1ULL << sq1) | (1ULL << sq2)));
    }

    inline Bitboard get_line_through(int sq1, int sq2) {
        return line_between_bb[sq1][sq2];
    }

    void init() {
        const int knight_dr[] = {2, 2, 1, 1, -1, -1, -2, -2};
        const int knight_df[] = {1, -1, 2, -2, 2, -2, 1, -1};
        const int king_dr[] = {1, 1, 1, 0, 0, -1, -1, -1};
        const int king_df[] = {1, 0, -1, 1, -1, 1, 0, -1};

        for (int sq = 0; sq < 64; ++sq) {
            knight_attacks_table[sq] = 0ULL;
            king_attacks_table[sq] = 0ULL;
            pawn_attacks_table[0][sq] = 0ULL;
            pawn_attacks_table[1][sq] = 0ULL;
            ray_n[sq] = ray_s[sq] = ray_e[sq] = ray_w[sq] = 0ULL;
            ray_ne[sq] = ray_nw[sq] = ray_se[sq] = ray_sw[sq] = 0ULL;

            int r = rank_of(sq);
            int f = file_of(sq);

            for (int i = 0; i < 8; ++i) {
                if (on_board_rf(r + knight_dr[i], f + knight_df[i]))
                    knight_attacks_table[sq] |= (1ULL << square(r + knight_dr[i], f + knight_df[i]));
                if (on_board_rf(r + king_dr[i], f + king_df[i]))
                    king_attacks_table[sq] |= (1ULL << square(r + king_dr[i], f + king_df[i]));
            }

            if (on_board_rf(r + 1, f - 1)) pawn_attacks_table[0][sq] |= (1ULL << square(r + 1, f - 1));
            if (on_board_rf(r + 1, f + 1)) pawn_attacks_table[0][sq] |= (1ULL << square(r + 1, f + 1));
            if (on_board_rf(r - 1, f - 1)) pawn_attacks_table[1][sq] |= (1ULL << square(r - 1, f - 1));
            if (on_board_rf(r - 1, f + 1)) pawn_attacks_table[1][sq] |= (1ULL << square(r - 1, f + 1));

            for (int i = 1; r + i < 8; ++i) ray_n[sq] |= (1ULL << square(r + i, f));
            for (int i = 1; r - i >= 0; ++i) ray_s[sq] |= (1ULL << square(r - i, f));
            for (int i = 1; f + i < 8; ++i) ray_e[sq] |= (1ULL << square(r, f + i));
            for (int i = 1; f - i >= 0; ++i) ray_w[sq] |= (1ULL << square(r, f - i));
            for (int i = 1; r + i < 8 && f + i < 8; ++i) ray_ne[sq] |= (1ULL << square(r + i, f + i));
            for (int i = 1; r + i < 8 && f - i >= 0; ++i) ray_nw[sq] |= (1ULL << square(r + i, f - i));
            for (int i = 1; r - i >= 0 && f + i < 8; ++i) ray_se[sq] |= (1ULL << square(r - i, f + i));
            for (int i = 1; r - i >= 0 && f - i >= 0; ++i) ray_sw[sq] |= (1ULL << square(r - i, f - i));
        }

        for (int sq1 = 0; sq1 < 64; ++sq1) {
            for (int sq2 = 0; sq2 < 64; ++sq2) {
                line_between_bb[sq1][sq2] = 0;
                if (sq1 == sq2) continue;
                Bitboard ends = (1ULL << sq1) | (1ULL << sq2);
                if (file_of(sq1) == file_of(sq2)) {
                    line_between_bb[sq1][sq2] = (ray_n[sq1] & ray_s[sq2]) | (ray_s[sq1] & ray_n[sq2]) | ends;
                } else if (rank_of(sq1) == rank_of(sq2)) {
                    line_between_bb[sq1][sq2] = (ray_e[sq1] & ray_w[sq2]) | (ray_w[sq1] & ray_e[sq2]) | ends;
                } else if (std::abs(rank_of(sq1) - rank_of(sq2)) == std::abs(file_of(sq1) - file_of(sq2))) {
                    bool rising = (file_of(sq2) > file_of(sq1)) == (rank_of(sq2) > rank_of(sq1));
                    if (rising) {
                        line_between_bb[sq1][sq2] = (ray_ne[sq1] & ray_sw[sq2]) | (ray_sw[sq1] & ray_ne[sq2]) | ends;
                    } else {
                        line_between_bb[sq1][sq2] = (ray_nw[sq1] & ray_se[sq2]) | (ray_se[sq1] & ray_nw[sq2]) | ends;
                    }
                }
            }
        }
    }

    inline Bitboard get_rook_attacks(int sq, Bitboard blockers) {
        Bitboard result = 0ULL;
        int r, f;
        int r_orig = rank_of(sq);
        int f_orig = file_of(sq);

        for (r = r_orig + 1; r < 8; ++r) { result |= (1ULL << square(r, f_orig)); if (blockers & (1ULL << square(r, f_orig))) break; }
        for (r = r_orig - 1; r >= 0; --r) { result |= (1ULL << square(r, f_orig)); if (blockers & (1ULL << square(r, f_orig))) break; }
        for (f = f_orig + 1; f < 8; ++f) { result |= (1ULL << square(r_orig, f)); if (blockers & (1ULL << square(r_orig, f))) break; }
        for (f = f_orig - 1; f >= 0; --f) { result |= (1ULL << square(r_orig, f)); if (blockers & (1ULL << square(r_orig, f))) break; }
        return result;
    }

    inline Bitboard get_bishop_attacks(int sq, Bitboard blockers) {
        Bitboard result = 0ULL;
        int r, f;
        int r_orig = rank_of(sq);
        int f_orig = file_of(sq);

        for (r = r_orig + 1, f = f_orig + 1; r < 8 && f < 8; ++r, ++f) { result |= (1ULL << square(r, f)); if (blockers & (1ULL << square(r, f))) break; }
        for (r = r_orig + 1, f = f_orig - 1; r < 8 && f >= 0; ++r, --f) { result |= (1ULL << square(r, f)); if (blockers & (1ULL << square(r, f))) break; }
        for (r = r_orig - 1, f = f_orig + 1; r >= 0 && f < 8; --r, ++f) { result |= (1ULL << square(r, f)); if (blockers & (1ULL << square(r, f))) break; }
        for (r = r_orig - 1, f = f_orig - 1; r >= 0 && f >= 0; --r, --f) { result |= (1ULL << square(r, f)); if (blockers & (1ULL << square(r, f))) break; }
        return result;
    }
} // namespace attacks

struct Initializer { Initializer() { attacks::init(); } };

// ───────────────────────── Move encoding ──────────────────
enum PromoPieceType { PROMO_TYPE_NONE, PROMO_TYPE_N, PROMO_TYPE_B, PROMO_TYPE_R, PROMO_TYPE_Q };

constexpr int EP_FLAG  = 1 << 0;
constexpr int DPP_FLAG = 1 << 1;
constexpr int KSC_FLAG = 1 << 2;
constexpr int QSC_FLAG = 1 << 3;

inline uint32_t encodeMove(int f, int t, int promo_val = PROMO_TYPE_NONE, int flags = 0) {
    return f | (t << 6) | (promo_val << 12) | (flags << 16);
}
inline int fromSquare(uint32_t m) { return m & 0x3F; }
inline int toSquare(uint32_t m) { return (m >> 6) & 0x3F; }
inline int promotion(uint32_t m) { return (m >> 12) & 0xF; }
inline int moveFlags(uint32_t m) { return (m >> 16) & 0xF; }

int promoFromLetter(char c) {
    switch (c) {
        case 'n': return PROMO_TYPE_N;
        case 'b': return PROMO_TYPE_B;
        case 'r': return PROMO_TYPE_R;
        default:  return PROMO_TYPE_Q;
    }
}

char letterFromPromo(int promo) {
    switch (promo) {
        case PROMO_TYPE_N: return 'n';
        case PROMO_TYPE_B: return 'b';
        case PROMO_TYPE_R: return 'r';
        case PROMO_TYPE_Q: return 'q';
        default:           return 0;
    }
}

Move toMove(uint32_t m) {
    int from = fromSquare(m);
    int to = toSquare(m);
    return Move(rank_of(from), file_of(from), rank_of(to), file_of(to), letterFromPromo(promotion(m)));
}

// ───────────────────────── Zobrist Hashing ───────────────────
struct ZobristKeys {
    std::array<std::array<uint64_t, 64>, 12> piece_square_keys;
    uint64_t black_to_move_key;
    std::array<uint64_t, 16> castling_keys;
    std::array<uint64_t, 8> ep_file_keys;

    ZobristKeys() {
        std::mt19937_64 rng(0xDEADBEEFCAFEFULL);
        std::uniform_int_distribution<uint64_t> dist(0, std::numeric_limits<uint64_t>::max());
        for (auto& piece_keys : piece_square_keys)
            for (auto& key : piece_keys) key = dist(rng);
        black_to_move_key = dist(rng);
        for (auto& key : castling_keys) key = dist(rng);
        for (auto& key : ep_file_keys) key = dist(rng);
    }
};

const ZobristKeys& getZobristKeys() {
    static ZobristKeys keys_instance;
    return keys_instance;
}

} // namespace

std::string sideToString(Side s) {
    return s == Side::WHITE ? "White" : "Black";
}

std::string outcomeToString(Outcome o) {
    switch (o) {
        case Outcome::ONGOING: return "Ongoing";
        case Outcome::CHECKMATE: return "Checkmate";
        case Outcome::STALEMATE: return "Stalemate";
        case Outcome::DRAW_FIFTY_MOVE: return "Draw (50-move rule)";
        case Outcome::DRAW_THREEFOLD_REPETITION: return "Draw (threefold repetition)";
        default: return "Unknown";
    }
}

// ───────────────────────── Board ────────────────────────────────

Board::Board() {
    static const Initializer tables; // attack tables are built once, on first use
    (void)tables;
    resetToInitial();
}

void Board::resetToInitial() {
    bb.fill(0ULL);
    bb[W_PAWN]   = 0x000000000000FF00ULL;
    bb[W_ROOK]   = 0x0000000000000081ULL;
    bb[W_KNIGHT] = 0x0000000000000042ULL;
    bb[W_BISHOP] = 0x0000000000000024ULL;
    bb[W_QUEEN]  = 0x0000000000000008ULL;
    bb[W_KING]   = 0x0000000000000010ULL;

    bb[B_PAWN]   = 0x00FF000000000000ULL;
    bb[B_ROOK]   = 0x8100000000000000ULL;
    bb[B_KNIGHT] = 0x4200000000000000ULL;
    bb[B_BISHOP] = 0x2400000000000000ULL;
    bb[B_QUEEN]  = 0x0800000000000000ULL;
    bb[B_KING]   = 0x1000000000000000ULL;

    castlingRights = WK_CASTLE_MASK | WQ_CASTLE_MASK | BK_CASTLE_MASK | BQ_CASTLE_MASK;
    whiteToMove = true;
    epSquare = -1;
    halfmoveClock = 0;
    fullmoveNumber = 1;
    updateOccupancies();
    syncMailboxFromBitboards();
    computeAndSetHash();

    hashHistory.clear();
    hashHistory.push_back(currentHash);
}

void Board::loadFen(const std::string& fen) {
    std::istringstream ss(fen);
    std::string boardPart, sideToMove, castling = "-", enpassant = "-";
    int halfmove = 0, fullmove = 1;
    ss >> boardPart >> sideToMove >> castling >> enpassant >> halfmove >> fullmove;
    if (sideToMove != "w" && sideToMove != "b") {
        throw std::invalid_argument("FEN side to move must be 'w' or 'b': " + fen);
    }

    std::array<Bitboard, 12> parsed{};
    int rank = 7, file = 0;
    for (char c : boardPart) {
        if (c == '/') {
            if (file != 8 || rank == 0) throw std::invalid_argument("Malformed FEN placement: " + fen);
            rank--;
            file = 0;
        } else if (c >= '1' && c <= '8') {
            file += c - '0';
        } else {
            const char* symbols = "PNBRQKpnbrqk";
            const char* hit = std::strchr(symbols, c);
            if (hit == nullptr || file > 7) throw std::invalid_argument("Malformed FEN placement: " + fen);
            parsed[hit - symbols] |= 1ULL << square(rank, file);
            file++;
        }
        if (file > 8) throw std::invalid_argument("Malformed FEN placement: " + fen);
    }
    if (rank != 0 || file != 8) throw std::invalid_argument("Malformed FEN placement: " + fen);

    bb = parsed;
    whiteToMove = (sideToMove == "w");

    castlingRights = 0;
    if (castling.find('K') != std::string::npos) castlingRights |= WK_CASTLE_MASK;
    if (castling.find('Q') != std::string::npos) castlingRights |= WQ_CASTLE_MASK;
    if (castling.find('k') != std::string::npos) castlingRights |= BK_CASTLE_MASK;
    if (castling.find('q') != std::string::npos) castlingRights |= BQ_CASTLE_MASK;

    epSquare = -1;
    if (enpassant.size() == 2) {
        int epFile = enpassant[0] - 'a';
        int epRank = enpassant[1] - '1';
        if (on_board_rf(epRank, epFile)) epSquare = square(epRank, epFile);
    }

    halfmoveClock = halfmove;
    fullmoveNumber = fullmove;
    updateOccupancies();
    syncMailboxFromBitboards();
    computeAndSetHash();

    hashHistory.clear();
    hashHistory.push_back(currentHash);
}

void Board::updateOccupancies() {
    occWhite = occBlack = 0;
    for (int i = W_PAWN; i <= W_KING; ++i) occWhite |= bb[i];
    for (int i = B_PAWN; i <= B_KING; ++i) occBlack |= bb[i];
    occ = occWhite | occBlack;
}

void Board::syncMailboxFromBitboards() {
    mailbox.fill(NO_PIECE);
    for (int piece_type = 0; piece_type < 12; ++piece_type) {
        Bitboard b = bb[piece_type];
        while (b) {
            int sq = lsb_idx(b);
            mailbox[sq] = static_cast<Piece>(piece_type);
            b &= b - 1;
        }
    }
}

void Board::computeAndSetHash() {
    const auto& keys = getZobristKeys();
    uint64_t h = 0;
    for (int piece_type = 0; piece_type < 12; ++piece_type) {
        Bitboard current_piece_bb = bb[piece_type];
        while (current_piece_bb) {
            int sq = lsb_idx(current_piece_bb);
            h ^= keys.piece_square_keys[piece_type][sq];
            current_piece_bb &= current_piece_bb - 1;
        }
    }
    if (!whiteToMove) h ^= keys.black_to_move_key;
    h ^= keys.castling_keys[castlingRights & 0xF];
    if (epSquare != -1) h ^= keys.ep_file_keys[file_of(epSquare)];
    currentHash = h;
}

int Board::pieceAt(int rank, int file) const {
    if (!on_board_rf(rank, file)) return EMPTY;
    return PIECE_CODE[mailbox[square(rank, file)]];
}

bool Board::applyMove(const Move& m) {
    return applyMove(m.fromRank(), m.fromFile(), m.toRank(), m.toFile(), m.promotion());
}

bool Board::applyMove(int fromRank, int fromFile, int toRank, int toFile, char promo) {
    if (!on_board_rf(fromRank, fromFile) || !on_board_rf(toRank, toFile)) return false;

    int from = square(fromRank, fromFile);
    int to = square(toRank, toFile);
    Piece moved = mailbox[from];
    if (moved == NO_PIECE) return false;

    bool white = is_white_piece(moved);
    int flags = 0;
    int promo_val = PROMO_TYPE_NONE;

    if (moved == W_KING || moved == B_KING) {
        int home_rank = white ? 0 : 7;
        if (fromRank == home_rank && toRank == home_rank && fromFile == 4) {
            if (toFile == 6) flags |= KSC_FLAG;
            else if (toFile == 2) flags |= QSC_FLAG;
        }
    } else if (moved == W_PAWN || moved == B_PAWN) {
        if (std::abs(toRank - fromRank) == 2) flags |= DPP_FLAG;
        if (fromFile != toFile && mailbox[to] == NO_PIECE && to == epSquare) flags |= EP_FLAG;
        if (toRank == (white ? 7 : 0)) promo_val = promoFromLetter(promo);
    }

    applyEncoded(encodeMove(from, to, promo_val, flags));
    return true;
}

void Board::applyEncoded(EncodedMove m) {
    int from = fromSquare(m);
    int to = toSquare(m);
    int promo_val = promotion(m);
    int flags = moveFlags(m);

    Piece moved_piece = mailbox[from];
    Piece captured_on_to_sq = mailbox[to];
    if (moved_piece == NO_PIECE) return;

    const bool mover_is_white = is_white_piece(moved_piece);
    Bitboard from_bb = 1ULL << from;
    Bitboard to_bb = 1ULL << to;

    bb[moved_piece] &= ~from_bb;
    mailbox[from] = NO_PIECE;

    Piece captured = NO_PIECE;
    if (flags & EP_FLAG) {
        int captured_sq = mover_is_white ? to - 8 : to + 8;
        captured = mover_is_white ? B_PAWN : W_PAWN;
        bb[captured] &= ~(1ULL << captured_sq);
        mailbox[captured_sq] = NO_PIECE;
    } else if (captured_on_to_sq != NO_PIECE) {
        captured = captured_on_to_sq;
        bb[captured] &= ~to_bb;
    }

    Piece placed = moved_piece;
    if (promo_val != PROMO_TYPE_NONE) {
        if (promo_val == PROMO_TYPE_N) placed = mover_is_white ? W_KNIGHT : B_KNIGHT;
        else if (promo_val == PROMO_TYPE_B) placed = mover_is_white ? W_BISHOP : B_BISHOP;
        else if (promo_val == PROMO_TYPE_R) placed = mover_is_white ? W_ROOK : B_ROOK;
        else placed = mover_is_white ? W_QUEEN : B_QUEEN;
    }
    bb[placed] |= to_bb;
    mailbox[to] = placed;

    if (flags & (KSC_FLAG | QSC_FLAG)) {
        int home = mover_is_white ? 0 : 7;
        int r_from_sq = (flags & KSC_FLAG) ? square(home, 7) : square(home, 0);
        int r_to_sq   = (flags & KSC_FLAG) ? square(home, 5) : square(home, 3);
        Piece r_piece = mover_is_white ? W_ROOK : B_ROOK;
        bb[r_piece] &= ~(1ULL << r_from_sq);
        bb[r_piece] |= (1ULL << r_to_sq);
        mailbox[r_from_sq] = NO_PIECE;
        mailbox[r_to_sq] = r_piece;
    }

    epSquare = -1;
    if (flags & DPP_FLAG) {
        epSquare = mover_is_white ? (to - 8) : (to + 8);
    }

    if (moved_piece == W_KING) castlingRights &= ~(WK_CASTLE_MASK | WQ_CASTLE_MASK);
    else if (moved_piece == B_KING) castlingRights &= ~(BK_CASTLE_MASK | BQ_CASTLE_MASK);
    if (from == square(0, 0) || to == square(0, 0)) castlingRights &= ~WQ_CASTLE_MASK;
    if (from == square(0, 7) || to == square(0, 7)) castlingRights &= ~WK_CASTLE_MASK;
    if (from == square(7, 0) || to == square(7, 0)) castlingRights &= ~BQ_CASTLE_MASK;
    if (from == square(7, 7) || to == square(7, 7)) castlingRights &= ~BK_CASTLE_MASK;

    if (moved_piece == W_PAWN || moved_piece == B_PAWN || captured != NO_PIECE) {
        halfmoveClock = 0;
    } else {
        halfmoveClock++;
    }
    if (!mover_is_white) fullmoveNumber++;

    updateOccupancies();
    computeAndSetHash();
}

void Board::advanceTurn() {
    whiteToMove = !whiteToMove;
    computeAndSetHash();
    hashHistory.push_back(currentHash);
}

std::vector<Move> Board::legalMoves(Side side) const {
    std::vector<EncodedMove> encoded;
    generateMoves(side == Side::WHITE, encoded);

    std::vector<Move> moves;
    moves.reserve(encoded.size());
    for (EncodedMove m : encoded) moves.push_back(toMove(m));
    return moves;
}

bool Board::isInCheck(Side side) const {
    int king_sq = lsb_idx(bb[side == Side::WHITE ? W_KING : B_KING]);
    if (king_sq == -1) return false;
    return isSquareAttacked(king_sq, side == Side::BLACK);
}

bool Board::isCheckmate(Side side) const {
    return isInCheck(side) && legalMoves(side).empty();
}

bool Board::isStalemate(Side side) const {
    return !isInCheck(side) && legalMoves(side).empty();
}

Outcome Board::outcome() const {
    Side mover = currentMover();
    if (legalMoves(mover).empty()) {
        return isInCheck(mover) ? Outcome::CHECKMATE : Outcome::STALEMATE;
    }
    if (halfmoveClock >= 100) return Outcome::DRAW_FIFTY_MOVE;
    if (std::count(hashHistory.begin(), hashHistory.end(), currentHash) >= 3) {
        return Outcome::DRAW_THREEFOLD_REPETITION;
    }
    return Outcome::ONGOING;
}

std::string Board::toCoordinateLabel(int rank, int file) const {
    if (!on_board_rf(rank, file)) return "??";
    return std::string(1, static_cast<char>('a' + file)) + std::string(1, static_cast<char>('1' + rank));
}

std::string Board::snapshot() const {
    std::string s;
    s.reserve(71);
    for (int r = 7; r >= 0; --r) {
        for (int f = 0; f < 8; ++f) {
            Piece p = mailbox[square(r, f)];
            s += (p == NO_PIECE ? '.' : PIECE_CHAR_REPR[p]);
        }
        if (r > 0) s += '/';
    }
    return s;
}

std::string Board::pretty(int highlightFrom, int highlightTo) const {
    std::stringstream ss;
    ss << "  +-----------------+\n";
    for (int r_disp = 7; r_disp >= 0; --r_disp) {
        ss << r_disp + 1 << " | ";
        for (int f_disp = 0; f_disp < 8; ++f_disp) {
            int sq = square(r_disp, f_disp);
            Piece p = mailbox[sq];
            bool marked = on_board(sq) && (sq == highlightFrom || sq == highlightTo);
            ss << (p == NO_PIECE ? (marked ? '*' : '.') : PIECE_CHAR_REPR[p]) << (marked ? '<' : ' ');
        }
        ss << "|\n";
    }
    ss << "  +-----------------+\n";
    ss << "    a b c d e f g h\n";
    ss << (whiteToMove ? "White" : "Black") << " to move.\n";
    return ss.str();
}

uint64_t Board::perft(int depth) const {
    if (depth <= 0) return 1ULL;

    std::vector<EncodedMove> legal_moves;
    generateMoves(whiteToMove, legal_moves);
    if (depth == 1) return static_cast<uint64_t>(legal_moves.size());

    uint64_t nodes = 0;
    for (EncodedMove m : legal_moves) {
        Board next = *this;
        next.applyEncoded(m);
        next.advanceTurn();
        nodes += next.perft(depth - 1);
    }
    return nodes;
}

// ───────────────────────── Move generation ─────────────────────────

void Board::generateMoves(bool is_white, std::vector<EncodedMove>& moves) const {
    moves.clear();
    const int king_sq = lsb_idx(bb[is_white ? W_KING : B_KING]);
    const Bitboard friendly_pieces = is_white ? occWhite : occBlack;

    if (king_sq == -1) return;

    const Bitboard checkers = get_attackers(king_sq, !is_white);
    const int num_checkers = popcount(checkers);

    Bitboard check_resolution_mask = ~0ULL;

    if (num_checkers > 1) { // Double check, only king moves are possible.
        add_king_moves(is_white, king_sq, moves);
        return;
    }
    if (num_checkers == 1) {
        int checker_sq = lsb_idx(checkers);
        check_resolution_mask = (1ULL << checker_sq);
        Piece checker_piece = mailbox[checker_sq];

        if (checker_piece == (is_white ? B_BISHOP : W_BISHOP) ||
            checker_piece == (is_white ? B_ROOK : W_ROOK) ||
            checker_piece == (is_white ? B_QUEEN : W_QUEEN)) {
            check_resolution_mask |= attacks::get_ray_between(king_sq, checker_sq);
        }
    }

    Bitboard pinned = 0ULL;
    std::array<Bitboard, 64> pin_ray_map{};

    const Bitboard enemy_rooks_queens = is_white ? (bb[B_ROOK] | bb[B_QUEEN]) : (bb[W_ROOK] | bb[W_QUEEN]);
    const Bitboard enemy_bishops_queens = is_white ? (bb[B_BISHOP] | bb[B_QUEEN]) : (bb[W_BISHOP] | bb[W_QUEEN]);

    Bitboard potential_pinners = (attacks::get_rook_attacks(king_sq, 0) & enemy_rooks_queens) |
                                 (attacks::get_bishop_attacks(king_sq, 0) & enemy_bishops_queens);

    while (potential_pinners) {
        int pinner_sq = lsb_idx(potential_pinners);
        potential_pinners &= potential_pinners - 1;

        Bitboard ray_between = attacks::get_ray_between(king_sq, pinner_sq);
        if (popcount(ray_between & occ) == 1) {
            Bitboard pinned_piece_bb = ray_between & friendly_pieces;
            if (pinned_piece_bb) {
                int pinned_sq = lsb_idx(pinned_piece_bb);
                pinned |= (1ULL << pinned_sq);
                pin_ray_map[pinned_sq] = attacks::get_line_through(king_sq, pinner_sq);
            }
        }
    }

    const int start_p = is_white ? W_PAWN : B_PAWN;
    const int end_p = is_white ? W_QUEEN : B_QUEEN;

    for (int p_type = start_p; p_type <= end_p; ++p_type) {
        Bitboard piece_bb = bb[p_type];
        while (piece_bb) {
            int from_sq = lsb_idx(piece_bb);
            piece_bb &= piece_bb - 1;

            Bitboard move_mask = check_resolution_mask;
            if (pinned & (1ULL << from_sq)) move_mask &= pin_ray_map[from_sq];

            switch (static_cast<Piece>(p_type)) {
                case W_PAWN: case B_PAWN:
                    add_pawn_moves(is_white, from_sq, moves, move_mask); break;
                case W_KNIGHT: case B_KNIGHT:
                    add_knight_moves(is_white, from_sq, moves, move_mask); break;
                case W_BISHOP: case B_BISHOP:
                    add_sliding_moves(is_white, from_sq, true, false, moves, move_mask); break;
                case W_ROOK: case B_ROOK:
                    add_sliding_moves(is_white, from_sq, false, true, moves, move_mask); break;
                default:
                    add_sliding_moves(is_white, from_sq, true, true, moves, move_mask); break;
            }
        }
    }
    add_king_moves(is_white, king_sq, moves);
}

void Board::add_pawn_moves(bool is_white, int from_sq, std::vector<EncodedMove>& moves, Bitboard target_mask) const {
    const int dir = is_white ? 8 : -8;
    const Bitboard enemy_pieces = is_white ? occBlack : occWhite;
    const Bitboard promotion_rank = is_white ? RANK_8 : RANK_1;
    const Bitboard start_rank = is_white ? RANK_2 : RANK_7;

    auto push = [&](int to_sq, int flags) {
        if (promotion_rank & (1ULL << to_sq)) {
            moves.push_back(encodeMove(from_sq, to_sq, PROMO_TYPE_Q));
            moves.push_back(encodeMove(from_sq, to_sq, PROMO_TYPE_R));
            moves.push_back(encodeMove(from_sq, to_sq, PROMO_TYPE_B));
            moves.push_back(encodeMove(from_sq, to_sq, PROMO_TYPE_N));
        } else {
            moves.push_back(encodeMove(from_sq, to_sq, PROMO_TYPE_NONE, flags));
        }
    };

    // Pushes
    int one_step = from_sq + dir;
    if (on_board(one_step) && !(occ & (1ULL << one_step))) {
        if (target_mask & (1ULL << one_step)) push(one_step, 0);

        if (start_rank & (1ULL << from_sq)) {
            int two_steps = from_sq + dir * 2;
            if (!(occ & (1ULL << two_steps)) && (target_mask & (1ULL << two_steps))) {
                push(two_steps, DPP_FLAG);
            }
        }
    }

    // Captures
    Bitboard pawn_attacks = attacks::pawn_attacks_table[is_white ? 0 : 1][from_sq];
    Bitboard valid_captures = pawn_attacks & enemy_pieces & target_mask;
    while (valid_captures) {
        push(lsb_idx(valid_captures), 0);
        valid_captures &= valid_captures - 1;
    }

    // En passant: only the side facing the double-pushed pawn may take it
    if (epSquare != -1 && rank_of(epSquare) == (is_white ? 5 : 2)) {
        int captured_pawn_sq = epSquare + (is_white ? -8 : 8);
        // The pawn giving check may be removed en passant even though the target square is empty
        Bitboard ep_mask = target_mask | ((target_mask & (1ULL << captured_pawn_sq)) ? (1ULL << epSquare) : 0ULL);
        if ((ep_mask & (1ULL << epSquare)) && (pawn_attacks & (1ULL << epSquare))) {
            // King, capturing pawn and captured pawn on one rank: removing both may expose the king.
            Bitboard occupancy_without_pawns = (occ ^ (1ULL << from_sq) ^ (1ULL << captured_pawn_sq)) | (1ULL << epSquare);
            int king_sq = lsb_idx(bb[is_white ? W_KING : B_KING]);

            const Bitboard enemy_rooks_queens = is_white ? (bb[B_ROOK] | bb[B_QUEEN]) : (bb[W_ROOK] | bb[W_QUEEN]);
            const Bitboard enemy_bishops_queens = is_white ? (bb[B_BISHOP] | bb[B_QUEEN]) : (bb[W_BISHOP] | bb[W_QUEEN]);

            if ((attacks::get_rook_attacks(king_sq, occupancy_without_pawns) & enemy_rooks_queens) == 0 &&
                (attacks::get_bishop_attacks(king_sq, occupancy_without_pawns) & enemy_bishops_queens) == 0) {
                moves.push_back(encodeMove(from_sq, epSquare, PROMO_TYPE_NONE, EP_FLAG));
            }
        }
    }
}

void Board::add_knight_moves(bool is_white, int from_sq, std::vector<EncodedMove>& moves, Bitboard target_mask) const {
    Bitboard friendly_occ = is_white ? occWhite : occBlack;
    Bitboard knight_moves = attacks::knight_attacks_table[from_sq] & ~friendly_occ & target_mask;

    while (knight_moves) {
        moves.push_back(encodeMove(from_sq, lsb_idx(knight_moves)));
        knight_moves &= knight_moves - 1;
    }
}

void Board::add_sliding_moves(bool is_white, int from_sq, bool is_bishop, bool is_rook, std::vector<EncodedMove>& moves, Bitboard target_mask) const {
    Bitboard friendly_occ = is_white ? occWhite : occBlack;
    Bitboard slide_moves = 0ULL;

    if (is_bishop) slide_moves |= attacks::get_bishop_attacks(from_sq, occ);
    if (is_rook) slide_moves |= attacks::get_rook_attacks(from_sq, occ);

    slide_moves &= ~friendly_occ;
    slide_moves &= target_mask;

    while (slide_moves) {
        moves.push_back(encodeMove(from_sq, lsb_idx(slide_moves)));
        slide_moves &= slide_moves - 1;
    }
}

void Board::add_king_moves(bool is_white, int from_sq, std::vector<EncodedMove>& moves) const {
    Bitboard friendly_occ = is_white ? occWhite : occBlack;
    Bitboard king_moves = attacks::king_attacks_table[from_sq] & ~friendly_occ;
    Bitboard blockers_without_king = occ & ~(1ULL << from_sq);

    while (king_moves) {
        int to_sq = lsb_idx(king_moves);
        if (!isSquareAttacked(to_sq, !is_white, blockers_without_king)) {
            moves.push_back(encodeMove(from_sq, to_sq));
        }
        king_moves &= king_moves - 1;
    }

    // Castling
    const int king_home_sq = is_white ? 4 : 60;
    const Piece own_rook = is_white ? W_ROOK : B_ROOK;
    if (from_sq != king_home_sq || isSquareAttacked(king_home_sq, !is_white)) return;

    if ((castlingRights & (is_white ? WK_CASTLE_MASK : BK_CASTLE_MASK)) && mailbox[king_home_sq + 3] == own_rook) {
        int f1_sq = king_home_sq + 1;
        int g1_sq = king_home_sq + 2;
        if (!(occ & (1ULL << f1_sq)) && !(occ & (1ULL << g1_sq)) &&
            !isSquareAttacked(f1_sq, !is_white) && !isSquareAttacked(g1_sq, !is_white)) {
            moves.push_back(encodeMove(from_sq, g1_sq, PROMO_TYPE_NONE, KSC_FLAG));
        }
    }
    if ((castlingRights & (is_white ? WQ_CASTLE_MASK : BQ_CASTLE_MASK)) && mailbox[king_home_sq - 4] == own_rook) {
        int d1_sq = king_home_sq - 1;
        int c1_sq = king_home_sq - 2;
        int b1_sq = king_home_sq - 3;
        if (!(occ & (1ULL << d1_sq)) && !(occ & (1ULL << c1_sq)) && !(occ & (1ULL << b1_sq)) &&
            !isSquareAttacked(d1_sq, !is_white) && !isSquareAttacked(c1_sq, !is_white)) {
            moves.push_back(encodeMove(from_sq, c1_sq, PROMO_TYPE_NONE, QSC_FLAG));
        }
    }
}

Bitboard Board::get_attackers(int sq, bool by_white) const {
    Bitboard attackers = 0ULL;
    const Bitboard rooks_queens = by_white ? (bb[W_ROOK] | bb[W_QUEEN]) : (bb[B_ROOK] | bb[B_QUEEN]);
    const Bitboard bishops_queens = by_white ? (bb[W_BISHOP] | bb[W_QUEEN]) : (bb[B_BISHOP] | bb[B_QUEEN]);

    attackers |= (attacks::pawn_attacks_table[by_white ? 1 : 0][sq] & (by_white ? bb[W_PAWN] : bb[B_PAWN]));
    attackers |= (attacks::knight_attacks_table[sq] & (by_white ? bb[W_KNIGHT] : bb[B_KNIGHT]));
    attackers |= (attacks::king_attacks_table[sq] & (by_white ? bb[W_KING] : bb[B_KING]));
    attackers |= (attacks::get_rook_attacks(sq, occ) & rooks_queens);
    attackers |= (attacks::get_bishop_attacks(sq, occ) & bishops_queens);
    return attackers;
}

bool Board::isSquareAttacked(int sq, bool by_white) const {
    return isSquareAttacked(sq, by_white, occ);
}

bool Board::isSquareAttacked(int sq, bool by_white, Bitboard blockers) const {
    Bitboard pawn_attackers   = by_white ? bb[W_PAWN] : bb[B_PAWN];
    Bitboard knight_attackers = by_white ? bb[W_KNIGHT] : bb[B_KNIGHT];
    Bitboard king_attackers   = by_white ? bb[W_KING] : bb[B_KING];
    Bitboard bishop_queen_attackers = (by_white ? bb[W_BISHOP] : bb[B_BISHOP]) | (by_white ? bb[W_QUEEN] : bb[B_QUEEN]);
    Bitboard rook_queen_attackers   = (by_white ? bb[W_ROOK] : bb[B_ROOK]) | (by_white ? bb[W_QUEEN] : bb[B_QUEEN]);
    int color_idx = by_white ? 1 : 0; // pawn attacks seen from the attacked square

    if (attacks::pawn_attacks_table[color_idx][sq] & pawn_attackers) return true;
    if (attacks::knight_attacks_table[sq] & knight_attackers) return true;
    if (attacks::king_attacks_table[sq] & king_attackers) return true;
    if (attacks::get_bishop_attacks(sq, blockers) & bishop_queen_attackers) return true;
    if (attacks::get_rook_attacks(sq, blockers) & rook_queen_attackers) return true;
    return false;
}

} // namespace chessarena
