// move.hpp
#pragma once

#include <optional>
#include <ostream>
#include <string>

namespace chessarena {

// ───────────────────────── Move ─────────────────────────
// A coordinate move (fromRank, fromFile, toRank, toFile), zero based, rank 0 = first rank.
// Promotion is one of 'q','r','b','n' or 0 when the move does not promote.
class Move {
public:
    Move() = default;
    Move(int fromRank, int fromFile, int toRank, int toFile, char promotion = 0);

    int fromRank() const { return fromRank_; }
    int fromFile() const { return fromFile_; }
    int toRank() const { return toRank_; }
    int toFile() const { return toFile_; }
    char promotion() const { return promotion_; }

    // Square indices, a1 = 0 ... h8 = 63
    int fromSquare() const { return fromRank_ * 8 + fromFile_; }
    int toSquare() const { return toRank_ * 8 + toFile_; }

    // "e2e4", "e7e8q"
    std::string toUci() const;

    // Parses engine-style text. Returns empty for malformed text and for the
    // engine's null answers ("(none)", "0000").
    static std::optional<Move> fromUci(const std::string& text);

    bool operator==(const Move& other) const {
        return fromRank_ == other.fromRank_ && fromFile_ == other.fromFile_ &&
               toRank_ == other.toRank_ && toFile_ == other.toFile_ &&
               promotion_ == other.promotion_;
    }
    bool operator!=(const Move& other) const { return !(*this == other); }

private:
    int fromRank_ = 0;
    int fromFile_ = 0;
    int toRank_ = 0;
    int toFile_ = 0;
    char promotion_ = 0;
};

std::ostream& operator<<(std::ostream& os, const Move& m);

} // namespace chessarena
