#include "move.hpp"

#include <cctype>
#include <stdexcept>

namespace chessarena {

namespace {
    bool inRange(int v) { return v >= 0 && v < 8; }

    bool isPromotionLetter(char c) {
        return c == 'q' || c == 'r' || c == 'b' || c == 'n';
    }
}

Move::Move(int fromRank, int fromFile, int toRank, int toFile, char promotion)
    : fromRank_(fromRank), fromFile_(fromFile), toRank_(toRank), toFile_(toFile),
      promotion_(promotion) {
    if (!inRange(fromRank) || !inRange(fromFile) || !inRange(toRank) || !inRange(toFile)) {
        throw std::out_of_range("Move coordinates must be in [0, 7]");
    }
    if (promotion_ != 0 && !isPromotionLetter(promotion_)) {
        throw std::invalid_argument(std::string("Invalid promotion piece: ") + promotion_);
    }
}

std::string Move::toUci() const {
    std::string s;
    s += static_cast<char>('a' + fromFile_);
    s += static_cast<char>('1' + fromRank_);
    s += static_cast<char>('a' + toFile_);
    s += static_cast<char>('1' + toRank_);
    if (promotion_ != 0) s += promotion_;
    return s;
}

std::optional<Move> Move::fromUci(const std::string& text) {
    if (text.size() != 4 && text.size() != 5) return std::nullopt;
    if (text == "0000") return std::nullopt;

    int ff = text[0] - 'a';
    int fr = text[1] - '1';
    int tf = text[2] - 'a';
    int tr = text[3] - '1';
    if (!inRange(ff) || !inRange(fr) || !inRange(tf) || !inRange(tr)) return std::nullopt;

    char promo = 0;
    if (text.size() == 5) {
        promo = static_cast<char>(std::tolower(static_cast<unsigned char>(text[4])));
        if (!isPromotionLetter(promo)) return std::nullopt;
    }
    return Move(fr, ff, tr, tf, promo);
}

std::ostream& operator<<(std::ostream& os, const Move& m) {
    return os << m.toUci();
}

} // namespace chessarena
