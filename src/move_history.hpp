// move_history.hpp
#pragma once

#include <string>
#include <vector>

#include "move.hpp"

namespace chessarena {

// Append-only record of the moves committed in one game, in play order.
class MoveHistory {
public:
    void append(const Move& m) { moves_.push_back(m); }
    void clear() { moves_.clear(); }

    std::size_t size() const { return moves_.size(); }
    bool empty() const { return moves_.empty(); }
    const std::vector<Move>& moves() const { return moves_; }

    // Space separated coordinate moves, as sent after "position startpos moves".
    std::string toUciString() const {
        std::string out;
        for (const Move& m : moves_) {
            if (!out.empty()) out += ' ';
            out += m.toUci();
        }
        return out;
    }

private:
    std::vector<Move> moves_;
};

} // namespace chessarena
