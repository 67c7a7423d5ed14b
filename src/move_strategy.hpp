// move_strategy.hpp
#pragma once

#include <optional>
#include <string>

#include "board.hpp"
#include "move.hpp"

namespace chessarena {

/**
 * @brief Move selection for one side of a game.
 *
 * proposeMove() returns an empty optional when the side to move has nothing to
 * play; that ends the game and is not an error. prepare() runs once before the
 * first move of every game and release() once after the last, on every exit path.
 */
class MoveStrategy {
public:
    virtual ~MoveStrategy() = default;

    virtual std::optional<Move> proposeMove(const Board& board) = 0;
    virtual std::string name() const = 0;

    virtual void prepare() {}
    virtual void release() {}
};

} // namespace chessarena
