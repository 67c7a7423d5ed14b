// game_saver.hpp
#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "board.hpp"
#include "move.hpp"
#include "move_history.hpp"

namespace chessarena {

constexpr const char* GAMES_FOLDER_NAME = "games";
constexpr const char* FILE_PREFIX = "game_";
constexpr const char* FILE_EXTENSION = ".txt";

/**
 * @brief Rebuilds algebraic notation by replaying raw moves on `board`.
 *
 * `board` must hold the starting position; it is left at the final position.
 * One line per move pair ("1. e4 e5"). Captures, castling, promotion, check and
 * checkmate are annotated. A move whose source square is empty is reported on
 * std::cerr and skipped.
 */
std::string formatMoves(const std::vector<Move>& moves, Board& board);
std::string formatMoves(const MoveHistory& history, Board& board);

// First "game_XXX_YYY_ZZZ.txt" in `directory` that does not exist yet.
// @throws std::runtime_error when every name is taken.
std::filesystem::path nextGameFile(const std::filesystem::path& directory);

/**
 * @brief Writes the reconstructed game to the next free file in `directory`.
 *
 * The directory is created when missing. `board` is reset to the starting
 * position before the replay.
 *
 * @return Path of the written file.
 * @throws std::runtime_error / std::filesystem::filesystem_error on I/O failure.
 */
std::filesystem::path saveGame(const MoveHistory& history, Board& board,
                               const std::filesystem::path& directory = GAMES_FOLDER_NAME);
std::filesystem::path saveGame(const MoveHistory& history,
                               const std::filesystem::path& directory = GAMES_FOLDER_NAME);

} // namespace chessarena
