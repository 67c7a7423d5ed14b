#include "game_saver.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace chessarena {

namespace {

std::string pieceNotation(int piece) {
    switch (std::abs(piece)) {
        case ROOK:   return "R";
        case KNIGHT: return "N";
        case BISHOP: return "B";
        case QUEEN:  return "Q";
        case KING:   return "K";
        default:     return "";
    }
}

// "O-O" / "O-O-O" for a king moving two files from its home square, "" otherwise.
std::string detectCastling(int piece, const Move& m) {
    if (std::abs(piece) != KING) return "";
    const int homeRank = piece > 0 ? 0 : 7;
    if (m.fromRank() != homeRank || m.toRank() != homeRank || m.fromFile() != 4) return "";
    if (m.toFile() == 6) return "O-O";
    if (m.toFile() == 2) return "O-O-O";
    return "";
}

} // namespace

std::string formatMoves(const std::vector<Move>& moves, Board& board) {
    std::string formattedMoves;
    bool lineOpen = false;

    for (std::size_t i = 0; i < moves.size(); ++i) {
        const Move& m = moves[i];
        const int piece = board.pieceAt(m.fromRank(), m.fromFile());
        const int destinationPiece = board.pieceAt(m.toRank(), m.toFile());

        if (piece == EMPTY) {
            std::cerr << "Error: No piece found at source "
                      << board.toCoordinateLabel(m.fromRank(), m.fromFile())
                      << " (move " << (i + 1) << ": " << m.toUci() << "), skipping\n";
            continue;
        }

        std::string notation = detectCastling(piece, m);
        if (notation.empty()) {
            const bool isPawn = std::abs(piece) == PAWN;
            std::string capture;
            if (destinationPiece != EMPTY) {
                capture = isPawn ? std::string(1, static_cast<char>('a' + m.fromFile())) + "x" : "x";
            }
            notation = (isPawn ? capture : pieceNotation(piece) + capture) +
                       board.toCoordinateLabel(m.toRank(), m.toFile());

            if (isPawn && m.toRank() == (piece > 0 ? 7 : 0)) {
                char promo = m.promotion() != 0 ? m.promotion() : 'q';
                notation += "=";
                notation += static_cast<char>(std::toupper(static_cast<unsigned char>(promo)));
            }
        }

        board.applyMove(m);
        board.advanceTurn();

        const Side opponent = piece > 0 ? Side::BLACK : Side::WHITE;
        if (board.isCheckmate(opponent)) {
            notation += "#";
        } else if (board.isInCheck(opponent)) {
            notation += "+";
        }

        const std::string moveNumber = std::to_string(i / 2 + 1);
        if (i % 2 == 0) {
            if (lineOpen) formattedMoves += "\n";
            formattedMoves += moveNumber + ". " + notation;
            lineOpen = true;
        } else {
            if (lineOpen) formattedMoves += " " + notation;
            else formattedMoves += moveNumber + ". ... " + notation;
            formattedMoves += "\n";
            lineOpen = false;
        }
    }
    if (lineOpen) formattedMoves += "\n";

    return formattedMoves;
}

std::string formatMoves(const MoveHistory& history, Board& board) {
    return formatMoves(history.moves(), board);
}

std::filesystem::path nextGameFile(const std::filesystem::path& directory) {
    int firstBlock = 0, secondBlock = 0, thirdBlock = 0;

    while (firstBlock <= 999) {
        char filename[64];
        std::snprintf(filename, sizeof(filename), "%s%03d_%03d_%03d%s",
                      FILE_PREFIX, firstBlock, secondBlock, thirdBlock, FILE_EXTENSION);
        std::filesystem::path candidate = directory / filename;
        if (!std::filesystem::exists(candidate)) return candidate;

        thirdBlock++;
        if (thirdBlock > 999) {
            thirdBlock = 0;
            secondBlock++;
        }
        if (secondBlock > 999) {
            secondBlock = 0;
            firstBlock++;
        }
    }
    throw std::runtime_error("No free game file name left in " + directory.string());
}

std::filesystem::path saveGame(const MoveHistory& history, Board& board,
                               const std::filesystem::path& directory) {
    board.resetToInitial();
    const std::string formattedMoves = formatMoves(history, board);

    std::filesystem::create_directories(directory);
    const std::filesystem::path gameFile = nextGameFile(directory);

    std::ofstream writer(gameFile);
    if (!writer) throw std::runtime_error("Failed to create " + gameFile.string());
    writer << formattedMoves;
    writer.close();
    if (!writer) throw std::runtime_error("Failed to write " + gameFile.string());

    return gameFile;
}

std::filesystem::path saveGame(const MoveHistory& history, const std::filesystem::path& directory) {
    Board board;
    return saveGame(history, board, directory);
}

} // namespace chessarena
