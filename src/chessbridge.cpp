#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "board.hpp"
#include "game_manager.hpp"
#include "game_saver.hpp"
#include "move.hpp"
#include "move_history.hpp"
#include "random_playout_strategy.hpp"
#include "render_slot.hpp"

namespace py = pybind11;
using namespace chessarena;

namespace {

Move parseMove(const std::string& uci) {
    std::optional<Move> m = Move::fromUci(uci);
    if (!m) throw std::invalid_argument("Not a coordinate move: '" + uci + "'");
    return *m;
}

MoveHistory historyFrom(const std::vector<std::string>& moves) {
    MoveHistory history;
    for (const std::string& uci : moves) history.append(parseMove(uci));
    return history;
}

std::vector<std::string> toUciList(const std::vector<Move>& moves) {
    std::vector<std::string> out;
    out.reserve(moves.size());
    for (const Move& m : moves) out.push_back(m.toUci());
    return out;
}

// Piece codes as an (8, 8) array, row 0 = rank 1.
py::array_t<int> boardArray(const Board& board) {
    std::vector<py::ssize_t> dims = {8, 8};
    py::array_t<int> squares(dims);
    auto view = squares.mutable_unchecked<2>();
    for (int r = 0; r < 8; ++r)
        for (int f = 0; f < 8; ++f)
            view(r, f) = board.pieceAt(r, f);
    return squares;
}

std::string formatMovesForPython(const std::vector<std::string>& moves) {
    Board board;
    return formatMoves(historyFrom(moves), board);
}

std::string saveGameForPython(const std::vector<std::string>& moves, const std::string& directory) {
    return saveGame(historyFrom(moves), directory).string();
}

/**
 * @brief Plays random vs random without pacing or drawing and saves the game.
 *
 * Black is the learner; its statistics are reported back with the result.
 */
py::dict playRandomGame(uint32_t seed, int maxPlies, const std::string& gamesDir, bool verbose) {
    Board board;
    MoveHistory history;
    RandomPlayoutStrategy white(seed, verbose);
    RandomPlayoutStrategy black(seed + 1, verbose);
    ImmediateRenderSurface surface;

    GameConfig config;
    config.pacingDelay = std::chrono::milliseconds(0);
    config.maxPlies = maxPlies;
    config.verbose = verbose;
    config.gamesDirectory = gamesDir;

    GameOrchestrator orchestrator(board, history, white, black, surface, black, config);
    OutcomeRecorder recorder(board, Side::BLACK);
    orchestrator.addListener(recorder);

    GameSummary summary;
    {
        py::gil_scoped_release release;
        summary = orchestrator.startGame();
    }

    py::dict result;
    result["outcome"] = summary.outcome;
    result["termination"] = terminationToString(summary.reason);
    result["plies"] = summary.plies;
    result["saved_path"] = summary.savedPath.string();
    result["moves"] = toUciList(history.moves());
    result["learner_wins"] = black.tally().wins;
    result["learner_losses"] = black.tally().losses;
    result["learner_draws"] = black.tally().draws;
    return result;
}

} // namespace

PYBIND11_MODULE(chessbridge, m) {
    m.doc() = "Python bindings for chessarena game replay and automated play";

    // --------------------------------------------------------------------
    // Enums
    // --------------------------------------------------------------------
    py::enum_<Outcome>(m, "Outcome")
        .value("ONGOING", Outcome::ONGOING)
        .value("CHECKMATE", Outcome::CHECKMATE)
        .value("STALEMATE", Outcome::STALEMATE)
        .value("DRAW_FIFTY_MOVE", Outcome::DRAW_FIFTY_MOVE)
        .value("DRAW_THREEFOLD_REPETITION", Outcome::DRAW_THREEFOLD_REPETITION);

    py::enum_<Side>(m, "Side")
        .value("WHITE", Side::WHITE)
        .value("BLACK", Side::BLACK);

    // --------------------------------------------------------------------
    // Notation and persistence
    // --------------------------------------------------------------------
    m.def("format_moves", &formatMovesForPython,
          py::arg("moves"),
          "Replay coordinate moves from the start position and return the move text");

    m.def("save_game", &saveGameForPython,
          py::arg("moves"),
          py::arg("directory") = std::string(GAMES_FOLDER_NAME),
          "Save a game to the next free game file and return its path");

    m.def("play_random_game", &playRandomGame,
          py::arg("seed") = 0,
          py::arg("max_plies") = 400,
          py::arg("games_dir") = std::string(GAMES_FOLDER_NAME),
          py::arg("verbose") = false,
          "Play one random game, save it and return a summary dict");

    // --------------------------------------------------------------------
    // Board
    // --------------------------------------------------------------------
    py::class_<Board>(m, "Board")
        .def(py::init<>())
        .def("reset_to_initial", &Board::resetToInitial)
        .def("load_fen", &Board::loadFen, py::arg("fen"))
        .def("piece_at", &Board::pieceAt, py::arg("rank"), py::arg("file"))
        .def("apply_move",
             [](Board& b, const std::string& uci) { return b.applyMove(parseMove(uci)); },
             py::arg("move"))
        .def("advance_turn", &Board::advanceTurn)
        .def("current_mover", &Board::currentMover)
        .def("legal_moves",
             [](const Board& b, Side side) { return toUciList(b.legalMoves(side)); },
             py::arg("side"))
        .def("is_in_check", &Board::isInCheck, py::arg("side"))
        .def("is_checkmate", &Board::isCheckmate, py::arg("side"))
        .def("outcome", &Board::outcome)
        .def("snapshot", &Board::snapshot)
        .def("to_array", &boardArray)
        .def("perft", &Board::perft, py::arg("depth"))
        .def("__str__", [](const Board& b) { return b.pretty(); });
}
