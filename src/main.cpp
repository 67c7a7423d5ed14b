#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <random>
#include <string>

#include "board.hpp"
#include "game_manager.hpp"
#include "game_tree.hpp"
#include "monte_carlo_simulator.hpp"
#include "move_history.hpp"
#include "random_playout_strategy.hpp"
#include "render_slot.hpp"
#include "uci_engine.hpp"

using namespace chessarena;

namespace {

void printUsage() {
    std::cout << "chessarena - automated chess games\n";
    std::cout << "Usage: chessarena [options]\n";
    std::cout << "Options:\n";
    std::cout << "  --engine <path>      UCI engine playing White (default: stockfish)\n";
    std::cout << "  --movetime <ms>      Engine thinking time per move (default: 1000)\n";
    std::cout << "  --random-white       Random playout for White instead of the engine\n";
    std::cout << "  --games <num>        Number of games to play (default: 1)\n";
    std::cout << "  --seed <num>         Seed for the random players (default: random)\n";
    std::cout << "  --delay <ms>         Pause between turns (default: 500)\n";
    std::cout << "  --max-plies <num>    Stop a game after this many plies, 0 = never (default: 400)\n";
    std::cout << "  --games-dir <path>   Where finished games are saved (default: games)\n";
    std::cout << "  --simulate <num>     Run Monte Carlo search on the start position and exit\n";
    std::cout << "  --quiet              Do not draw the board or log moves\n";
    std::cout << "  --help               Show this help message\n";
}

int runSimulation(int iterations, uint32_t seed) {
    SimulatorConfig config;
    config.iterations = iterations;
    MonteCarloSimulator simulator(config, seed);

    Board board;
    GameTree tree(board);
    simulator.simulate(tree);

    std::cout << "Simulated " << iterations << " playouts from the start position\n";
    for (const auto& child : tree.root().children()) {
        const double mean = child->visitCount() > 0 ? child->winScore() / child->visitCount() : 0.0;
        std::cout << "  " << child->move()->toUci() << "  visits: " << child->visitCount()
                  << "  score: " << mean << "\n";
    }

    std::optional<Move> best = MonteCarloSimulator::bestMove(tree.root());
    if (!best) {
        std::cerr << "No move was explored" << std::endl;
        return 1;
    }
    std::cout << "Best move: " << best->toUci() << std::endl;
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    std::string enginePath = "stockfish";
    int moveTimeMs = 1000;
    bool randomWhite = false;
    int games = 1;
    std::optional<uint32_t> seed;
    int simulateIterations = 0;
    GameConfig config;

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "--help") {
                printUsage();
                return 0;
            } else if (arg == "--engine" && i + 1 < argc) {
                enginePath = argv[++i];
            } else if (arg == "--movetime" && i + 1 < argc) {
                moveTimeMs = std::stoi(argv[++i]);
            } else if (arg == "--random-white") {
                randomWhite = true;
            } else if (arg == "--games" && i + 1 < argc) {
                games = std::stoi(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                seed = static_cast<uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--delay" && i + 1 < argc) {
                config.pacingDelay = std::chrono::milliseconds(std::stoi(argv[++i]));
            } else if (arg == "--max-plies" && i + 1 < argc) {
                config.maxPlies = std::stoi(argv[++i]);
            } else if (arg == "--games-dir" && i + 1 < argc) {
                config.gamesDirectory = argv[++i];
            } else if (arg == "--simulate" && i + 1 < argc) {
                simulateIterations = std::stoi(argv[++i]);
            } else if (arg == "--quiet") {
                config.verbose = false;
            } else {
                std::cerr << "Unknown argument: " << arg << std::endl;
                printUsage();
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid option value: " << e.what() << std::endl;
        printUsage();
        return 1;
    }

    const uint32_t baseSeed = seed ? *seed : std::random_device{}();

    if (simulateIterations > 0) {
        return runSimulation(simulateIterations, baseSeed);
    }

    Board board;
    MoveHistory history;
    RandomPlayoutStrategy learner(baseSeed, config.verbose);

    std::unique_ptr<UciEngineProcess> engineProcess;
    std::unique_ptr<MoveStrategy> white;
    if (randomWhite) {
        white = std::make_unique<RandomPlayoutStrategy>(baseSeed + 1, config.verbose);
    } else {
        engineProcess = std::make_unique<UciEngineProcess>(enginePath);
        white = std::make_unique<UciEngineStrategy>(*engineProcess, history, moveTimeMs, config.verbose);
    }

    std::unique_ptr<RenderSurface> surface;
    if (config.verbose) surface = std::make_unique<ConsoleRenderSurface>(board, std::cout);
    else surface = std::make_unique<ImmediateRenderSurface>();

    GameOrchestrator orchestrator(board, history, *white, learner, *surface, learner, config);
    OutcomeRecorder recorder(board, Side::BLACK);
    orchestrator.addListener(recorder);

    for (int g = 0; g < games; ++g) {
        std::cout << "=== Game " << (g + 1) << "/" << games << " ===\n";
        try {
            GameSummary summary = orchestrator.startGame();
            std::cout << "Result: " << terminationToString(summary.reason) << ", "
                      << outcomeToString(summary.outcome) << " after " << summary.plies << " plies\n";
        } catch (const EngineError& e) {
            std::cerr << "Engine failure: " << e.what() << std::endl;
            return 1;
        } catch (const std::exception& e) {
            std::cerr << "Game failed: " << e.what() << std::endl;
            return 1;
        }
    }

    learner.printStatistics(std::cout);
    return 0;
}
