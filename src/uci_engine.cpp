#include "uci_engine.hpp"

#include <cerrno>
#include <chrono>
#include <signal.h>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <iostream>
#include <pthread.h>
#include <sstream>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <utility>

namespace chessarena {

namespace {
    std::string errnoMessage(const std::string& what) {
        return what + ": " + std::strerror(errno);
    }

    // Blocks SIGPIPE for the calling thread while it writes to the engine, so a
    // dead engine shows up as EPIPE. A SIGPIPE raised by those writes is
    // discarded before the previous mask comes back; the process-wide
    // disposition is never touched.
    class SigpipeBlock {
    public:
        SigpipeBlock() {
            sigemptyset(&pipeMask_);
            sigaddset(&pipeMask_, SIGPIPE);

            sigset_t pending;
            sigemptyset(&pending);
            sigpending(&pending);
            alreadyPending_ = sigismember(&pending, SIGPIPE) == 1;
            blocked_ = pthread_sigmask(SIG_BLOCK, &pipeMask_, &previous_) == 0;
        }

        ~SigpipeBlock() {
            if (!blocked_) return;
            if (!alreadyPending_) {
                const int savedErrno = errno;
                struct timespec zero = {0, 0};
                while (sigtimedwait(&pipeMask_, nullptr, &zero) == SIGPIPE) {}
                errno = savedErrno;
            }
            pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
        }

        SigpipeBlock(const SigpipeBlock&) = delete;
        SigpipeBlock& operator=(const SigpipeBlock&) = delete;

    private:
        sigset_t pipeMask_;
        sigset_t previous_;
        bool alreadyPending_ = false;
        bool blocked_ = false;
    };
}

// ───────────────────────── UciEngineProcess ─────────────────────────

UciEngineProcess::UciEngineProcess(std::string enginePath)
    : enginePath_(std::move(enginePath)) {}

UciEngineProcess::~UciEngineProcess() {
    stop();
}

void UciEngineProcess::start() {
    if (running()) return;

    int toPipe[2];
    int fromPipe[2];
    if (pipe(toPipe) == -1) throw EngineError(errnoMessage("pipe"));
    if (pipe(fromPipe) == -1) {
        close(toPipe[0]);
        close(toPipe[1]);
        throw EngineError(errnoMessage("pipe"));
    }

    pid_t pid = fork();
    if (pid == -1) {
        int saved = errno;
        close(toPipe[0]); close(toPipe[1]);
        close(fromPipe[0]); close(fromPipe[1]);
        errno = saved;
        throw EngineError(errnoMessage("fork"));
    }

    if (pid == 0) {
        // Child process
        dup2(toPipe[0], STDIN_FILENO);
        dup2(fromPipe[1], STDOUT_FILENO);
        close(toPipe[0]); close(toPipe[1]);
        close(fromPipe[0]); close(fromPipe[1]);
        execlp(enginePath_.c_str(), enginePath_.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    // Parent process
    close(toPipe[0]);
    close(fromPipe[1]);
    fcntl(toPipe[1], F_SETFD, FD_CLOEXEC);
    fcntl(fromPipe[0], F_SETFD, FD_CLOEXEC);

    pid_ = pid;
    toEngine_ = toPipe[1];
    fromEngine_ = fromPipe[0];
    pending_.clear();
}

void UciEngineProcess::send(const std::string& command) {
    if (!running()) throw EngineError("Engine is not running");

    std::string line = command + "\n";
    SigpipeBlock noSigpipe;
    const char* data = line.data();
    std::size_t left = line.size();
    while (left > 0) {
        ssize_t written = write(toEngine_, data, left);
        if (written < 0) {
            if (errno == EINTR) continue;
            throw EngineError(errnoMessage("Failed to send '" + command + "'"));
        }
        data += written;
        left -= static_cast<std::size_t>(written);
    }
}

bool UciEngineProcess::readLine(std::string& line) {
    while (true) {
        auto newline = pending_.find('\n');
        if (newline != std::string::npos) {
            line = pending_.substr(0, newline);
            pending_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }

        char buffer[4096];
        ssize_t n = read(fromEngine_, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw EngineError(errnoMessage("Failed to read from engine"));
        }
        if (n == 0) return false;
        pending_.append(buffer, static_cast<std::size_t>(n));
    }
}

std::string UciEngineProcess::readUntil(const std::string& prefix) {
    if (!running()) throw EngineError("Engine is not running");

    std::string line;
    while (readLine(line)) {
        if (line.compare(0, prefix.size(), prefix) == 0) return line;
    }
    throw EngineError("Engine closed its output while waiting for '" + prefix + "'");
}

void UciEngineProcess::stop() {
    if (!running()) return;

    close(toEngine_); // engine sees end of input
    toEngine_ = -1;

    int status = 0;
    pid_t done = 0;
    for (int i = 0; i < 50 && done == 0; ++i) {
        done = waitpid(pid_, &status, WNOHANG);
        if (done == 0) std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (done == 0) {
        kill(pid_, SIGTERM);
        waitpid(pid_, &status, 0);
    }

    close(fromEngine_);
    fromEngine_ = -1;
    pid_ = -1;
    pending_.clear();
}

// ───────────────────────── UciEngineStrategy ─────────────────────────

UciEngineStrategy::UciEngineStrategy(EngineConnection& engine, const MoveHistory& history,
                                     int moveTimeMs, bool verbose)
    : engine_(engine), history_(history), moveTimeMs_(moveTimeMs), verbose_(verbose) {}

void UciEngineStrategy::prepare() {
    engine_.start();
    engine_.send("uci");
    engine_.readUntil("uciok");
    engine_.send("isready");
    engine_.readUntil("readyok");
    engine_.send("position startpos");
}

std::optional<Move> UciEngineStrategy::proposeMove(const Board& board) {
    std::string position = "position startpos";
    if (!history_.empty()) position += " moves " + history_.toUciString();

    engine_.send(position);
    engine_.send("go movetime " + std::to_string(moveTimeMs_));
    std::optional<Move> best = parseBestMove(engine_.readUntil("bestmove"));

    if (!best && verbose_) {
        std::cout << "Engine could not find a move for " << sideToString(board.currentMover())
                  << ". Game over.\n";
    }
    return best;
}

void UciEngineStrategy::release() {
    if (!engine_.running()) return;
    try {
        engine_.send("quit");
    } catch (const EngineError& e) {
        std::cerr << "Error while stopping engine: " << e.what() << std::endl;
    }
    engine_.stop();
}

std::optional<Move> UciEngineStrategy::parseBestMove(const std::string& line) {
    std::istringstream ss(line);
    std::string keyword, token;
    ss >> keyword >> token;
    if (keyword != "bestmove" || token.empty()) return std::nullopt;
    return Move::fromUci(token);
}

} // namespace chessarena
