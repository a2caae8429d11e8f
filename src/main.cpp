#include <cstdlib>
#include <iostream>
#include <string>

#include "board.h"
#include "game.h"
#include "protocol.h"
#include "search.h"

using namespace gomoku;

namespace {

constexpr int kDefaultDepth = 2;

void printUsage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [--depth N] [--selfplay]" << std::endl;
}

// Engine plays both sides until the game is decided.
int runSelfPlay(int depth) {
    Game game;
    SearchEngine engine;
    while (!game.isOver()) {
        Player mover = game.sideToMove();
        Move m = game.playEngineMove(engine, depth);
        std::cout << playerName(mover) << " " << m.row << " " << m.col << std::endl;
        std::cerr << "DEBUG nodes=" << engine.nodes() << std::endl;
    }
    std::cout << game.board().toString();
    std::cout << describeOutcome(game.outcome()) << std::endl;
    return 0;
}

} // namespace

// Entry point for the engine.  Without --selfplay the protocol in
// protocol.h is served on stdin/stdout, with log lines on stderr.
int main(int argc, char** argv) {
    int depth = kDefaultDepth;
    bool selfPlay = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--depth" && i + 1 < argc) {
            char* end = nullptr;
            long value = std::strtol(argv[++i], &end, 10);
            if (end == argv[i] || *end != '\0' || value < 0 || value > 16) {
                printUsage(argv[0]);
                return 2;
            }
            depth = static_cast<int>(value);
        } else if (arg == "--selfplay") {
            selfPlay = true;
        } else {
            printUsage(argv[0]);
            return 2;
        }
    }

    if (selfPlay) {
        return runSelfPlay(depth);
    }

    Protocol protocol(depth, std::cout, std::cerr);
    protocol.run(std::cin);
    return 0;
}
