// search.h
//
// Minimax search with alpha-beta pruning for the 15x15 Gomoku engine.
//
// The engine explores the game tree depth-first on a single Board that it
// mutates in place: each candidate stone is placed, the subtree is searched
// and the stone is removed again before the next sibling is tried.  Scores
// are always from the perspective of the root player, also inside
// minimizing frames.
//
// Terminal positions are scored +/-kWinScore (win/loss for the root player)
// or 0 (draw); at the depth horizon the static Evaluator is used.  Note that
// large heuristic sums can exceed kWinScore on this board size; the two
// scales are kept as they are.
//
// Every call is self-contained: there is no transposition table, history or
// other state carried from one search to the next.

#ifndef GOMOKU_SEARCH_H
#define GOMOKU_SEARCH_H

#include <cstdint>
#include <limits>
#include <random>
#include <vector>

#include "board.h"
#include "evaluator.h"

namespace gomoku {

// Outcome of one search frame.  hasMove is false for terminal and horizon
// nodes, and for a frame with no candidates.
struct SearchResult {
    bool hasMove = false;
    Move move;
    int  score = 0;
};

class SearchEngine {
public:
    static constexpr int kWinScore  = 1'000'000;
    static constexpr int kDrawScore = 0;
    static constexpr int kInfinity  = std::numeric_limits<int>::max();

    // Seeds the fallback RNG from std::random_device.
    SearchEngine();

    // Fixed seed for reproducible fallback choices.
    explicit SearchEngine(std::uint32_t seed);

    // Pick a move for player on board, searching depth plies.  The board is
    // restored to its original contents before returning.  If the search
    // yields no move (depth <= 0, or an already decided position), a uniformly
    // random candidate is returned instead.  Throws std::logic_error if the
    // board has no empty cell left.
    Move chooseMove(Board& board, Player player, int depth);

    // One minimax frame.
    //
    // Parameters:
    //   depth      - remaining plies.
    //   alpha,beta - current bounds, from rootPlayer's perspective.
    //   maximizing - true when rootPlayer is to move in this frame.
    //   rootPlayer - the player the whole search is scoring for.
    //
    // Terminal checks run before the depth check: a root win returns
    // +kWinScore, a root loss -kWinScore, a draw kDrawScore, and depth <= 0
    // the static evaluation.  Among equally scored children the first one
    // searched is kept.
    SearchResult alphaBeta(Board& board,
                           int    depth,
                           int    alpha,
                           int    beta,
                           bool   maximizing,
                           Player rootPlayer);

    // Stable sort by Manhattan distance to the board centre, closest first.
    static void orderMoves(std::vector<Move>& moves);

    // Nodes visited since the last chooseMove() (or construction).
    std::uint64_t nodes() const { return nodes_; }

    const Evaluator& evaluator() const { return evaluator_; }

private:
    Move randomCandidate(const Board& board);

    Evaluator     evaluator_;
    std::mt19937  rng_;
    std::uint64_t nodes_ = 0;

    // Places a stone for the lifetime of the guard and clears the cell on
    // destruction, so every exit from a search frame restores the board.
    class MoveGuard {
    public:
        MoveGuard(Board& board, const Move& move, Player player)
            : board_(board), move_(move), valid_(board_.placeStone(move.row, move.col, player)) {}

        ~MoveGuard() {
            if (valid_) {
                board_.removeStone(move_.row, move_.col);
            }
        }

        MoveGuard(const MoveGuard&) = delete;
        MoveGuard& operator=(const MoveGuard&) = delete;

        bool isValid() const { return valid_; }

    private:
        Board& board_;
        Move   move_;
        bool   valid_;
    };
};

} // namespace gomoku

#endif // GOMOKU_SEARCH_H
