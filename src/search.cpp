#include "search.h"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>

namespace gomoku {

namespace {
    constexpr int kCentre = kBoardSize / 2;

    inline int centreDistance(const Move& m) {
        return std::abs(m.row - kCentre) + std::abs(m.col - kCentre);
    }
}

SearchEngine::SearchEngine() : rng_(std::random_device{}()) {
}

SearchEngine::SearchEngine(std::uint32_t seed) : rng_(seed) {
}

void SearchEngine::orderMoves(std::vector<Move>& moves) {
    // Candidates arrive in row-major order; a stable sort keeps that order
    // among moves at the same distance, which fixes tie-breaking.
    std::stable_sort(moves.begin(), moves.end(),
                     [](const Move& a, const Move& b) {
                         return centreDistance(a) < centreDistance(b);
                     });
}

SearchResult SearchEngine::alphaBeta(Board& board,
                                     int    depth,
                                     int    alpha,
                                     int    beta,
                                     bool   maximizing,
                                     Player rootPlayer) {
    ++nodes_;

    SearchResult result;

    // Terminal positions first, before looking at the depth.
    const Outcome outcome = board.gameOver();
    if (outcome.kind == Outcome::Kind::Win) {
        result.score = outcome.winner == rootPlayer ? kWinScore : -kWinScore;
        return result;
    }
    if (outcome.kind == Outcome::Kind::Draw) {
        result.score = kDrawScore;
        return result;
    }
    if (depth <= 0) {
        result.score = evaluator_.evaluate(board, rootPlayer);
        return result;
    }

    std::vector<Move> moves = board.getCandidateMoves();
    orderMoves(moves);

    const Player mover = maximizing ? rootPlayer : opponent(rootPlayer);

    if (maximizing) {
        int best = -kInfinity;
        for (const Move& m : moves) {
            int value;
            {
                MoveGuard guard(board, m, mover);
                if (!guard.isValid()) continue;
                value = alphaBeta(board, depth - 1, alpha, beta, false, rootPlayer).score;
            }
            if (value > best) {
                best           = value;
                result.hasMove = true;
                result.move    = m;
            }
            alpha = std::max(alpha, best);
            if (alpha >= beta) {
                break;
            }
        }
        result.score = best;
    } else {
        int best = kInfinity;
        for (const Move& m : moves) {
            int value;
            {
                MoveGuard guard(board, m, mover);
                if (!guard.isValid()) continue;
                value = alphaBeta(board, depth - 1, alpha, beta, true, rootPlayer).score;
            }
            if (value < best) {
                best           = value;
                result.hasMove = true;
                result.move    = m;
            }
            beta = std::min(beta, best);
            if (beta <= alpha) {
                break;
            }
        }
        result.score = best;
    }

    return result;
}

Move SearchEngine::chooseMove(Board& board, Player player, int depth) {
    nodes_ = 0;
    SearchResult result = alphaBeta(board, depth, -kInfinity, kInfinity,
                                    /*maximizing=*/true, player);
    if (result.hasMove) {
        return result.move;
    }
    return randomCandidate(board);
}

Move SearchEngine::randomCandidate(const Board& board) {
    std::vector<Move> moves = board.getCandidateMoves();
    if (moves.empty()) {
        throw std::logic_error("chooseMove: no empty cell left on the board");
    }
    std::uniform_int_distribution<std::size_t> pick(0, moves.size() - 1);
    return moves[pick(rng_)];
}

} // namespace gomoku
