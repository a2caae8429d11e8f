// evaluator.h
// Static positional evaluation for Gomoku.
//
// The board is scored by sliding a window of kWinLength cells over every
// anchor cell in each of the four directions.  A window that leaves the
// board or holds an opponent stone is ignored; otherwise its own-stone count
// and the number of open ends just outside it are converted to points by
// lineScore().  Overlapping windows are all counted, so positions with many
// strong lines at once are rewarded.

#ifndef GOMOKU_EVALUATOR_H
#define GOMOKU_EVALUATOR_H

#include "board.h"

namespace gomoku {

class Evaluator {
public:
    // Pattern table entries.
    static constexpr int kScoreFive      = 100'000;
    static constexpr int kScoreOpenFour  = 10'000;
    static constexpr int kScoreFour      = 1'000;
    static constexpr int kScoreOpenThree = 500;
    static constexpr int kScoreThree     = 100;
    static constexpr int kScoreOpenTwo   = 10;
    static constexpr int kScoreTwo       = 2;

    // Points for a window holding count own stones with openEnds (0..2)
    // empty cells bordering it.
    static int lineScore(int count, int openEnds);

    // Sum of lineScore() over every qualifying window for player.
    int evaluateFor(const Board& board, Player player) const;

    // evaluateFor(player) minus evaluateFor(opponent).  Positive values
    // favour player.
    int evaluate(const Board& board, Player player) const;
};

// Convenience wrappers around a default Evaluator.
int evaluateFor(const Board& board, Player player);
int evaluate(const Board& board, Player player);

} // namespace gomoku

#endif // GOMOKU_EVALUATOR_H
