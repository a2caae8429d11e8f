// evaluator.cpp
// Window-based pattern evaluation.

#include "evaluator.h"

namespace gomoku {

int Evaluator::lineScore(int count, int openEnds) {
    // A completed five wins regardless of its surroundings; a shape with no
    // open end can never grow into one and is worth nothing.
    if (count >= kWinLength) {
        return kScoreFive;
    }
    if (openEnds <= 0) {
        return 0;
    }
    const bool open = (openEnds >= 2);
    switch (count) {
        case 4: return open ? kScoreOpenFour  : kScoreFour;
        case 3: return open ? kScoreOpenThree : kScoreThree;
        case 2: return open ? kScoreOpenTwo   : kScoreTwo;
        default: return 0;
    }
}

int Evaluator::evaluateFor(const Board& board, Player player) const {
    const CellState mine = stoneOf(player);
    int score = 0;

    for (int row = 0; row < kBoardSize; ++row) {
        for (int col = 0; col < kBoardSize; ++col) {
            for (const auto& dir : kDirections) {
                // The whole window must fit on the board.
                const int lastRow = row + dir[0] * (kWinLength - 1);
                const int lastCol = col + dir[1] * (kWinLength - 1);
                if (!inBounds(lastRow, lastCol)) {
                    continue;
                }

                int count = 0;
                bool blocked = false;
                for (int i = 0; i < kWinLength; ++i) {
                    CellState cell = board.getCellState(row + dir[0] * i, col + dir[1] * i);
                    if (cell == mine) {
                        ++count;
                    } else if (cell != CellState::Empty) {
                        blocked = true;
                        break;
                    }
                }
                if (blocked) {
                    continue;
                }

                int openEnds = 0;
                const int beforeRow = row - dir[0];
                const int beforeCol = col - dir[1];
                const int afterRow  = row + dir[0] * kWinLength;
                const int afterCol  = col + dir[1] * kWinLength;
                if (inBounds(beforeRow, beforeCol) &&
                    board.getCellState(beforeRow, beforeCol) == CellState::Empty) {
                    ++openEnds;
                }
                if (inBounds(afterRow, afterCol) &&
                    board.getCellState(afterRow, afterCol) == CellState::Empty) {
                    ++openEnds;
                }

                score += lineScore(count, openEnds);
            }
        }
    }
    return score;
}

int Evaluator::evaluate(const Board& board, Player player) const {
    return evaluateFor(board, player) - evaluateFor(board, opponent(player));
}

int evaluateFor(const Board& board, Player player) {
    return Evaluator().evaluateFor(board, player);
}

int evaluate(const Board& board, Player player) {
    return Evaluator().evaluate(board, player);
}

} // namespace gomoku
