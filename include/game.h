// game.h
// Turn bookkeeping for a single game: the board, whose turn it is and the
// moves played so far.  Both human and engine moves go through play(), so
// the board only ever receives validated placements.

#ifndef GOMOKU_GAME_H
#define GOMOKU_GAME_H

#include <stdexcept>
#include <vector>

#include "board.h"

namespace gomoku {

class SearchEngine;

// Thrown when a move is attempted after the game has been decided.
class GameFinished : public std::logic_error {
public:
    GameFinished() : std::logic_error("game is already finished") {}
};

class Game {
public:
    // Empty board, Black to move.
    Game();

    const Board& board() const { return board_; }
    Player sideToMove() const { return side_to_move; }
    const std::vector<Move>& moveHistory() const { return history_; }

    Outcome outcome() const { return board_.gameOver(); }
    bool isOver() const { return outcome().kind != Outcome::Kind::InProgress; }

    // Play move for the side to move and pass the turn.  Throws InvalidMove
    // for an out-of-bounds or occupied cell and GameFinished if the game is
    // already decided; in both cases nothing changes.
    void play(const Move& move);

    // Let engine choose a move for the side to move at the given depth,
    // play it and return it.
    Move playEngineMove(SearchEngine& engine, int depth);

    // Take back the last move.  Returns false if no move has been played.
    bool undo();

    // Start over from the empty board.
    void reset();

private:
    Board             board_;
    Player            side_to_move;
    std::vector<Move> history_;
};

} // namespace gomoku

#endif // GOMOKU_GAME_H
