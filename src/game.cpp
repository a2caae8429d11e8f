// game.cpp

#include "game.h"

#include "search.h"

namespace gomoku {

Game::Game() : side_to_move(Player::Black) {
}

void Game::play(const Move& move) {
    if (isOver()) {
        throw GameFinished();
    }
    board_.applyMove(move, side_to_move);
    history_.push_back(move);
    side_to_move = opponent(side_to_move);
}

Move Game::playEngineMove(SearchEngine& engine, int depth) {
    if (isOver()) {
        throw GameFinished();
    }
    // The engine restores the board, so it may search on ours directly.
    Move move = engine.chooseMove(board_, side_to_move, depth);
    play(move);
    return move;
}

bool Game::undo() {
    if (history_.empty()) {
        return false;
    }
    const Move last = history_.back();
    history_.pop_back();
    board_.removeStone(last.row, last.col);
    side_to_move = opponent(side_to_move);
    return true;
}

void Game::reset() {
    board_ = createBoard();
    side_to_move = Player::Black;
    history_.clear();
}

} // namespace gomoku
