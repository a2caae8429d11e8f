#include <iostream>
#include <string>
#include <vector>

#include "board.h"

using namespace gomoku;

namespace {

struct TestRunner {
    int failures = 0;
    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "Test failed: " << msg << "\n";
        }
    }
};

void placeLine(Board &board, Player p, int row, int col, int dr, int dc, int length) {
    for (int i = 0; i < length; ++i) {
        board.placeStone(row + dr * i, col + dc * i, p);
    }
}

// Fills every cell with runs of at most two stones in any direction.
Board filledBoardWithoutFive() {
    Board board;
    for (int r = 0; r < kBoardSize; ++r) {
        for (int c = 0; c < kBoardSize; ++c) {
            Player p = ((c / 2 + r) % 2 == 0) ? Player::Black : Player::White;
            board.placeStone(r, c, p);
        }
    }
    return board;
}

} // namespace

void testEmptyBoard(TestRunner &tr) {
    Board board = createBoard();
    bool allEmpty = true;
    for (int r = 0; r < kBoardSize; ++r) {
        for (int c = 0; c < kBoardSize; ++c) {
            if (board.getCellState(r, c) != CellState::Empty) allEmpty = false;
        }
    }
    tr.check(allEmpty, "createBoard() should return a board with every cell empty.");
    tr.check(board.isEmpty(), "A new board should report isEmpty().");
    tr.check(!board.isFull(), "A new board is not full.");
    tr.check(board.countStones(Player::Black) == 0 && board.countStones(Player::White) == 0,
             "A new board holds no stones.");
    tr.check(board.gameOver() == Outcome::inProgress(), "An empty board is in progress.");
}

void testInBounds(TestRunner &tr) {
    tr.check(inBounds(0, 0), "(0,0) is on the board.");
    tr.check(inBounds(14, 14), "(14,14) is on the board.");
    tr.check(inBounds(0, 14) && inBounds(14, 0), "Corners are on the board.");
    tr.check(!inBounds(-1, 0) && !inBounds(0, -1), "Negative coordinates are off the board.");
    tr.check(!inBounds(15, 3) && !inBounds(3, 15), "Coordinate 15 is off the board.");
}

void testPlaceAndRemove(TestRunner &tr) {
    Board board;
    Board before = board;

    tr.check(board.placeStone(4, 9, Player::White), "Placing on an empty cell succeeds.");
    tr.check(board.getCellState(4, 9) == CellState::White, "Placed stone has the player's colour.");
    tr.check(board.isOccupied(4, 9), "Placed cell is occupied.");
    tr.check(!board.placeStone(4, 9, Player::Black), "Placing on an occupied cell is refused.");
    tr.check(board.getCellState(4, 9) == CellState::White, "A refused placement leaves the stone alone.");
    tr.check(board.countStones(Player::White) == 1, "One white stone on the board.");
    tr.check(board != before, "Board differs after a placement.");

    tr.check(board.removeStone(4, 9), "Removing an existing stone succeeds.");
    tr.check(!board.removeStone(4, 9), "Removing from an empty cell reports false.");
    tr.check(board == before, "Place followed by remove restores the board exactly.");
}

void testApplyMoveValidation(TestRunner &tr) {
    Board board;
    board.applyMove(Move(7, 7), Player::Black);
    tr.check(board.getCellState(7, 7) == CellState::Black, "applyMove places a valid stone.");

    Board snapshot = board;
    bool threw = false;
    try {
        board.applyMove(Move(15, 2), Player::White);
    } catch (const InvalidMove &e) {
        threw = true;
        tr.check(e.reason() == InvalidMove::Reason::OutOfBounds, "Off-board move reports OutOfBounds.");
        tr.check(e.move() == Move(15, 2), "InvalidMove carries the offending move.");
    }
    tr.check(threw, "applyMove must reject an out-of-bounds move.");
    tr.check(board == snapshot, "Rejected out-of-bounds move leaves the board unchanged.");

    threw = false;
    try {
        board.applyMove(Move(-1, 4), Player::White);
    } catch (const InvalidMove &e) {
        threw = e.reason() == InvalidMove::Reason::OutOfBounds;
    }
    tr.check(threw, "Negative coordinates are OutOfBounds.");

    threw = false;
    try {
        board.applyMove(Move(7, 7), Player::White);
    } catch (const InvalidMove &e) {
        threw = true;
        tr.check(e.reason() == InvalidMove::Reason::Occupied, "Occupied cell reports Occupied.");
    }
    tr.check(threw, "applyMove must reject an occupied cell.");
    tr.check(board == snapshot, "Rejected occupied move leaves the board unchanged.");
}

void testCheckFiveAllDirections(TestRunner &tr) {
    {
        Board board;
        placeLine(board, Player::Black, 7, 3, 0, 1, 5);
        tr.check(board.checkFive(7, 5, Player::Black), "Horizontal five detected from the middle.");
        tr.check(board.checkFive(7, 3, Player::Black), "Horizontal five detected from an end.");
    }
    {
        Board board;
        placeLine(board, Player::White, 0, 14, 1, 0, 5);
        tr.check(board.checkFive(4, 14, Player::White), "Vertical five on the edge detected.");
    }
    {
        Board board;
        placeLine(board, Player::Black, 2, 2, 1, 1, 5);
        tr.check(board.checkFive(4, 4, Player::Black), "Down-right diagonal five detected.");
    }
    {
        Board board;
        placeLine(board, Player::White, 10, 2, -1, 1, 5);
        tr.check(board.checkFive(8, 4, Player::White), "Up-right diagonal five detected.");
    }
    {
        Board board;
        placeLine(board, Player::Black, 0, 0, 0, 1, 6);
        tr.check(board.checkFive(0, 2, Player::Black), "An overline of six also counts as five.");
    }
    {
        Board board;
        placeLine(board, Player::Black, 7, 3, 0, 1, 4);
        tr.check(!board.checkFive(7, 4, Player::Black), "Four in a row is not a win.");
        board.placeStone(7, 7, Player::White);
        tr.check(!board.checkFive(7, 6, Player::Black), "An opponent stone ends the run.");
    }
}

void testGameOver(TestRunner &tr) {
    {
        Board board;
        placeLine(board, Player::White, 5, 5, 1, 1, 5);
        board.placeStone(0, 0, Player::Black);
        Outcome o = board.gameOver();
        tr.check(o.isWinFor(Player::White), "Diagonal white five is reported as a white win.");
        tr.check(!o.isWinFor(Player::Black), "White win is not a black win.");
    }
    {
        Board board;
        placeLine(board, Player::Black, 7, 3, 0, 1, 4);
        placeLine(board, Player::White, 8, 3, 0, 1, 4);
        tr.check(board.gameOver() == Outcome::inProgress(), "No five and empty cells means in progress.");
    }
    {
        Board board = filledBoardWithoutFive();
        tr.check(board.isFull(), "Fixture board is full.");
        tr.check(board.gameOver() == Outcome::draw(), "A full board without five is a draw.");
        tr.check(board.getCandidateMoves().empty(), "A full board has no candidate moves.");
    }
    {
        // Row-major scan order decides which win is reported first.
        Board board;
        placeLine(board, Player::White, 1, 0, 0, 1, 5);
        placeLine(board, Player::Black, 9, 0, 0, 1, 5);
        tr.check(board.gameOver().isWinFor(Player::White),
                 "The win found first in row-major order is reported.");
    }
}

void testOpenFourScenario(TestRunner &tr) {
    Board board;
    placeLine(board, Player::Black, 7, 3, 0, 1, 4);
    tr.check(board.gameOver() == Outcome::inProgress(), "Open four alone has not won yet.");

    Board right = board;
    right.placeStone(7, 7, Player::Black);
    tr.check(right.checkFive(7, 7, Player::Black), "Extending to (7,7) completes five.");
    tr.check(right.gameOver().isWinFor(Player::Black), "Game over reports a black win after (7,7).");

    Board left = board;
    left.placeStone(7, 2, Player::Black);
    tr.check(left.checkFive(7, 2, Player::Black), "Extending to (7,2) completes five.");
    tr.check(left.gameOver().isWinFor(Player::Black), "Game over reports a black win after (7,2).");
}

void testCandidateMoves(TestRunner &tr) {
    {
        Board board;
        std::vector<Move> moves = board.getCandidateMoves();
        tr.check(moves.size() == 1 && moves.front() == Move(7, 7),
                 "Empty board yields exactly the centre cell.");
    }
    {
        Board board;
        board.placeStone(7, 7, Player::Black);
        std::vector<Move> expected = {
            {6, 6}, {6, 7}, {6, 8}, {7, 6}, {7, 8}, {8, 6}, {8, 7}, {8, 8}
        };
        tr.check(board.getCandidateMoves() == expected,
                 "Single stone yields its eight neighbours in row-major order.");
    }
    {
        Board board;
        board.placeStone(0, 0, Player::White);
        std::vector<Move> expected = { {0, 1}, {1, 0}, {1, 1} };
        tr.check(board.getCandidateMoves() == expected, "Corner stone only has in-bounds neighbours.");
    }
    {
        Board board;
        board.placeStone(7, 7, Player::Black);
        board.placeStone(7, 8, Player::White);
        std::vector<Move> moves = board.getCandidateMoves();
        tr.check(moves.size() == 10, "Shared neighbours of two adjacent stones are listed once.");
        bool sorted = true;
        bool allEmpty = true;
        for (std::size_t i = 0; i < moves.size(); ++i) {
            if (i > 0 && !(moves[i - 1] < moves[i])) sorted = false;
            if (board.isOccupied(moves[i].row, moves[i].col)) allEmpty = false;
        }
        tr.check(sorted, "Candidates are strictly increasing in row-major order.");
        tr.check(allEmpty, "Candidates never include occupied cells.");
    }
}

void testToString(TestRunner &tr) {
    Board board;
    board.placeStone(0, 0, Player::Black);
    board.placeStone(0, 1, Player::White);
    std::string text = board.toString();
    tr.check(text.size() == static_cast<std::size_t>(kBoardSize * (kBoardSize + 1)),
             "Text dump has one line per row.");
    tr.check(text.compare(0, 3, "XO.") == 0, "Text dump shows black as X and white as O.");
}

int main() {
    TestRunner tr;
    testEmptyBoard(tr);
    testInBounds(tr);
    testPlaceAndRemove(tr);
    testApplyMoveValidation(tr);
    testCheckFiveAllDirections(tr);
    testGameOver(tr);
    testOpenFourScenario(tr);
    testCandidateMoves(tr);
    testToString(tr);

    if (tr.failures == 0) {
        std::cout << "All board tests passed." << std::endl;
        return 0;
    }
    std::cerr << tr.failures << " test(s) failed." << std::endl;
    return 1;
}
