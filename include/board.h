// board.h
// Gomoku board representation using bitboards, plus the win/draw detector
// and the candidate move generator.

#ifndef GOMOKU_BOARD_H
#define GOMOKU_BOARD_H

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace gomoku {

// Fixed board geometry.
constexpr int kBoardSize = 15;
constexpr int kWinLength = 5;

// (row-delta, col-delta) for the four line directions:
// vertical, horizontal, diagonal down-right, diagonal down-left.
constexpr int kDirections[4][2] = { {1, 0}, {0, 1}, {1, 1}, {1, -1} };

// Representation of the two possible players.
enum class Player {
    Black = 0,
    White = 1
};

// Contents of a single cell.
enum class CellState {
    Empty = 0,
    Black = 1,
    White = 2
};

inline Player opponent(Player p) {
    return (p == Player::Black) ? Player::White : Player::Black;
}

inline CellState stoneOf(Player p) {
    return (p == Player::Black) ? CellState::Black : CellState::White;
}

inline bool inBounds(int row, int col) {
    return row >= 0 && row < kBoardSize && col >= 0 && col < kBoardSize;
}

// Simple struct to hold a move coordinate.
struct Move {
    int row;
    int col;
    Move(int r = 0, int c = 0) : row(r), col(c) {}

    // Order by (row,col) so sorting gives row-major order
    bool operator<(const Move& other) const {
        if (row != other.row) return row < other.row;
        return col < other.col;
    }

    bool operator==(const Move& other) const {
        return row == other.row && col == other.col;
    }

    bool operator!=(const Move& other) const {
        return !(*this == other);
    }
};

// Result of scanning a board for a finished game.
struct Outcome {
    enum class Kind {
        InProgress,
        Win,
        Draw
    };

    Kind   kind   = Kind::InProgress;
    Player winner = Player::Black;   // only meaningful when kind == Win

    static Outcome inProgress() { return Outcome(); }
    static Outcome draw() {
        Outcome o;
        o.kind = Kind::Draw;
        return o;
    }
    static Outcome winFor(Player p) {
        Outcome o;
        o.kind   = Kind::Win;
        o.winner = p;
        return o;
    }

    bool isWinFor(Player p) const { return kind == Kind::Win && winner == p; }

    bool operator==(const Outcome& other) const {
        if (kind != other.kind) return false;
        return kind != Kind::Win || winner == other.winner;
    }
    bool operator!=(const Outcome& other) const { return !(*this == other); }
};

// Thrown by the checked entry points when a caller-supplied move cannot be
// played.
class InvalidMove : public std::runtime_error {
public:
    enum class Reason {
        OutOfBounds,
        Occupied
    };

    InvalidMove(Reason reason, const Move& move);

    Reason reason() const { return reason_; }
    const Move& move() const { return move_; }

private:
    Reason reason_;
    Move   move_;
};

const char* toString(InvalidMove::Reason reason);

// Represents a 15×15 Gomoku board using bitboards.
class Board {
public:
    // Construct an empty board.
    Board();

    // Return true if the cell at (row,col) is occupied by any stone.
    bool isOccupied(int row, int col) const;

    // Return the occupant of the cell at (row,col).
    CellState getCellState(int row, int col) const;

    // True when no stone has been placed yet.
    bool isEmpty() const;

    // True when every cell holds a stone.
    bool isFull() const;

    // Utility to count how many stones a player has on the board.
    int countStones(Player player) const;

    // Place a stone for player without any validation.  Intended for the
    // search, which only ever places on cells returned by
    // getCandidateMoves().  Returns false if the cell was not empty.
    bool placeStone(int row, int col, Player player);

    // Clear the cell at (row,col).  Returns false if it was already empty.
    bool removeStone(int row, int col);

    // Checked placement for caller-supplied coordinates.  Throws
    // InvalidMove (OutOfBounds or Occupied) and leaves the board untouched
    // if the move cannot be played.
    void applyMove(const Move& move, Player player);

    // True if the stone at (row,col), assumed to belong to player, is part
    // of a line of at least kWinLength stones in any direction.
    bool checkFive(int row, int col, Player player) const;

    // Scan the board in row-major order for a completed five; report a
    // draw if none exists and the board is full.
    Outcome gameOver() const;

    // Empty cells in the Moore neighbourhood of any stone, de-duplicated and
    // in row-major order.  On an empty board returns only the centre cell.
    std::vector<Move> getCandidateMoves() const;

    // Text dump, one row per line: '.' empty, 'X' black, 'O' white.
    std::string toString() const;

    bool operator==(const Board& other) const;
    bool operator!=(const Board& other) const { return !(*this == other); }

private:
    static constexpr int kCells  = kBoardSize * kBoardSize;
    static constexpr int kChunks = (kCells + 63) / 64;

    // Convert a pair (row,col) into an index 0..224.
    static inline int index(int row, int col) { return row * kBoardSize + col; }

    // Convert index into chunk 0..3 and bit offset 0..63.
    static inline int chunkOf(int idx) { return idx >> 6; }
    static inline int offsetOf(int idx) { return idx & 63; }

    bool testBit(int p, int idx) const {
        return (bb[p][chunkOf(idx)] >> offsetOf(idx)) & 1ULL;
    }

    // Bitboards for black and white. bb[player][chunk] holds bits for that player.
    std::array<std::array<std::uint64_t, kChunks>, 2> bb;
};

// Fresh empty board.
Board createBoard();

} // namespace gomoku

#endif // GOMOKU_BOARD_H
