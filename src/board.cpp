// board.cpp
// Implementation of the bitboard Board, the five-in-a-row detector and the
// neighbourhood move generator.

#include "board.h"

namespace gomoku {

namespace {
    std::string describeMove(InvalidMove::Reason reason, const Move& move) {
        return std::string("invalid move (") + std::to_string(move.row) + "," +
               std::to_string(move.col) + "): " + toString(reason);
    }
}

// =====================
// InvalidMove
// =====================

InvalidMove::InvalidMove(Reason reason, const Move& move)
    : std::runtime_error(describeMove(reason, move)),
      reason_(reason),
      move_(move)
{
}

const char* toString(InvalidMove::Reason reason) {
    switch (reason) {
        case InvalidMove::Reason::OutOfBounds:
            return "out of bounds";
        case InvalidMove::Reason::Occupied:
            return "cell occupied";
    }
    return "unknown";
}

// =====================
// Board
// =====================

Board::Board() {
    for (auto& side : bb) {
        side.fill(0);
    }
}

Board createBoard() {
    return Board();
}

bool Board::isOccupied(int row, int col) const {
    int idx = index(row, col);
    return testBit(0, idx) || testBit(1, idx);
}

CellState Board::getCellState(int row, int col) const {
    int idx = index(row, col);
    if (testBit(0, idx)) return CellState::Black;
    if (testBit(1, idx)) return CellState::White;
    return CellState::Empty;
}

bool Board::isEmpty() const {
    for (int c = 0; c < kChunks; ++c) {
        if ((bb[0][c] | bb[1][c]) != 0) return false;
    }
    return true;
}

bool Board::isFull() const {
    return countStones(Player::Black) + countStones(Player::White) == kCells;
}

int Board::countStones(Player player) const {
    int p = static_cast<int>(player);
    int total = 0;
    for (int c = 0; c < kChunks; ++c) {
        std::uint64_t bits = bb[p][c];
        // Kernighan popcount; the board is small enough that this is cheap.
        while (bits) {
            bits &= bits - 1;
            ++total;
        }
    }
    return total;
}

bool Board::placeStone(int row, int col, Player player) {
    int idx = index(row, col);
    if (testBit(0, idx) || testBit(1, idx)) {
        return false;
    }
    int p = static_cast<int>(player);
    bb[p][chunkOf(idx)] |= (1ULL << offsetOf(idx));
    return true;
}

bool Board::removeStone(int row, int col) {
    int idx = index(row, col);
    std::uint64_t mask = 1ULL << offsetOf(idx);
    int chunk = chunkOf(idx);
    bool had = ((bb[0][chunk] | bb[1][chunk]) & mask) != 0;
    bb[0][chunk] &= ~mask;
    bb[1][chunk] &= ~mask;
    return had;
}

void Board::applyMove(const Move& move, Player player) {
    if (!inBounds(move.row, move.col)) {
        throw InvalidMove(InvalidMove::Reason::OutOfBounds, move);
    }
    if (!placeStone(move.row, move.col, player)) {
        throw InvalidMove(InvalidMove::Reason::Occupied, move);
    }
}

// =====================
// Win / draw detection
// =====================

bool Board::checkFive(int row, int col, Player player) const {
    const CellState mine = stoneOf(player);
    for (const auto& dir : kDirections) {
        int count = 1;
        for (int sign = 1; sign >= -1; sign -= 2) {
            int r = row + dir[0] * sign;
            int c = col + dir[1] * sign;
            while (inBounds(r, c) && getCellState(r, c) == mine) {
                ++count;
                r += dir[0] * sign;
                c += dir[1] * sign;
            }
        }
        if (count >= kWinLength) {
            return true;
        }
    }
    return false;
}

Outcome Board::gameOver() const {
    for (int row = 0; row < kBoardSize; ++row) {
        for (int col = 0; col < kBoardSize; ++col) {
            CellState state = getCellState(row, col);
            if (state == CellState::Empty) continue;
            Player owner = (state == CellState::Black) ? Player::Black : Player::White;
            if (checkFive(row, col, owner)) {
                return Outcome::winFor(owner);
            }
        }
    }
    if (isFull()) {
        return Outcome::draw();
    }
    return Outcome::inProgress();
}

// =====================
// Move generation
// =====================

std::vector<Move> Board::getCandidateMoves() const {
    std::vector<Move> moves;
    if (isEmpty()) {
        moves.emplace_back(kBoardSize / 2, kBoardSize / 2);
        return moves;
    }

    // Mark each empty neighbour once, then collect in row-major order.
    std::array<bool, kCells> marked{};
    for (int row = 0; row < kBoardSize; ++row) {
        for (int col = 0; col < kBoardSize; ++col) {
            if (!isOccupied(row, col)) continue;
            for (int dr = -1; dr <= 1; ++dr) {
                for (int dc = -1; dc <= 1; ++dc) {
                    int r = row + dr;
                    int c = col + dc;
                    if (inBounds(r, c) && !isOccupied(r, c)) {
                        marked[index(r, c)] = true;
                    }
                }
            }
        }
    }

    for (int idx = 0; idx < kCells; ++idx) {
        if (marked[idx]) {
            moves.emplace_back(idx / kBoardSize, idx % kBoardSize);
        }
    }
    return moves;
}

std::string Board::toString() const {
    std::string out;
    out.reserve(kCells + kBoardSize);
    for (int row = 0; row < kBoardSize; ++row) {
        for (int col = 0; col < kBoardSize; ++col) {
            switch (getCellState(row, col)) {
                case CellState::Empty: out += '.'; break;
                case CellState::Black: out += 'X'; break;
                case CellState::White: out += 'O'; break;
            }
        }
        out += '\n';
    }
    return out;
}

bool Board::operator==(const Board& other) const {
    return bb == other.bb;
}

} // namespace gomoku
