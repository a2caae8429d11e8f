#include "protocol.h"

#include <exception>
#include <iostream>

namespace gomoku {

const char* playerName(Player p) {
    return p == Player::Black ? "black" : "white";
}

std::string describeOutcome(const Outcome& outcome) {
    switch (outcome.kind) {
        case Outcome::Kind::Win:
            return std::string("WIN ") + playerName(outcome.winner);
        case Outcome::Kind::Draw:
            return "DRAW";
        case Outcome::Kind::InProgress:
            break;
    }
    return "IN_PROGRESS";
}

Protocol::Protocol(int depth, std::ostream& out, std::ostream& log)
    : depth_(depth), out_(out), log_(log) {
}

Protocol::Protocol(int depth, std::uint32_t seed, std::ostream& out, std::ostream& log)
    : depth_(depth), out_(out), log_(log), engine_(seed) {
}

void Protocol::sendLog(std::string_view type, const std::string& msg) {
    log_ << type << " " << msg << std::endl;
}

void Protocol::sendError(const std::string& reason) {
    out_ << "ERROR " << reason << std::endl;
}

void Protocol::run(std::istream& in) {
    std::string token;
    while (in >> token) {
        if (!handleCommand(token, in)) {
            break;
        }
    }
}

bool Protocol::handleCommand(const std::string& token, std::istream& in) {
    if (token == "START") {
        handleStart(in);
        return static_cast<bool>(in);
    }
    if (token == "PLACE") {
        return handlePlace(in);
    }
    if (token == "TURN") {
        handleTurn();
        return true;
    }
    if (token == "BOARD") {
        handleBoard();
        return true;
    }
    if (token == "END") {
        return false;
    }
    // Unknown command; consume the rest of the line to avoid
    // desynchronization.
    std::string line;
    std::getline(in, line);
    sendLog("UNKNOWN", "command not implemented: " + token);
    return true;
}

void Protocol::handleStart(std::istream& in) {
    int field;
    if (!(in >> field)) return;
    myColor_ = (field == 1 ? Player::Black : Player::White);
    game_.reset();
    sendLog("MESSAGE", std::string("playing ") + playerName(myColor_) +
                       " at depth " + std::to_string(depth_));
    out_ << "OK" << std::endl;
}

bool Protocol::handlePlace(std::istream& in) {
    int r, c;
    if (!(in >> r >> c)) return false;
    // PLACE always carries the opponent's stone.
    if (game_.sideToMove() == myColor_) {
        sendLog("ERROR", "PLACE received while it is our turn");
        sendError("not opponent's turn");
        return true;
    }
    try {
        game_.play(Move(r, c));
    } catch (const InvalidMove& e) {
        sendLog("ERROR", e.what());
        sendError(toString(e.reason()));
    } catch (const GameFinished& e) {
        sendLog("ERROR", e.what());
        sendError(e.what());
    }
    return true;
}

void Protocol::handleTurn() {
    if (game_.sideToMove() != myColor_) {
        sendLog("ERROR", "TURN received while waiting for the opponent");
        sendError("not our turn");
        return;
    }
    try {
        Move m = game_.playEngineMove(engine_, depth_);
        sendLog("DEBUG", "nodes=" + std::to_string(engine_.nodes()));
        out_ << m.row << " " << m.col << std::endl;
    } catch (const std::exception& e) {
        sendLog("ERROR", e.what());
        sendError(e.what());
    }
}

void Protocol::handleBoard() {
    out_ << game_.board().toString();
    out_ << describeOutcome(game_.outcome()) << std::endl;
}

} // namespace gomoku
