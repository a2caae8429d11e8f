// protocol.h
// Line protocol between the engine and a match driver.  Commands are read
// from an input stream:
//   START <field>   - New game; field = 1 means we are black, 2 white.
//                     Respond with "OK".
//   PLACE r c       - The opponent has played at (r, c).
//   TURN            - Our move; printed as "r c".
//   BOARD           - Print the current position.
//   END             - Leave the loop.
// Rejected commands are answered with "ERROR <reason>" and the game goes on.
// Replies go to the output stream, typed log lines to the log stream.

#ifndef GOMOKU_PROTOCOL_H
#define GOMOKU_PROTOCOL_H

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

#include "game.h"
#include "search.h"

namespace gomoku {

class Protocol {
public:
    Protocol(int depth, std::ostream& out, std::ostream& log);

    // Fixed engine seed, for reproducible fallback choices.
    Protocol(int depth, std::uint32_t seed, std::ostream& out, std::ostream& log);

    // Process commands until END or end of input.
    void run(std::istream& in);

    const Game& game() const { return game_; }
    Player engineColor() const { return myColor_; }

private:
    // Returns false when the loop should stop.
    bool handleCommand(const std::string& token, std::istream& in);

    void handleStart(std::istream& in);
    bool handlePlace(std::istream& in);
    void handleTurn();
    void handleBoard();

    void sendLog(std::string_view type, const std::string& msg);
    void sendError(const std::string& reason);

    int           depth_;
    std::ostream& out_;
    std::ostream& log_;
    Game          game_;
    SearchEngine  engine_;
    Player        myColor_ = Player::Black;
};

const char* playerName(Player p);
std::string describeOutcome(const Outcome& outcome);

} // namespace gomoku

#endif // GOMOKU_PROTOCOL_H
