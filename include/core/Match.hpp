#pragma once
#include <array>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "core/Board.hpp"
#include "core/Player.hpp"

/**
 * Raised when a match is built from seats or a board that cannot start a game.
 */
class MatchSetupError : public std::invalid_argument {
public:
    explicit MatchSetupError(const std::string& what) : std::invalid_argument(what) {}
};

enum class MatchStatus { Ongoing, Won, Drawn };

/**
 * Outcome summary of a match.
 */
struct MatchResult {
    MatchStatus status{MatchStatus::Ongoing};
    std::optional<char> winner;
    std::vector<int> moves;
};

/**
 * Receives read-only snapshots from Match::Play.
 */
class IMatchDisplay {
    public:
        /// Called before the first turn and after every applied move.
        virtual void ShowBoard(const Board& board) = 0;
        /// Called once when the match reaches Won or Drawn.
        virtual void ShowResult(const MatchResult& result) = 0;
        virtual ~IMatchDisplay() = default;
};

/**
 * Two-seat tic-tac-toe match.
 *
 * Owns the board and both seats. Seats only propose moves; the match validates
 * and applies them, then checks for a win before checking for a draw.
 */
class Match {
public:
    /// Throws MatchSetupError on null seats, duplicate or blank marks, or a non-empty board.
    Match(std::unique_ptr<Player> first, std::unique_ptr<Player> second, const Board& start = Board());

    /// Plays one turn and returns the new status.
    MatchStatus Step();
    /// Steps until the match is over. display may be null.
    MatchResult Play(IMatchDisplay* display = nullptr);
    /// Clears the board and gives the turn back to the first seat.
    void Reset();

    MatchStatus Status() const;
    /// Winning mark when Status() == Won.
    std::optional<char> WinnerMark() const;
    MatchResult Result() const;
    const Board& GetBoard() const;
    /// Seat to move next.
    const Player& Current() const;
    const Player& Seat(int index) const;
    /// Moves applied so far, oldest first.
    const std::vector<int>& History() const;
    /// Enables or disables the "[Match]" log lines.
    void SetLogTurns(bool enable);

private:
    Board board;
    std::array<std::unique_ptr<Player>, 2> seats;
    int turn{0};
    MatchStatus status{MatchStatus::Ongoing};
    std::optional<char> winner;
    std::vector<int> history;
    bool logTurns{false};
};

/// "ongoing", "won" or "drawn".
std::string ToString(MatchStatus status);
