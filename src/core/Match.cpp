#include "core/Match.hpp"
#include <iostream>
#include <string>
#include <utility>

Match::Match(std::unique_ptr<Player> first, std::unique_ptr<Player> second, const Board& start)
    : board(start), seats{{std::move(first), std::move(second)}} {
    if (!seats[0] || !seats[1]) {
        throw MatchSetupError("Match requires two seats");
    }
    if (seats[0]->Symbol() == Board::kEmpty || seats[1]->Symbol() == Board::kEmpty) {
        throw MatchSetupError("Match seats cannot use the empty cell as their mark");
    }
    if (seats[0]->Symbol() == seats[1]->Symbol()) {
        throw MatchSetupError(std::string("Both seats use the mark '") + seats[0]->Symbol() + "'");
    }
    if (!board.IsEmpty()) {
        throw MatchSetupError("Match must start from an empty board");
    }
}

MatchStatus Match::Step() {
    if (status != MatchStatus::Ongoing) {
        throw std::logic_error("Match::Step called on a finished match");
    }

    Player& player = *seats[turn];
    const std::optional<int> move = player.ChooseMove(board);
    if (!move) {
        throw IllegalMoveError(std::string("Seat ") + player.Symbol() + " returned no move");
    }
    if (!board.IsLegal(*move)) {
        throw IllegalMoveError(std::string("Seat ") + player.Symbol() +
                               " requested illegal cell " + std::to_string(*move));
    }

    board.place(*move, player.Symbol());
    history.push_back(*move);
    if (logTurns) {
        std::cout << "[Match] " << player.Symbol() << " -> " << *move << "\n";
    }

    if (const auto mark = board.Winner()) {
        status = MatchStatus::Won;
        winner = mark;
    } else if (board.IsFull()) {
        status = MatchStatus::Drawn;
    } else {
        turn = 1 - turn;
    }
    return status;
}

MatchResult Match::Play(IMatchDisplay* display) {
    if (display) display->ShowBoard(board);
    while (status == MatchStatus::Ongoing) {
        Step();
        if (display) display->ShowBoard(board);
    }
    MatchResult result = Result();
    if (display) display->ShowResult(result);
    return result;
}

void Match::Reset() {
    board = Board();
    turn = 0;
    status = MatchStatus::Ongoing;
    winner.reset();
    history.clear();
}

MatchStatus Match::Status() const {
    return status;
}

std::optional<char> Match::WinnerMark() const {
    return winner;
}

MatchResult Match::Result() const {
    return MatchResult{status, winner, history};
}

const Board& Match::GetBoard() const {
    return board;
}

const Player& Match::Current() const {
    return *seats[turn];
}

const Player& Match::Seat(int index) const {
    if (index < 0 || index > 1) {
        throw std::out_of_range("Match::Seat index must be 0 or 1");
    }
    return *seats[index];
}

const std::vector<int>& Match::History() const {
    return history;
}

void Match::SetLogTurns(bool enable) {
    logTurns = enable;
}

std::string ToString(MatchStatus status) {
    switch (status) {
        case MatchStatus::Ongoing: return "ongoing";
        case MatchStatus::Won: return "won";
        case MatchStatus::Drawn: return "drawn";
    }
    return "unknown";
}
