#include "cli/ConsoleIO.hpp"
#include <limits>
#include <stdexcept>

ConsoleInput::ConsoleInput(std::istream& in, std::ostream& out) : in(in), out(out) {}

int ConsoleInput::RequestMove(const Board& board, char mark) {
    while (true) {
        out << "Enter your move (" << mark << "): ";
        int move = -1;
        if (!(in >> move)) {
            if (in.eof()) {
                throw std::runtime_error("Failed to read move input");
            }
            // Not a number: drop the rest of the line.
            in.clear();
            in.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
            out << "Invalid move. Try again.\n";
            continue;
        }
        if (board.IsLegal(move)) {
            return move;
        }
        out << "Invalid move. Try again.\n";
    }
}

ConsoleDisplay::ConsoleDisplay(std::ostream& out) : out(out) {}

void ConsoleDisplay::ShowBoard(const Board& board) {
    board.print(out);
}

void ConsoleDisplay::ShowResult(const MatchResult& result) {
    if (result.status == MatchStatus::Won && result.winner) {
        out << *result.winner << " wins!\n";
    } else if (result.status == MatchStatus::Drawn) {
        out << "It's a draw!\n";
    }
}
