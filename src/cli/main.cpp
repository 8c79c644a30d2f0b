#include "cli/ConsoleIO.hpp"
#include "core/Board.hpp"
#include "core/Match.hpp"
#include "core/Player.hpp"
#include <iostream>
#include <optional>
#include <string>

namespace {

// Asks for a seat kind; empty or unreadable input keeps the default.
SeatKind PromptSeat(char symbol, SeatKind fallback, const std::string& fallbackLabel) {
    std::cout << "Player " << symbol
              << ": human (h), first-open (f), random (r) or weighted (w)? [" << fallbackLabel << "]: ";
    std::string answer;
    if (!std::getline(std::cin, answer) || answer.empty()) {
        std::cin.clear();
        return fallback;
    }
    const auto kind = ParseSeatKind(answer);
    if (!kind) {
        std::cout << "Unknown choice '" << answer << "', using " << fallbackLabel << "\n";
        return fallback;
    }
    return *kind;
}

bool AskPlayAgain() {
    std::cout << "Play again? [y/N]: ";
    std::string answer;
    if (!std::getline(std::cin >> std::ws, answer)) {
        return false;
    }
    return !answer.empty() && (answer[0] == 'y' || answer[0] == 'Y');
}

} // namespace

int main(int argc, char** argv) {
    try {
        // Default mirrors the classic setup: human X against first-open O.
        SeatKind seatX = SeatKind::Human;
        SeatKind seatO = SeatKind::FirstOpen;
        std::optional<unsigned> seed;

        if (argc >= 3) {
            const auto x = ParseSeatKind(argv[1]);
            const auto o = ParseSeatKind(argv[2]);
            if (!x || !o) {
                std::cerr << "Usage: " << argv[0] << " <seatX> <seatO> [seed]\n"
                          << "  seat: h(uman) | f(irst) | r(andom) | w(eighted)\n";
                return 1;
            }
            seatX = *x;
            seatO = *o;
            if (argc >= 4) {
                seed = static_cast<unsigned>(std::stoul(argv[3]));
            }
        } else {
            seatX = PromptSeat('X', SeatKind::Human, "h");
            seatO = PromptSeat('O', SeatKind::FirstOpen, "f");
        }

        ConsoleInput input;
        ConsoleDisplay display;
        std::optional<unsigned> seedO;
        if (seed) seedO = *seed + 1;
        Match match(MakePlayer(seatX, 'X', &input, seed), MakePlayer(seatO, 'O', &input, seedO));

        std::cout << "X: " << match.Seat(0).Describe() << " | O: " << match.Seat(1).Describe() << "\n";
        while (true) {
            match.Play(&display);
            if (!AskPlayAgain()) break;
            match.Reset();
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
