#include "ui/TicTacToeUI.hpp"

#include <iostream>
#include <string>

int main() {
    std::string choice;
    std::cout << "Play against first-open (f), random (r) or weighted (w) AI? [w]: ";
    if (!std::getline(std::cin, choice)) {
        choice.clear();
    }

    SeatKind opponent = SeatKind::Weighted;
    if (!choice.empty()) {
        const auto parsed = ParseSeatKind(choice);
        if (parsed && *parsed != SeatKind::Human) {
            opponent = *parsed;
        } else {
            std::cout << "Unknown choice '" << choice << "', using weighted\n";
        }
    }

    const float cellSize = 160.0f;
    try {
        TicTacToeUI game(opponent, cellSize);
        return game.run();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
