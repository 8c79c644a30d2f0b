#include "core/Board.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <type_traits>

namespace {
// Rows, columns, diagonals.
constexpr int Lines[8][3] = {
    {0, 1, 2}, {3, 4, 5}, {6, 7, 8},
    {0, 3, 6}, {1, 4, 7}, {2, 5, 8},
    {0, 4, 8}, {2, 4, 6}
};

template <typename T, typename = std::enable_if_t<std::is_integral<T>::value>>
bool InRange(T value, T minValue, T maxValue) {
    return value >= minValue && value < maxValue;
}
} // namespace

Board::Board() {
    cells.fill(kEmpty);
}

Board Board::FromString(const std::string& text) {
    if (text.size() != static_cast<std::size_t>(kCells)) {
        throw std::invalid_argument("Board::FromString expects 9 cells, got " +
                                    std::to_string(text.size()));
    }
    Board b;
    for (int idx = 0; idx < kCells; ++idx) {
        const char c = text[idx];
        if (c == '_' || c == '.' || c == kEmpty) continue;
        b.cells[idx] = c;
    }
    return b;
}

bool Board::IsLegal(int idx) const {
    return InRange(idx, 0, kCells) && cells[idx] == kEmpty;
}

bool Board::IsFull() const {
    return std::none_of(cells.cbegin(), cells.cend(), [](char c) { return c == kEmpty; });
}

bool Board::IsEmpty() const {
    return MarksPlaced() == 0;
}

std::optional<char> Board::Winner() const {
    for (const auto& line : Lines) {
        const char first = cells[line[0]];
        if (first != kEmpty && first == cells[line[1]] && first == cells[line[2]]) {
            return first;
        }
    }
    return std::nullopt;
}

std::vector<int> Board::AvailableMoves() const {
    std::vector<int> moves;
    for (int idx = 0; idx < kCells; ++idx) {
        if (cells[idx] == kEmpty) {
            moves.push_back(idx);
        }
    }
    return moves;
}

char Board::At(int idx) const {
    if (!InRange(idx, 0, kCells)) {
        throw std::out_of_range("Board::At index out of range");
    }
    return cells[idx];
}

int Board::MarksPlaced() const {
    return static_cast<int>(
        std::count_if(cells.cbegin(), cells.cend(), [](char c) { return c != kEmpty; }));
}

void Board::place(int idx, char mark) {
    if (!InRange(idx, 0, kCells)) {
        throw std::out_of_range("Board::place index out of range: " + std::to_string(idx));
    }
    if (mark == kEmpty) {
        throw std::invalid_argument("Board::place cannot place an empty mark");
    }
    auto cell = cells.begin() + idx;
    if (*cell != kEmpty) {
        throw IllegalMoveError("Board::place cell " + std::to_string(idx) + " is occupied");
    }
    *cell = mark;
}

void Board::print(std::ostream& out) const {
    for (int idx = 0; idx < kCells; ++idx) {
        out << " " << cells[idx] << " ";
        if (idx % kSide == kSide - 1) {
            out << "\n";
            if (idx != kCells - 1) {
                out << "-----------\n";
            }
        } else {
            out << "|";
        }
    }
    out << "\n";
}
