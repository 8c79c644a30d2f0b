#pragma once
#include <array>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * Raised when a move targets an occupied cell or is missing altogether.
 */
class IllegalMoveError : public std::logic_error {
public:
    explicit IllegalMoveError(const std::string& what) : std::logic_error(what) {}
};

/**
 * 3x3 tic-tac-toe grid stored as 9 linear cells (idx = r * 3 + c).
 */
class Board {
public:
    static constexpr int kSide = 3;
    static constexpr int kCells = kSide * kSide;
    static constexpr char kEmpty = ' ';

    /// Creates an empty board.
    Board();
    /// Builds a board from 9 characters; '_', '.' and ' ' mean empty.
    static Board FromString(const std::string& cells);

    /// True iff idx is in [0, 8] and the cell is empty.
    bool IsLegal(int idx) const;
    /// True when no empty cell remains.
    bool IsFull() const;
    /// True when no mark has been placed.
    bool IsEmpty() const;
    /// Returns the mark of the first complete line, if any.
    std::optional<char> Winner() const;
    /// Returns the empty cell indices in ascending order.
    std::vector<int> AvailableMoves() const;
    /// Returns the content of a cell.
    char At(int idx) const;
    /// Number of non-empty cells.
    int MarksPlaced() const;

    void place(int idx, char mark); // throws on range, occupied cell or empty mark
    void print(std::ostream& out = std::cout) const;

private:
    std::array<char, kCells> cells;
};
