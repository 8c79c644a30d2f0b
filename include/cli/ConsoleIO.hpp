#pragma once
#include <iostream>
#include "core/Match.hpp"
#include "core/Player.hpp"

/**
 * Reads moves 0-8 from a stream, re-prompting until the move is legal.
 */
class ConsoleInput : public IMoveInput {
public:
    ConsoleInput(std::istream& in = std::cin, std::ostream& out = std::cout);
    /// Throws std::runtime_error when the input stream ends.
    int RequestMove(const Board& board, char mark) override;

private:
    std::istream& in;
    std::ostream& out;
};

/**
 * Prints the board after each turn and the final outcome.
 */
class ConsoleDisplay : public IMatchDisplay {
public:
    explicit ConsoleDisplay(std::ostream& out = std::cout);
    void ShowBoard(const Board& board) override;
    void ShowResult(const MatchResult& result) override;

private:
    std::ostream& out;
};
