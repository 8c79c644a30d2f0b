#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "core/Board.hpp"
#include "core/Player.hpp"

// Replays a fixed list of moves; std::nullopt entries simulate a seat with nothing to offer.
class ScriptedPlayer : public Player {
public:
    ScriptedPlayer(char symbol, std::vector<std::optional<int>> moves)
        : symbol(symbol), moves(std::move(moves)) {}

    std::optional<int> ChooseMove(const Board&) override {
        if (next >= moves.size()) return std::nullopt;
        return moves[next++];
    }
    char Symbol() const override { return symbol; }
    std::string Describe() const override { return "scripted"; }

private:
    char symbol;
    std::vector<std::optional<int>> moves;
    std::size_t next{0};
};
