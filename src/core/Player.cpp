#include "core/Player.hpp"
#include "core/MoveStrategy.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

HumanPlayer::HumanPlayer(char symbol, IMoveInput& input) : symbol(symbol), input(input) {}

char HumanPlayer::Symbol() const {
    return symbol;
}

std::string HumanPlayer::Describe() const {
    return "human";
}

std::optional<int> HumanPlayer::ChooseMove(const Board& board) {
    if (board.IsFull()) {
        return std::nullopt;
    }
    return input.RequestMove(board, symbol);
}

AIPlayer::AIPlayer(char symbol, std::unique_ptr<IMoveStrategy> s)
    : symbol(symbol), strategy(std::move(s)) {
    if (!strategy) {
        throw std::invalid_argument("AIPlayer requires a strategy");
    }
}

AIPlayer::AIPlayer(char symbol)
    : symbol(symbol), strategy(std::make_unique<FirstOpenStrategy>()) {}

char AIPlayer::Symbol() const {
    return symbol;
}

std::string AIPlayer::Describe() const {
    return "AI (" + strategy->Name() + ")";
}

// Delegate to configured strategy
std::optional<int> AIPlayer::ChooseMove(const Board& board) {
    if (logMoves) {
        std::cout << "[AI] " << symbol << " (" << strategy->Name() << ") is thinking...\n";
    }
    std::optional<int> move = strategy->select(board, symbol);
    if (logMoves) {
        if (move) {
            std::cout << "[AI] " << symbol << " plays cell " << *move << "\n";
        } else {
            std::cout << "[AI] " << symbol << " has no legal move\n";
        }
    }
    return move;
}

void AIPlayer::SetLogMoves(bool enable) {
    logMoves = enable;
}

IMoveStrategy* AIPlayer::Strategy() {
    return strategy.get();
}

const IMoveStrategy* AIPlayer::Strategy() const {
    return strategy.get();
}

std::optional<SeatKind> ParseSeatKind(const std::string& text) {
    std::string key = text;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (key == "h" || key == "human") return SeatKind::Human;

    const auto strategyKind = ParseStrategyKind(key);
    if (!strategyKind) return std::nullopt;
    switch (*strategyKind) {
        case StrategyKind::FirstOpen: return SeatKind::FirstOpen;
        case StrategyKind::Random: return SeatKind::Random;
        case StrategyKind::Weighted: return SeatKind::Weighted;
    }
    return std::nullopt;
}

std::unique_ptr<Player> MakePlayer(SeatKind kind, char symbol, IMoveInput* input,
                                   std::optional<unsigned> seed) {
    switch (kind) {
        case SeatKind::Human:
            if (input == nullptr) {
                throw std::invalid_argument("MakePlayer: human seat needs an input source");
            }
            return std::make_unique<HumanPlayer>(symbol, *input);
        case SeatKind::FirstOpen:
            return std::make_unique<AIPlayer>(symbol, MakeStrategy(StrategyKind::FirstOpen, seed));
        case SeatKind::Random:
            return std::make_unique<AIPlayer>(symbol, MakeStrategy(StrategyKind::Random, seed));
        case SeatKind::Weighted:
            return std::make_unique<AIPlayer>(symbol, MakeStrategy(StrategyKind::Weighted, seed));
    }
    throw std::invalid_argument("MakePlayer: unknown seat kind");
}
