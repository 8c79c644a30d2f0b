#include "core/MoveStrategy.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <random>
#include <vector>

namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

std::optional<int> FirstOpenStrategy::select(const Board& board, char /*mark*/) {
    for (int idx = 0; idx < Board::kCells; ++idx) {
        if (board.IsLegal(idx)) {
            return idx;
        }
    }
    return std::nullopt;
}

std::string FirstOpenStrategy::Name() const {
    return "first-open";
}

RandomStrategy::RandomStrategy() : rng(std::random_device{}()) {}

RandomStrategy::RandomStrategy(unsigned seed) : rng(seed) {}

//Random selection from the available moves list
std::optional<int> RandomStrategy::select(const Board& board, char /*mark*/) {
    std::vector<int> moves = board.AvailableMoves();
    if (moves.empty()) return std::nullopt;
    std::uniform_int_distribution<std::size_t> pick(0, moves.size() - 1);
    return moves[pick(rng)];
}

std::string RandomStrategy::Name() const {
    return "random";
}

WeightedStrategy::WeightedStrategy() : rng(std::random_device{}()) {
    Reseed();
}

WeightedStrategy::WeightedStrategy(unsigned seed) : rng(seed) {
    Reseed();
}

void WeightedStrategy::Reseed() {
    std::array<int, 4> corners = kCorners;
    std::array<int, 4> edges = kEdges;
    std::shuffle(corners.begin(), corners.end(), rng);
    std::shuffle(edges.begin(), edges.end(), rng);

    sequence.clear();
    sequence.push_back(kCenter);
    sequence.insert(sequence.end(), corners.begin(), corners.end());
    sequence.insert(sequence.end(), edges.begin(), edges.end());
    ++reseeds;
}

std::optional<int> WeightedStrategy::select(const Board& board, char /*mark*/) {
    // A full board would otherwise reseed forever.
    if (board.IsFull()) return std::nullopt;

    while (true) {
        while (!sequence.empty()) {
            const int idx = sequence.front();
            sequence.pop_front();
            if (board.IsLegal(idx)) {
                return idx;
            }
        }
        Reseed();
    }
}

std::string WeightedStrategy::Name() const {
    return "weighted";
}

const std::deque<int>& WeightedStrategy::Pending() const {
    return sequence;
}

int WeightedStrategy::Reseeds() const {
    return reseeds;
}

std::optional<StrategyKind> ParseStrategyKind(const std::string& text) {
    const std::string key = lowercase(text);
    if (key == "f" || key == "first" || key == "first-open") return StrategyKind::FirstOpen;
    if (key == "r" || key == "random") return StrategyKind::Random;
    if (key == "w" || key == "weighted") return StrategyKind::Weighted;
    return std::nullopt;
}

std::string ToString(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::FirstOpen: return "first-open";
        case StrategyKind::Random: return "random";
        case StrategyKind::Weighted: return "weighted";
    }
    return "unknown";
}

std::unique_ptr<IMoveStrategy> MakeStrategy(StrategyKind kind, std::optional<unsigned> seed) {
    switch (kind) {
        case StrategyKind::FirstOpen:
            return std::make_unique<FirstOpenStrategy>();
        case StrategyKind::Random:
            return seed ? std::make_unique<RandomStrategy>(*seed) : std::make_unique<RandomStrategy>();
        case StrategyKind::Weighted:
            return seed ? std::make_unique<WeightedStrategy>(*seed) : std::make_unique<WeightedStrategy>();
    }
    throw std::invalid_argument("MakeStrategy: unknown strategy kind");
}
