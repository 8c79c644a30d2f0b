#pragma once
#include <array>
#include <deque>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include "core/Board.hpp"

/**
 *Strategy interface for selecting a move.
 *
 * Implementations only read the board. std::nullopt means the board has no legal move.
 */
class IMoveStrategy{
    public:
        /// Returns a legal cell index for mark, or std::nullopt on a full board.
        virtual std::optional<int> select(const Board& board, char mark) = 0;
        /// Short label used in logs.
        virtual std::string Name() const = 0;
        /// Virtual destructor for safe polymorphic cleanup.
        virtual ~IMoveStrategy() = default;
};

/**
 *  Picks the lowest-index open cell.
 */
class FirstOpenStrategy : public IMoveStrategy {
public:
    std::optional<int> select(const Board& board, char mark) override;
    std::string Name() const override;
};

/**
 *  Uniform random selection among the open cells.
 */
class RandomStrategy : public IMoveStrategy {
public:
    /// Seeds from std::random_device.
    RandomStrategy();
    /// Seeds with a fixed value for reproducible games.
    explicit RandomStrategy(unsigned seed);
    std::optional<int> select(const Board& board, char mark) override;
    std::string Name() const override;

private:
    std::mt19937 rng;
};

/**
 * Fixed priority strategy: center, then corners, then edges.
 *
 * Keeps a working queue between calls. Cells that are no longer legal are
 * discarded as they reach the front; an exhausted queue is rebuilt with fresh
 * shuffles of the corner and edge tiers.
 */
class WeightedStrategy : public IMoveStrategy {
public:
    static constexpr int kCenter = 4;
    static constexpr std::array<int, 4> kCorners{{0, 2, 6, 8}};
    static constexpr std::array<int, 4> kEdges{{1, 3, 5, 7}};

    WeightedStrategy();
    explicit WeightedStrategy(unsigned seed);
    std::optional<int> select(const Board& board, char mark) override;
    std::string Name() const override;

    /// Rebuilds the queue: center, shuffled corners, shuffled edges.
    void Reseed();
    /// Remaining queue, front first.
    const std::deque<int>& Pending() const;
    /// Number of times the queue has been built, including construction.
    int Reseeds() const;

private:
    std::mt19937 rng;
    std::deque<int> sequence;
    int reseeds{0};
};

/// Automated strategy variants available from configuration.
enum class StrategyKind { FirstOpen, Random, Weighted };

/// Parses "first"/"f", "random"/"r", "weighted"/"w" (case-insensitive).
std::optional<StrategyKind> ParseStrategyKind(const std::string& text);
/// Returns the canonical name of a strategy kind.
std::string ToString(StrategyKind kind);
/// Creates a strategy; seed is ignored by FirstOpen and random_device is used when absent.
std::unique_ptr<IMoveStrategy> MakeStrategy(StrategyKind kind, std::optional<unsigned> seed = std::nullopt);
