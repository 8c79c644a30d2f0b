#pragma once
#include <memory>
#include <optional>
#include <string>
#include "core/Board.hpp"
#include "core/MoveStrategy.hpp"

/**
 * Source of moves for a human seat.
 *
 * Implementations must only return legal indices; re-prompting on bad input is their job.
 */
class IMoveInput {
    public:
        /// Blocks until a legal move for mark is available.
        virtual int RequestMove(const Board& board, char mark) = 0;
        virtual ~IMoveInput() = default;
};

/**
 * Player base interface.
 */
class Player {
    public:
        /// Chooses a move for the current board. Never mutates it.
        virtual std::optional<int> ChooseMove(const Board& board)=0;
        /// Returns the mark placed by this player.
        virtual char Symbol() const = 0;
        /// Human readable description, e.g. "human" or "AI (weighted)".
        virtual std::string Describe() const = 0;
        /// Virtual destructor for safe polymorphic cleanup.
        virtual ~Player() = default;
};

/**
 * Human player fed by an input collaborator.
 */
class HumanPlayer: public Player {
    char symbol; // immutable identity
    IMoveInput& input;
    public:
    /// Creates a human player; input must outlive the player.
    HumanPlayer(char symbol, IMoveInput& input);
    /// Forwards to the input collaborator.
    std::optional<int> ChooseMove(const Board& board) override;
    char Symbol() const override;
    std::string Describe() const override;
};

/**
 * AI player driven by a move strategy.
 */
class AIPlayer : public Player {
    char symbol;
    std::unique_ptr<IMoveStrategy> strategy;
    bool logMoves{true};
public:
    /// Creates an AI player with a default FirstOpenStrategy.
    explicit AIPlayer(char symbol);
    /// Creates an AI player with a provided strategy.
    AIPlayer(char symbol, std::unique_ptr<IMoveStrategy> s);
    /// Delegates move selection to the strategy.
    std::optional<int> ChooseMove(const Board& board) override;
    char Symbol() const override;
    std::string Describe() const override;
    /// Enables or disables the "[AI]" log lines.
    void SetLogMoves(bool enable);
    /// Returns a mutable pointer to the strategy.
    IMoveStrategy* Strategy();
    /// Returns a const pointer to the strategy.
    const IMoveStrategy* Strategy() const;
};

/// Seat kinds selectable from the command line or a prompt.
enum class SeatKind { Human, FirstOpen, Random, Weighted };

/// Parses "h"/"human" plus every form accepted by ParseStrategyKind.
std::optional<SeatKind> ParseSeatKind(const std::string& text);

/**
 * Builds a seat. input is required for SeatKind::Human and ignored otherwise.
 *
 * Throws std::invalid_argument when a human seat has no input.
 */
std::unique_ptr<Player> MakePlayer(SeatKind kind, char symbol, IMoveInput* input,
                                   std::optional<unsigned> seed = std::nullopt);
