#pragma once

#include <SFML/Graphics.hpp>
#include <optional>
#include <vector>

#include "core/Board.hpp"
#include "core/Match.hpp"
#include "core/Player.hpp"
#include "ui/CellTile.hpp"

/**
 * Move source for the mouse-driven seat: holds the last clicked cell until the match consumes it.
 */
class ClickInput : public IMoveInput {
public:
    void Push(int idx);
    bool HasPending() const;
    void Clear();
    /// Throws std::logic_error when no click is pending.
    int RequestMove(const Board& board, char mark) override;

private:
    std::optional<int> pending_;
};

class TicTacToeUI {
public:
    TicTacToeUI(SeatKind opponent, float cellSize);

    int run();

private:
    void buildLayout();
    void updateTileColors();
    void handleClick(const sf::Vector2f& pos);
    void playAiTurn();
    int pickTileIndex(const sf::Vector2f& pos) const;
    void updateWindowTitle(sf::RenderWindow& window) const;
    void updateHover(const sf::RenderWindow& window);
    void printBoardStatus() const;
    void resetGame();
    bool humanToMove() const;

    float cellSize_ = 0.0f;
    sf::Vector2u windowSize_{0, 0};

    ClickInput clicks_;
    Match match_;
    int hoveredIndex_ = -1;

    std::vector<CellTile> tiles_;
};
