#include "ui/TicTacToeUI.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

constexpr float kWindowMargin = 24.0f;
constexpr sf::Uint8 kHoverAlpha = 180;
constexpr char kHumanMark = 'X';
constexpr char kAiMark = 'O';

void ClickInput::Push(int idx) {
    pending_ = idx;
}

bool ClickInput::HasPending() const {
    return pending_.has_value();
}

void ClickInput::Clear() {
    pending_.reset();
}

int ClickInput::RequestMove(const Board& /*board*/, char /*mark*/) {
    if (!pending_) {
        throw std::logic_error("ClickInput::RequestMove without a pending click");
    }
    const int idx = *pending_;
    pending_.reset();
    return idx;
}

TicTacToeUI::TicTacToeUI(SeatKind opponent, float cellSize)
    : cellSize_(cellSize),
      match_(MakePlayer(SeatKind::Human, kHumanMark, &clicks_),
             MakePlayer(opponent == SeatKind::Human ? SeatKind::FirstOpen : opponent, kAiMark, nullptr)) {
    if (cellSize_ <= 0.0f) {
        throw std::invalid_argument("Cell size must be positive.");
    }
    match_.SetLogTurns(true);
    buildLayout();
    updateTileColors();
}

void TicTacToeUI::buildLayout() {
    tiles_.clear();
    for (int idx = 0; idx < Board::kCells; ++idx) {
        const int row = idx / Board::kSide;
        const int col = idx % Board::kSide;
        tiles_.emplace_back(
            sf::Vector2f(kWindowMargin + col * cellSize_, kWindowMargin + row * cellSize_),
            cellSize_);
    }
    const unsigned side = static_cast<unsigned>(2.0f * kWindowMargin + Board::kSide * cellSize_);
    windowSize_ = sf::Vector2u(side, side);
}

void TicTacToeUI::updateTileColors() {
    const sf::Color emptyColor(210, 210, 220);
    const sf::Color playerXColor(230, 140, 140);
    const sf::Color playerOColor(140, 170, 230);

    const Board& board = match_.GetBoard();
    for (int idx = 0; idx < Board::kCells; ++idx) {
        const char value = board.At(idx);
        sf::Color color = emptyColor;
        if (value == kHumanMark) {
            color = playerXColor;
        } else if (value == kAiMark) {
            color = playerOColor;
        }
        color.a = (idx == hoveredIndex_ && value == Board::kEmpty) ? kHoverAlpha : 255;
        tiles_[idx].setFillColor(color);
        tiles_[idx].setMark(value);
    }
}

bool TicTacToeUI::humanToMove() const {
    return match_.Status() == MatchStatus::Ongoing && match_.Current().Symbol() == kHumanMark;
}

void TicTacToeUI::handleClick(const sf::Vector2f& pos) {
    if (!humanToMove()) {
        return;
    }
    const int idx = pickTileIndex(pos);
    if (!match_.GetBoard().IsLegal(idx)) {
        return;
    }
    clicks_.Push(idx);
    match_.Step();
    updateTileColors();
    printBoardStatus();
}

void TicTacToeUI::playAiTurn() {
    if (match_.Status() != MatchStatus::Ongoing || humanToMove()) {
        return;
    }
    match_.Step();
    updateTileColors();
    printBoardStatus();
}

int TicTacToeUI::pickTileIndex(const sf::Vector2f& pos) const {
    for (int idx = 0; idx < static_cast<int>(tiles_.size()); ++idx) {
        if (tiles_[idx].contains(pos)) {
            return idx;
        }
    }
    return -1;
}

void TicTacToeUI::updateWindowTitle(sf::RenderWindow& window) const {
    switch (match_.Status()) {
        case MatchStatus::Won:
            window.setTitle(std::string("Tic-Tac-Toe - Winner ") + *match_.WinnerMark());
            return;
        case MatchStatus::Drawn:
            window.setTitle("Tic-Tac-Toe - Draw");
            return;
        case MatchStatus::Ongoing:
            break;
    }
    window.setTitle(std::string("Tic-Tac-Toe - Turn ") + match_.Current().Symbol());
}

void TicTacToeUI::updateHover(const sf::RenderWindow& window) {
    sf::Vector2i pixelPos = sf::Mouse::getPosition(window);
    if (pixelPos.x < 0 || pixelPos.y < 0 ||
        pixelPos.x >= static_cast<int>(window.getSize().x) ||
        pixelPos.y >= static_cast<int>(window.getSize().y)) {
        if (hoveredIndex_ != -1) {
            hoveredIndex_ = -1;
            updateTileColors();
        }
        return;
    }

    sf::Vector2f pos = window.mapPixelToCoords(pixelPos);
    int idx = pickTileIndex(pos);
    if (idx != hoveredIndex_) {
        hoveredIndex_ = idx;
        updateTileColors();
    }
}

void TicTacToeUI::printBoardStatus() const {
    match_.GetBoard().print();
    switch (match_.Status()) {
        case MatchStatus::Won:
            std::cout << *match_.WinnerMark() << " wins!\n";
            return;
        case MatchStatus::Drawn:
            std::cout << "It's a draw!\n";
            return;
        case MatchStatus::Ongoing:
            break;
    }
    std::cout << "Player " << match_.Current().Symbol() << " turn\n";
}

void TicTacToeUI::resetGame() {
    match_.Reset();
    clicks_.Clear();
    updateTileColors();
    std::cout << "[UI] New game\n";
    printBoardStatus();
}

int TicTacToeUI::run() {
    if (windowSize_.x == 0 || windowSize_.y == 0) {
        std::cerr << "Invalid window size.\n";
        return 1;
    }

    sf::RenderWindow window(
        sf::VideoMode(windowSize_.x, windowSize_.y),
        "Tic-Tac-Toe");
    window.setFramerateLimit(60);
    std::cout << "[UI] X: " << match_.Seat(0).Describe() << " | O: " << match_.Seat(1).Describe() << "\n";
    updateWindowTitle(window);
    printBoardStatus();

    while (window.isOpen()) {
        bool humanMovedThisFrame = false;
        sf::Event event;
        while (window.pollEvent(event)) {
            if (event.type == sf::Event::Closed ||
                (event.type == sf::Event::KeyPressed && event.key.code == sf::Keyboard::Escape)) {
                window.close();
            }
            if (event.type == sf::Event::KeyPressed && event.key.code == sf::Keyboard::R) {
                resetGame();
                updateWindowTitle(window);
            }
            if (event.type == sf::Event::MouseButtonPressed &&
                event.mouseButton.button == sf::Mouse::Left) {
                sf::Vector2f pos = window.mapPixelToCoords(
                    sf::Vector2i(event.mouseButton.x, event.mouseButton.y));
                const std::size_t before = match_.History().size();
                handleClick(pos);
                if (match_.History().size() != before) {
                    updateWindowTitle(window);
                    humanMovedThisFrame = true;
                }
            }
        }

        updateHover(window);

        // Let the human's mark render for a frame before the AI answers.
        if (!humanMovedThisFrame) {
            playAiTurn();
            updateWindowTitle(window);
        }

        window.clear(sf::Color(30, 30, 40));
        for (const auto& tile : tiles_) {
            tile.draw(window);
        }
        window.display();
    }
    return 0;
}
