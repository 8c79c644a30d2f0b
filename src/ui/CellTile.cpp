#include "ui/CellTile.hpp"

#include <initializer_list>

constexpr float kCellPadding = 4.0f;
constexpr float kMarkRatio = 0.30f;
constexpr float kStrokeRatio = 0.07f;

CellTile::CellTile(const sf::Vector2f& topLeft, float size)
    : center_(topLeft.x + size / 2.0f, topLeft.y + size / 2.0f), size_(size) {
    square_.setSize(sf::Vector2f(size - 2.0f * kCellPadding, size - 2.0f * kCellPadding));
    square_.setPosition(topLeft.x + kCellPadding, topLeft.y + kCellPadding);
}

void CellTile::setFillColor(const sf::Color& color) {
    square_.setFillColor(color);
}

void CellTile::setMark(char mark) {
    mark_ = mark;
}

bool CellTile::contains(const sf::Vector2f& pos) const {
    return square_.getGlobalBounds().contains(pos);
}

void CellTile::draw(sf::RenderTarget& target) const {
    target.draw(square_);
    if (mark_ == 'X') {
        drawCross(target);
    } else if (mark_ != ' ') {
        drawNought(target);
    }
}

void CellTile::drawCross(sf::RenderTarget& target) const {
    const float length = size_ * kMarkRatio * 2.0f * 1.2f;
    const float stroke = size_ * kStrokeRatio;
    for (float angle : {45.0f, -45.0f}) {
        sf::RectangleShape bar(sf::Vector2f(length, stroke));
        bar.setOrigin(length / 2.0f, stroke / 2.0f); // rotate around center
        bar.setPosition(center_);
        bar.setRotation(angle);
        bar.setFillColor(sf::Color(30, 30, 40));
        target.draw(bar);
    }
}

void CellTile::drawNought(sf::RenderTarget& target) const {
    const float radius = size_ * kMarkRatio;
    sf::CircleShape ring(radius);
    ring.setOrigin(radius, radius);
    ring.setPosition(center_);
    ring.setFillColor(sf::Color::Transparent);
    ring.setOutlineThickness(size_ * kStrokeRatio);
    ring.setOutlineColor(sf::Color(30, 30, 40));
    target.draw(ring);
}
