#pragma once

#include <SFML/Graphics.hpp>

/**
 * One square of the grid plus the mark drawn inside it.
 */
class CellTile {
public:
    CellTile(const sf::Vector2f& topLeft, float size);

    void setFillColor(const sf::Color& color);
    void setMark(char mark);
    bool contains(const sf::Vector2f& pos) const;

    void draw(sf::RenderTarget& target) const;

private:
    void drawCross(sf::RenderTarget& target) const;
    void drawNought(sf::RenderTarget& target) const;

    sf::RectangleShape square_;
    sf::Vector2f center_;
    float size_ = 0.0f;
    char mark_ = ' ';
};
