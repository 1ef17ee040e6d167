#pragma once

#include "Types.hpp"
#include "GameState.hpp"
#include <SFML/Graphics.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Schaak {

class Renderer {
public:
    explicit Renderer(sf::RenderWindow& window);

    bool loadResources();
    void render(const GameState& state,
                const std::vector<Move>* legalMoves = nullptr,
                const std::optional<Coordinate>& hovered = std::nullopt);

    // Convert mouse position to a board square, a1 at the bottom left
    std::optional<Coordinate> screenToBoard(int x, int y) const;

    float getPanelX() const { return 8 * m_tileSize + MARGIN; }

    // Get font for external use
    const sf::Font* getFont() const { return m_font ? &(*m_font) : nullptr; }

    static constexpr float TILE_SIZE = 55.0f;
    static constexpr float MARGIN = 16.0f;

private:
    sf::RenderWindow& m_window;

    std::optional<sf::Font> m_font;

    float m_tileSize;

    // Colors
    sf::Color m_lightColor;
    sf::Color m_lightHoverColor;
    sf::Color m_darkColor;
    sf::Color m_darkHoverColor;
    sf::Color m_enPassantColor;
    sf::Color m_selectedColor;
    sf::Color m_legalMoveColor;
    sf::Color m_checkColor;

    sf::Vector2f squareOrigin(const Coordinate& coord) const;

    void drawBoard(const GameState& state, const std::optional<Coordinate>& hovered);
    void drawPieces(const Board& board);
    void drawCheck(const GameState& state);
    void drawHighlights(const std::vector<Move>* legalMoves);
    void drawPanel(const GameState& state, const std::optional<Coordinate>& hovered);
    void drawHistory(const GameState& state, float top);
    void drawText(const std::string& text, float x, float y, unsigned int size = 16);
    void drawPiece(const Piece& piece, float x, float y);
};

} // namespace Schaak
