#include "Renderer.hpp"
#include <iostream>

namespace Schaak {

Renderer::Renderer(sf::RenderWindow& window)
    : m_window(window)
    , m_tileSize(TILE_SIZE)
{
    m_lightColor = sf::Color(161, 222, 255);
    m_lightHoverColor = sf::Color(141, 177, 196);
    m_darkColor = sf::Color(0, 79, 122);
    m_darkHoverColor = sf::Color(4, 38, 56);
    m_enPassantColor = sf::Color(140, 100, 250);
    m_selectedColor = sf::Color(240, 200, 210);
    m_legalMoveColor = sf::Color(50, 200, 20, 50);
    m_checkColor = sf::Color(255, 0, 0, 150);
}

bool Renderer::loadResources() {
    // Fonts that carry the chess glyphs
    std::vector<std::string> fontPaths = {
        "assets/fonts/DejaVuSans.ttf",
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf",
        "/usr/share/fonts/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/truetype/freefont/FreeSerif.ttf",
        "/System/Library/Fonts/Apple Symbols.ttf"
    };

    for (const auto& path : fontPaths) {
        sf::Font font;
        if (font.openFromFile(path)) {
            m_font = std::move(font);
            return true;
        }
    }

    std::cerr << "Warning: Could not load font. Pieces and text will not be drawn." << std::endl;
    return false;
}

void Renderer::render(const GameState& state,
                      const std::vector<Move>* legalMoves,
                      const std::optional<Coordinate>& hovered) {
    drawBoard(state, hovered);
    drawCheck(state);
    drawPieces(state.getBoard());
    drawHighlights(legalMoves);
    drawPanel(state, hovered);
}

sf::Vector2f Renderer::squareOrigin(const Coordinate& coord) const {
    return sf::Vector2f(coord.file * m_tileSize, (7 - coord.rank) * m_tileSize);
}

void Renderer::drawBoard(const GameState& state, const std::optional<Coordinate>& hovered) {
    const std::optional<Coordinate>& selected = state.getSelectedSquare();

    for (const Square& square : state.getBoard().getSquares()) {
        bool isHovered = hovered && *hovered == square.coord;
        bool isLight = (square.coord.file + square.coord.rank) % 2 == 1;

        sf::Color fill;
        if (isLight) {
            fill = isHovered ? m_lightHoverColor : m_lightColor;
        } else {
            fill = isHovered ? m_darkHoverColor : m_darkColor;
        }
        if (square.content && square.content->isEnPassantEligible()) {
            fill = m_enPassantColor;
        }
        if (selected && *selected == square.coord) {
            fill = m_selectedColor;
        }

        sf::RectangleShape tile(sf::Vector2f(m_tileSize, m_tileSize));
        tile.setPosition(squareOrigin(square.coord));
        tile.setFillColor(fill);
        m_window.draw(tile);
    }
}

void Renderer::drawCheck(const GameState& state) {
    Color turn = state.getCurrentTurn();
    if (!state.isInCheck(turn)) return;

    sf::RectangleShape checkHighlight(sf::Vector2f(m_tileSize, m_tileSize));
    checkHighlight.setPosition(squareOrigin(state.getBoard().findKing(turn)));
    checkHighlight.setFillColor(m_checkColor);
    m_window.draw(checkHighlight);
}

void Renderer::drawPieces(const Board& board) {
    for (const Square& square : board.getSquares()) {
        if (!square.content) continue;

        sf::Vector2f origin = squareOrigin(square.coord);
        drawPiece(*square.content, origin.x, origin.y);
    }
}

void Renderer::drawPiece(const Piece& piece, float x, float y) {
    if (!m_font) return;

    sf::String glyph;
    glyph += piece.getUnicodeChar();
    unsigned int charSize = static_cast<unsigned int>(m_tileSize * 0.85f);

    sf::Text pieceText(*m_font, glyph, charSize);
    pieceText.setFillColor(piece.getColor() == Color::White ? sf::Color::White : sf::Color(20, 20, 20));

    // Center the piece
    sf::FloatRect bounds = pieceText.getLocalBounds();
    float offsetX = (m_tileSize - bounds.size.x) / 2 - bounds.position.x;
    float offsetY = (m_tileSize - bounds.size.y) / 2 - bounds.position.y;
    pieceText.setPosition(sf::Vector2f(x + offsetX, y + offsetY));

    // Outline for white pieces on the light squares
    if (piece.getColor() == Color::White) {
        pieceText.setOutlineColor(sf::Color(30, 30, 30));
        pieceText.setOutlineThickness(1.0f);
    }

    m_window.draw(pieceText);
}

void Renderer::drawHighlights(const std::vector<Move>* legalMoves) {
    if (!legalMoves) return;

    float markerSize = m_tileSize / 3;
    for (const Move& move : *legalMoves) {
        sf::Vector2f origin = squareOrigin(move.getDestination());

        sf::RectangleShape marker(sf::Vector2f(markerSize, markerSize));
        marker.setPosition(sf::Vector2f(origin.x + (m_tileSize - markerSize) / 2,
                                        origin.y + (m_tileSize - markerSize) / 2));
        marker.setFillColor(m_legalMoveColor);
        m_window.draw(marker);
    }
}

void Renderer::drawPanel(const GameState& state, const std::optional<Coordinate>& hovered) {
    float panelX = getPanelX();

    if (state.isRunning()) {
        drawText(std::string(toString(state.getCurrentTurn())) + " to play", panelX, MARGIN);
    } else {
        drawText("checkmate!", panelX, MARGIN);
    }

    // Pending promotion piece in brackets
    std::string promotion = "promotion:";
    const std::pair<PieceType, char> choices[] = {
        {PieceType::Queen, 'Q'}, {PieceType::Rook, 'R'}, {PieceType::Bishop, 'B'}, {PieceType::Knight, 'N'}
    };
    for (const auto& choice : choices) {
        bool chosen = state.getPromotionChoice() == choice.first;
        promotion += ' ';
        promotion += chosen ? '[' : ' ';
        promotion += choice.second;
        promotion += chosen ? ']' : ' ';
    }
    drawText(promotion, panelX, 3 * MARGIN);

    drawHistory(state, 5 * MARGIN);

    if (hovered) {
        std::string text = hovered->toString();
        if (state.getSelectedSquare()) {
            text = state.getSelectedSquare()->toString() + " -> " + text;
        }
        drawText(text, panelX, 8 * m_tileSize - 2 * MARGIN);
    }
}

void Renderer::drawHistory(const GameState& state, float top) {
    const std::vector<PerformedMove>& history = state.getHistory();
    const std::size_t maxLines = 16;
    const float lineHeight = 18.0f;

    // Most recent records only
    std::size_t first = history.size() > maxLines ? history.size() - maxLines : 0;
    for (std::size_t i = first; i < history.size(); ++i) {
        std::string text = std::to_string(i + 1) + ". " + history[i].toString();
        drawText(text, getPanelX(), top + (i - first) * lineHeight, 14);
    }
}

void Renderer::drawText(const std::string& text, float x, float y, unsigned int size) {
    if (!m_font) return;

    sf::Text label(*m_font, text, size);
    label.setFillColor(sf::Color::White);
    label.setPosition(sf::Vector2f(x, y));
    m_window.draw(label);
}

std::optional<Coordinate> Renderer::screenToBoard(int x, int y) const {
    if (x < 0 || y < 0) {
        return std::nullopt;
    }

    Coordinate coord = {static_cast<int>(x / m_tileSize), 7 - static_cast<int>(y / m_tileSize)};
    if (!coord.isValid()) {
        return std::nullopt;
    }
    return coord;
}

} // namespace Schaak
