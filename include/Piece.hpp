#pragma once

#include "Types.hpp"
#include <optional>

namespace Schaak {

class Piece {
public:
    Piece(PieceType type, Color color);

    // Uppercase letters are white, lowercase black (PRNBQK)
    static std::optional<Piece> fromChar(char c);

    PieceType getType() const { return m_type; }
    Color getColor() const { return m_color; }

    bool hasMoved() const { return m_hasMoved; }
    void setMoved() { m_hasMoved = true; }

    // Set by a double pawn push, cleared once the owner regains the move
    bool isEnPassantEligible() const { return m_enPassantEligible; }
    void setEnPassantEligible(bool eligible) { m_enPassantEligible = eligible; }

    bool isSliding() const;

    // Get Unicode character for the piece
    char32_t getUnicodeChar() const;

    bool operator==(const Piece& other) const;
    bool operator!=(const Piece& other) const { return !(*this == other); }

private:
    PieceType m_type;
    Color m_color;
    bool m_hasMoved;
    bool m_enPassantEligible;
};

} // namespace Schaak
