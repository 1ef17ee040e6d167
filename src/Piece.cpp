#include "Piece.hpp"
#include "MoveTables.hpp"
#include <cctype>

namespace Schaak {

Piece::Piece(PieceType type, Color color)
    : m_type(type)
    , m_color(color)
    , m_hasMoved(false)
    , m_enPassantEligible(false) {
}

std::optional<Piece> Piece::fromChar(char c) {
    Color color = std::isupper(static_cast<unsigned char>(c)) ? Color::White : Color::Black;

    switch (std::tolower(static_cast<unsigned char>(c))) {
        case 'p': return Piece(PieceType::Pawn, color);
        case 'r': return Piece(PieceType::Rook, color);
        case 'n': return Piece(PieceType::Knight, color);
        case 'b': return Piece(PieceType::Bishop, color);
        case 'q': return Piece(PieceType::Queen, color);
        case 'k': return Piece(PieceType::King, color);
        default: return std::nullopt;
    }
}

bool Piece::isSliding() const {
    return MoveTables::isSliding(m_type);
}

char32_t Piece::getUnicodeChar() const {
    if (m_color == Color::White) {
        switch (m_type) {
            case PieceType::King:   return U'\u2654'; // ♔
            case PieceType::Queen:  return U'\u2655'; // ♕
            case PieceType::Rook:   return U'\u2656'; // ♖
            case PieceType::Bishop: return U'\u2657'; // ♗
            case PieceType::Knight: return U'\u2658'; // ♘
            case PieceType::Pawn:   return U'\u2659'; // ♙
        }
    } else {
        switch (m_type) {
            case PieceType::King:   return U'\u265A'; // ♚
            case PieceType::Queen:  return U'\u265B'; // ♛
            case PieceType::Rook:   return U'\u265C'; // ♜
            case PieceType::Bishop: return U'\u265D'; // ♝
            case PieceType::Knight: return U'\u265E'; // ♞
            case PieceType::Pawn:   return U'\u265F'; // ♟
        }
    }
    return U' ';
}

bool Piece::operator==(const Piece& other) const {
    return m_type == other.m_type
        && m_color == other.m_color
        && m_hasMoved == other.m_hasMoved
        && m_enPassantEligible == other.m_enPassantEligible;
}

} // namespace Schaak
