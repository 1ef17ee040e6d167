#pragma once

#include "Types.hpp"
#include "Piece.hpp"
#include <array>
#include <optional>
#include <vector>

namespace Schaak {

struct Square {
    Coordinate coord = {0, 0};
    std::optional<Piece> content;

    bool isEmpty() const { return !content.has_value(); }

    bool operator==(const Square& other) const {
        return coord == other.coord && content == other.content;
    }
};

class Board {
public:
    Board();

    // Standard starting layout
    void initialize();
    void clear();

    const Square& getSquare(const Coordinate& coord) const;
    const Square& getSquare(int file, int rank) const;

    const std::optional<Piece>& getPiece(const Coordinate& coord) const;
    std::optional<Piece>& getPiece(const Coordinate& coord);
    bool isEmpty(const Coordinate& coord) const;

    void setPiece(const Coordinate& coord, const Piece& piece);
    void removePiece(const Coordinate& coord);

    // Copies the piece to `to` with the moved flag set and clears `from`
    void movePiece(const Coordinate& from, const Coordinate& to);

    // Throws std::logic_error when the king is missing
    Coordinate findKing(Color color) const;
    std::vector<Coordinate> findPieces(Color color) const;

    void clearEnPassant(Color color);

    const std::array<Square, 64>& getSquares() const { return m_squares; }

    bool operator==(const Board& other) const { return m_squares == other.m_squares; }
    bool operator!=(const Board& other) const { return !(*this == other); }

private:
    std::array<Square, 64> m_squares;
};

} // namespace Schaak
