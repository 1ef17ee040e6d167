#include "Board.hpp"
#include <stdexcept>

namespace Schaak {

Board::Board() {
    clear();
}

void Board::initialize() {
    clear();

    // Back ranks from the a-file to the h-file, then pawns
    const char* layout[8] = {
        "RNBQKBNR",
        "PPPPPPPP",
        nullptr, nullptr, nullptr, nullptr,
        "pppppppp",
        "rnbqkbnr"
    };

    for (int rank = 0; rank < 8; ++rank) {
        if (!layout[rank]) continue;
        for (int file = 0; file < 8; ++file) {
            m_squares[file + 8 * rank].content = Piece::fromChar(layout[rank][file]);
        }
    }
}

void Board::clear() {
    for (int rank = 0; rank < 8; ++rank) {
        for (int file = 0; file < 8; ++file) {
            Square& square = m_squares[file + 8 * rank];
            square.coord = {file, rank};
            square.content.reset();
        }
    }
}

const Square& Board::getSquare(const Coordinate& coord) const {
    return m_squares[coord.index()];
}

const Square& Board::getSquare(int file, int rank) const {
    return m_squares[file + 8 * rank];
}

const std::optional<Piece>& Board::getPiece(const Coordinate& coord) const {
    return m_squares[coord.index()].content;
}

std::optional<Piece>& Board::getPiece(const Coordinate& coord) {
    return m_squares[coord.index()].content;
}

bool Board::isEmpty(const Coordinate& coord) const {
    return m_squares[coord.index()].isEmpty();
}

void Board::setPiece(const Coordinate& coord, const Piece& piece) {
    m_squares[coord.index()].content = piece;
}

void Board::removePiece(const Coordinate& coord) {
    m_squares[coord.index()].content.reset();
}

void Board::movePiece(const Coordinate& from, const Coordinate& to) {
    std::optional<Piece> moving = m_squares[from.index()].content;
    if (moving) {
        moving->setMoved();
    }
    m_squares[to.index()].content = moving;
    m_squares[from.index()].content.reset();
}

Coordinate Board::findKing(Color color) const {
    for (const Square& square : m_squares) {
        if (square.content && square.content->getType() == PieceType::King
            && square.content->getColor() == color) {
            return square.coord;
        }
    }
    throw std::logic_error(std::string("no ") + toString(color) + " king on the board");
}

std::vector<Coordinate> Board::findPieces(Color color) const {
    std::vector<Coordinate> positions;
    for (const Square& square : m_squares) {
        if (square.content && square.content->getColor() == color) {
            positions.push_back(square.coord);
        }
    }
    return positions;
}

void Board::clearEnPassant(Color color) {
    for (Square& square : m_squares) {
        if (square.content && square.content->getColor() == color) {
            square.content->setEnPassantEligible(false);
        }
    }
}

} // namespace Schaak
