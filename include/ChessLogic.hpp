#pragma once

#include "Types.hpp"
#include "Board.hpp"
#include "Move.hpp"
#include "MoveTables.hpp"
#include <vector>

namespace Schaak {

// Move generation and attack detection on a fixed board position.
// Nothing here knows whose turn it is; GameState adds that.
class ChessLogic {
public:
    explicit ChessLogic(const Board& board);

    // Destinations reachable by the piece on `from`, ignoring king safety.
    // Throws std::logic_error if the square is empty.
    std::vector<Coordinate> getPseudoLegalDestinations(const Coordinate& from) const;

    // Castling moves for the king standing on `from` (empty for any other piece)
    std::vector<Move> getCastlingMoves(const Coordinate& from) const;

    // Attach the special-move semantics to a destination
    Move classifyMove(const Coordinate& from, const Coordinate& to, PieceType promotion) const;

    bool isInCheck(Color color) const;

    // Check if a square is reached by any piece of a color
    bool isAttacked(const Coordinate& target, Color byColor) const;

private:
    const Board& m_board;

    std::vector<Coordinate> getPawnDestinations(const Coordinate& from, const Piece& pawn) const;
    std::vector<Coordinate> getSteppingDestinations(const Coordinate& from, const Piece& piece,
                                                    const std::vector<MoveTables::Offset>& offsets) const;
    std::vector<Coordinate> getSlidingDestinations(const Coordinate& from, const Piece& piece,
                                                   const std::vector<MoveTables::Offset>& directions) const;

    bool isEnemy(const Coordinate& coord, Color color) const;
};

} // namespace Schaak
