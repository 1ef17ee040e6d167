#include "ChessLogic.hpp"
#include <algorithm>
#include <cstdlib>
#include <stdexcept>

namespace Schaak {

ChessLogic::ChessLogic(const Board& board)
    : m_board(board) {
}

std::vector<Coordinate> ChessLogic::getPseudoLegalDestinations(const Coordinate& from) const {
    const std::optional<Piece>& piece = m_board.getPiece(from);
    if (!piece) {
        throw std::logic_error("move query on empty square " + from.toString());
    }

    if (piece->getType() == PieceType::Pawn) {
        return getPawnDestinations(from, *piece);
    }
    if (piece->isSliding()) {
        return getSlidingDestinations(from, *piece, MoveTables::getOffsets(piece->getType()));
    }
    return getSteppingDestinations(from, *piece, MoveTables::getOffsets(piece->getType()));
}

std::vector<Coordinate> ChessLogic::getPawnDestinations(const Coordinate& from, const Piece& pawn) const {
    std::vector<Coordinate> destinations;
    Color color = pawn.getColor();
    int direction = MoveTables::getForwardDirection(color);

    // Forward moves, the second square only if the first is free as well
    Coordinate forward = {from.file, from.rank + direction};
    if (forward.isValid() && m_board.isEmpty(forward)) {
        destinations.push_back(forward);

        if (!pawn.hasMoved()) {
            Coordinate doubleForward = {from.file, from.rank + 2 * direction};
            if (doubleForward.isValid() && m_board.isEmpty(doubleForward)) {
                destinations.push_back(doubleForward);
            }
        }
    }

    // Captures, including en passant next to a pawn that just double-pushed
    for (int fileOffset : {-1, 1}) {
        Coordinate target = {from.file + fileOffset, from.rank + direction};
        if (!target.isValid()) continue;

        if (isEnemy(target, color)) {
            destinations.push_back(target);
            continue;
        }

        const std::optional<Piece>& passed = m_board.getPiece({target.file, from.rank});
        if (m_board.isEmpty(target) && passed && passed->getColor() != color
            && passed->getType() == PieceType::Pawn && passed->isEnPassantEligible()) {
            destinations.push_back(target);
        }
    }

    return destinations;
}

std::vector<Coordinate> ChessLogic::getSteppingDestinations(const Coordinate& from, const Piece& piece,
                                                            const std::vector<MoveTables::Offset>& offsets) const {
    std::vector<Coordinate> destinations;

    for (const auto& offset : offsets) {
        Coordinate target = {from.file + offset.first, from.rank + offset.second};
        if (!target.isValid()) continue;

        if (m_board.isEmpty(target) || isEnemy(target, piece.getColor())) {
            destinations.push_back(target);
        }
    }

    return destinations;
}

std::vector<Coordinate> ChessLogic::getSlidingDestinations(const Coordinate& from, const Piece& piece,
                                                           const std::vector<MoveTables::Offset>& directions) const {
    std::vector<Coordinate> destinations;

    for (const auto& dir : directions) {
        Coordinate target = from;
        while (true) {
            target.file += dir.first;
            target.rank += dir.second;

            if (!target.isValid()) break;

            if (m_board.isEmpty(target)) {
                destinations.push_back(target);
            } else {
                if (isEnemy(target, piece.getColor())) {
                    destinations.push_back(target);
                }
                break;
            }
        }
    }

    return destinations;
}

std::vector<Move> ChessLogic::getCastlingMoves(const Coordinate& from) const {
    std::vector<Move> moves;
    const std::optional<Piece>& king = m_board.getPiece(from);
    if (!king || king->getType() != PieceType::King || king->hasMoved()) {
        return moves;
    }

    Color color = king->getColor();
    int rank = MoveTables::getBackRank(color);
    if (from != Coordinate{4, rank}) {
        return moves;
    }

    auto rookReady = [&](int file) {
        const std::optional<Piece>& rook = m_board.getPiece({file, rank});
        return rook && rook->getType() == PieceType::Rook && rook->getColor() == color && !rook->hasMoved();
    };

    // Only emptiness of the squares in between is required here; whether the
    // king is in check or crosses an attacked square is not examined.
    if (rookReady(0) && m_board.isEmpty({1, rank}) && m_board.isEmpty({2, rank})
        && m_board.isEmpty({3, rank})) {
        moves.emplace_back(CastleMove{true, color});
    }

    if (rookReady(7) && m_board.isEmpty({5, rank}) && m_board.isEmpty({6, rank})) {
        moves.emplace_back(CastleMove{false, color});
    }

    return moves;
}

Move ChessLogic::classifyMove(const Coordinate& from, const Coordinate& to, PieceType promotion) const {
    const std::optional<Piece>& piece = m_board.getPiece(from);
    if (!piece) {
        throw std::logic_error("move query on empty square " + from.toString());
    }

    if (piece->getType() != PieceType::Pawn) {
        return Move(NormalMove{from, to});
    }

    if (to.rank == MoveTables::getPromotionRank(piece->getColor())) {
        if (promotion == PieceType::Pawn || promotion == PieceType::King) {
            throw std::invalid_argument("a pawn cannot promote to a pawn or a king");
        }
        return Move(PromotionMove{from, to, promotion});
    }

    if (std::abs(to.rank - from.rank) == 2 && !piece->hasMoved()) {
        return Move(DoublePushMove{from, to});
    }

    if (to.file != from.file && m_board.isEmpty(to)) {
        return Move(EnPassantMove{from, to});
    }

    return Move(NormalMove{from, to});
}

bool ChessLogic::isInCheck(Color color) const {
    return isAttacked(m_board.findKing(color), flip(color));
}

bool ChessLogic::isAttacked(const Coordinate& target, Color byColor) const {
    for (const Coordinate& attacker : m_board.findPieces(byColor)) {
        std::vector<Coordinate> reach = getPseudoLegalDestinations(attacker);
        if (std::find(reach.begin(), reach.end(), target) != reach.end()) {
            return true;
        }
    }
    return false;
}

bool ChessLogic::isEnemy(const Coordinate& coord, Color color) const {
    const std::optional<Piece>& piece = m_board.getPiece(coord);
    return piece && piece->getColor() != color;
}

} // namespace Schaak
