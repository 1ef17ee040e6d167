#include "Move.hpp"
#include "GameState.hpp"
#include "MoveTables.hpp"

namespace Schaak {

namespace {

Coordinate castleKingSource(const CastleMove& move) {
    return {4, MoveTables::getBackRank(move.color)};
}

Coordinate castleKingTarget(const CastleMove& move) {
    return {move.isLong ? 2 : 6, MoveTables::getBackRank(move.color)};
}

struct SourceVisitor {
    Coordinate operator()(const CastleMove& move) const { return castleKingSource(move); }

    template <typename T>
    Coordinate operator()(const T& move) const { return move.from; }
};

struct DestinationVisitor {
    Coordinate operator()(const CastleMove& move) const { return castleKingTarget(move); }

    template <typename T>
    Coordinate operator()(const T& move) const { return move.to; }
};

// Each effect records itself, then reports whether it relocated the pieces
struct EffectVisitor {
    GameState& state;

    bool operator()(const NormalMove& move) const {
        state.recordMove(PerformedMove(move.from, move.to));
        return false;
    }

    bool operator()(const DoublePushMove& move) const {
        state.recordMove(PerformedMove(move.from, move.to));
        std::optional<Piece>& pawn = state.getBoard().getPiece(move.from);
        if (pawn) {
            pawn->setEnPassantEligible(true);
            pawn->setMoved();
        }
        return false;
    }

    bool operator()(const EnPassantMove& move) const {
        state.recordMove(PerformedMove(move.from, move.to));
        Board& board = state.getBoard();
        board.movePiece(move.from, move.to);
        board.removePiece({move.to.file, move.from.rank});
        return true;
    }

    bool operator()(const CastleMove& move) const {
        int rank = MoveTables::getBackRank(move.color);
        Coordinate rookFrom = {move.isLong ? 0 : 7, rank};
        Coordinate rookTo = {move.isLong ? 3 : 5, rank};
        Coordinate kingFrom = castleKingSource(move);
        Coordinate kingTo = castleKingTarget(move);

        Board& board = state.getBoard();
        state.recordMove(PerformedMove(rookFrom, rookTo));
        board.movePiece(rookFrom, rookTo);
        state.recordMove(PerformedMove(kingFrom, kingTo));
        board.movePiece(kingFrom, kingTo);
        return true;
    }

    bool operator()(const PromotionMove& move) const {
        state.recordMove(PerformedMove(move.from, move.to));
        Board& board = state.getBoard();
        const std::optional<Piece>& pawn = board.getPiece(move.from);
        if (pawn) {
            Piece promoted(move.promotion, pawn->getColor());
            promoted.setMoved();
            board.setPiece(move.to, promoted);
            board.removePiece(move.from);
        }
        return true;
    }
};

} // namespace

Move::Move(const Data& data)
    : m_data(data) {
}

MoveKind Move::getKind() const {
    return static_cast<MoveKind>(m_data.index());
}

Coordinate Move::getSource() const {
    return std::visit(SourceVisitor{}, m_data);
}

Coordinate Move::getDestination() const {
    return std::visit(DestinationVisitor{}, m_data);
}

std::optional<PieceType> Move::getPromotion() const {
    if (const auto* promotion = std::get_if<PromotionMove>(&m_data)) {
        return promotion->promotion;
    }
    return std::nullopt;
}

bool Move::apply(GameState& state) const {
    return std::visit(EffectVisitor{state}, m_data);
}

PerformedMove::PerformedMove(const Coordinate& from, const Coordinate& to)
    : m_from(from)
    , m_to(to) {
}

std::string PerformedMove::toString() const {
    return m_from.toString() + m_to.toString();
}

} // namespace Schaak
