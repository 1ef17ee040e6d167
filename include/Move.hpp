#pragma once

#include "Types.hpp"
#include <optional>
#include <string>
#include <variant>

namespace Schaak {

class GameState;

struct NormalMove {
    Coordinate from;
    Coordinate to;

    bool operator==(const NormalMove& other) const {
        return from == other.from && to == other.to;
    }
};

// Unmoved pawn advancing two ranks; leaves it en-passant eligible
struct DoublePushMove {
    Coordinate from;
    Coordinate to;

    bool operator==(const DoublePushMove& other) const {
        return from == other.from && to == other.to;
    }
};

struct EnPassantMove {
    Coordinate from;
    Coordinate to;

    bool operator==(const EnPassantMove& other) const {
        return from == other.from && to == other.to;
    }
};

struct CastleMove {
    bool isLong;
    Color color;

    bool operator==(const CastleMove& other) const {
        return isLong == other.isLong && color == other.color;
    }
};

struct PromotionMove {
    Coordinate from;
    Coordinate to;
    PieceType promotion;

    bool operator==(const PromotionMove& other) const {
        return from == other.from && to == other.to && promotion == other.promotion;
    }
};

// Same order as the alternatives of Move::Data
enum class MoveKind {
    Normal,
    DoublePush,
    EnPassant,
    Castle,
    Promotion
};

class Move {
public:
    using Data = std::variant<NormalMove, DoublePushMove, EnPassantMove, CastleMove, PromotionMove>;

    Move(const Data& data);

    const Data& data() const { return m_data; }
    MoveKind getKind() const;

    Coordinate getSource() const;
    Coordinate getDestination() const;
    std::optional<PieceType> getPromotion() const;

    // Runs the move's effect on the state and records it in the history.
    // Returns true when the pieces were already relocated, false when the
    // caller still has to perform the plain relocation.
    bool apply(GameState& state) const;

    // Moves compare by destination only
    bool operator==(const Move& other) const { return getDestination() == other.getDestination(); }
    bool operator!=(const Move& other) const { return !(*this == other); }
    bool operator==(const Coordinate& destination) const { return getDestination() == destination; }
    bool operator!=(const Coordinate& destination) const { return !(*this == destination); }

private:
    Data m_data;
};

// Record of a move already made, e.g. "e2e4"
class PerformedMove {
public:
    PerformedMove(const Coordinate& from, const Coordinate& to);

    const Coordinate& getFrom() const { return m_from; }
    const Coordinate& getTo() const { return m_to; }

    std::string toString() const;

    bool operator==(const PerformedMove& other) const {
        return m_from == other.m_from && m_to == other.m_to;
    }
    bool operator!=(const PerformedMove& other) const { return !(*this == other); }

private:
    Coordinate m_from;
    Coordinate m_to;
};

} // namespace Schaak
