#include "MoveTables.hpp"

namespace Schaak {
namespace MoveTables {

const std::vector<Offset>& getRookOffsets() {
    static const std::vector<Offset> offsets = {{-1, 0}, {1, 0}, {0, -1}, {0, 1}};
    return offsets;
}

const std::vector<Offset>& getBishopOffsets() {
    static const std::vector<Offset> offsets = {{-1, -1}, {1, -1}, {-1, 1}, {1, 1}};
    return offsets;
}

const std::vector<Offset>& getQueenOffsets() {
    static const std::vector<Offset> offsets = {{-1, -1}, {1, -1}, {-1, 1}, {1, 1},
                                                {-1, 0}, {1, 0}, {0, -1}, {0, 1}};
    return offsets;
}

const std::vector<Offset>& getKnightOffsets() {
    static const std::vector<Offset> offsets = {{1, 2}, {-1, 2}, {2, 1}, {-2, 1},
                                                {2, -1}, {-2, -1}, {1, -2}, {-1, -2}};
    return offsets;
}

const std::vector<Offset>& getKingOffsets() {
    static const std::vector<Offset> offsets = {{-1, -1}, {-1, 0}, {-1, 1}, {0, 1},
                                                {0, -1}, {1, -1}, {1, 0}, {1, 1}};
    return offsets;
}

const std::vector<Offset>& getOffsets(PieceType type) {
    static const std::vector<Offset> none;

    switch (type) {
        case PieceType::Rook:   return getRookOffsets();
        case PieceType::Bishop: return getBishopOffsets();
        case PieceType::Queen:  return getQueenOffsets();
        case PieceType::Knight: return getKnightOffsets();
        case PieceType::King:   return getKingOffsets();
        default: return none;
    }
}

bool isSliding(PieceType type) {
    switch (type) {
        case PieceType::Rook:
        case PieceType::Bishop:
        case PieceType::Queen:
            return true;
        default:
            return false;
    }
}

int getForwardDirection(Color color) {
    return color == Color::White ? 1 : -1;
}

int getBackRank(Color color) {
    return color == Color::White ? 0 : 7;
}

int getPromotionRank(Color color) {
    return color == Color::White ? 7 : 0;
}

} // namespace MoveTables
} // namespace Schaak
