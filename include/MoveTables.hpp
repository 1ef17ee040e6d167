#pragma once

#include "Types.hpp"
#include <utility>
#include <vector>

namespace Schaak {
namespace MoveTables {

// (file, rank) steps
using Offset = std::pair<int, int>;

const std::vector<Offset>& getRookOffsets();
const std::vector<Offset>& getBishopOffsets();
const std::vector<Offset>& getQueenOffsets();
const std::vector<Offset>& getKnightOffsets();
const std::vector<Offset>& getKingOffsets();

// Directions for sliding pieces, single steps for knight and king.
// Pawns have no table: their moves depend on colour and state.
const std::vector<Offset>& getOffsets(PieceType type);

bool isSliding(PieceType type);

// +1 for white, -1 for black
int getForwardDirection(Color color);

int getBackRank(Color color);
int getPromotionRank(Color color);

} // namespace MoveTables
} // namespace Schaak
