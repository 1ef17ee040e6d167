#include "AIPlayer.hpp"

namespace Schaak {

AIPlayer::AIPlayer(const GameState& state, Color color)
    : Player(state, color)
    , m_rng(std::random_device{}()) {
}

AIPlayer::AIPlayer(const GameState& state, Color color, unsigned int seed)
    : Player(state, color)
    , m_rng(seed) {
}

std::optional<MoveInfo> AIPlayer::chooseMove(const GameState& state) {
    std::vector<MoveInfo> moves = state.getAllLegalMoves(getColor());
    if (moves.empty()) {
        return std::nullopt;
    }

    std::uniform_int_distribution<std::size_t> dist(0, moves.size() - 1);
    return moves[dist(m_rng)];
}

} // namespace Schaak
