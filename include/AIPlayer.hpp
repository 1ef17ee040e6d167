#pragma once

#include "Player.hpp"
#include <random>

namespace Schaak {

// Plays a uniformly random legal move; no search, no evaluation
class AIPlayer : public Player {
public:
    AIPlayer(const GameState& state, Color color);
    AIPlayer(const GameState& state, Color color, unsigned int seed);

    bool isHuman() const override { return false; }

protected:
    std::optional<MoveInfo> chooseMove(const GameState& state) override;

private:
    std::mt19937 m_rng;
};

} // namespace Schaak
