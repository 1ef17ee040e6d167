#pragma once

#include "GameState.hpp"
#include "Player.hpp"
#include <optional>

namespace Schaak {

// Owns the authoritative game and relays moves between the two players
class MatchCoordinator {
public:
    MatchCoordinator(const GameState& state, Player& white, Player& black);

    // Takes at most one move from the player to move, checks it against the
    // legal moves, applies it and forwards it to the opponent.
    // Returns the applied move, std::nullopt if none was applied.
    std::optional<MoveInfo> poll();

    const GameState& getState() const { return m_state; }
    GameState& getState() { return m_state; }

    Player& getPlayer(Color color) { return color == Color::White ? m_white : m_black; }

private:
    bool isLegal(const MoveInfo& info) const;

    GameState m_state;
    Player& m_white;
    Player& m_black;
};

} // namespace Schaak
