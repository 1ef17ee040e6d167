#pragma once

#include "Types.hpp"
#include "GameState.hpp"
#include "Channel.hpp"
#include <mutex>
#include <optional>

namespace Schaak {

// A participant with its own mirror of the game. Moves from the coordinator
// arrive in the inbox, moves made by this player leave through the outbox.
class Player {
public:
    Player(const GameState& state, Color color);
    virtual ~Player() = default;

    Player(const Player&) = delete;
    Player& operator=(const Player&) = delete;

    // Applies at most one incoming move; only when none arrived and it is
    // this player's turn does it choose and send a move of its own.
    void tick();

    Color getColor() const { return m_color; }
    virtual bool isHuman() const = 0;

    Channel<MoveInfo>& getInbox() { return m_inbox; }
    Channel<MoveInfo>& getOutbox() { return m_outbox; }

    // Not synchronised with a running worker
    const GameState& getState() const { return m_state; }

protected:
    virtual std::optional<MoveInfo> chooseMove(const GameState& state) = 0;

private:
    GameState m_state;
    Color m_color;
    Channel<MoveInfo> m_inbox;
    Channel<MoveInfo> m_outbox;
};

// Waits for the input layer to hand over a move
class HumanPlayer : public Player {
public:
    HumanPlayer(const GameState& state, Color color);

    bool isHuman() const override { return true; }

    // Replaces any move submitted earlier that was not sent yet
    void submitMove(const MoveInfo& move);

protected:
    std::optional<MoveInfo> chooseMove(const GameState& state) override;

private:
    std::mutex m_mutex;
    std::optional<MoveInfo> m_selectedMove;
};

} // namespace Schaak
