#include "Player.hpp"

namespace Schaak {

Player::Player(const GameState& state, Color color)
    : m_state(state)
    , m_color(color) {
}

void Player::tick() {
    if (std::optional<MoveInfo> incoming = m_inbox.tryReceive()) {
        m_state.makeMove(incoming->from, incoming->move);
        m_state.endTurn();
        return;
    }

    if (!m_state.isRunning() || m_state.getCurrentTurn() != m_color) {
        return;
    }

    std::optional<MoveInfo> outgoing = chooseMove(m_state);
    if (!outgoing) {
        return;
    }

    m_state.makeMove(outgoing->from, outgoing->move);
    m_state.endTurn();
    m_outbox.send(*outgoing);
}

HumanPlayer::HumanPlayer(const GameState& state, Color color)
    : Player(state, color) {
}

void HumanPlayer::submitMove(const MoveInfo& move) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_selectedMove = move;
}

std::optional<MoveInfo> HumanPlayer::chooseMove(const GameState& /*state*/) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::optional<MoveInfo> move = m_selectedMove;
    m_selectedMove.reset();
    return move;
}

} // namespace Schaak
