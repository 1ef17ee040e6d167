#include "MatchCoordinator.hpp"
#include <algorithm>
#include <iostream>

namespace Schaak {

MatchCoordinator::MatchCoordinator(const GameState& state, Player& white, Player& black)
    : m_state(state)
    , m_white(white)
    , m_black(black) {
}

std::optional<MoveInfo> MatchCoordinator::poll() {
    Color turn = m_state.getCurrentTurn();
    Player& mover = getPlayer(turn);

    std::optional<MoveInfo> incoming = mover.getOutbox().tryReceive();
    if (!incoming) {
        return std::nullopt;
    }

    // The sender already applied the move to its mirror, which stays ahead after a rejection
    if (!m_state.isRunning() || !isLegal(*incoming)) {
        std::cerr << "Rejected move " << incoming->from.toString()
                  << incoming->move.getDestination().toString()
                  << " from " << toString(turn) << std::endl;
        return std::nullopt;
    }

    m_state.makeMove(incoming->from, incoming->move);
    m_state.endTurn();
    getPlayer(flip(turn)).getInbox().send(*incoming);

    return incoming;
}

bool MatchCoordinator::isLegal(const MoveInfo& info) const {
    if (!info.from.isValid()) {
        return false;
    }

    const std::optional<Piece>& piece = m_state.getBoard().getPiece(info.from);
    if (!piece || piece->getColor() != m_state.getCurrentTurn()) {
        return false;
    }

    PieceType promotion = info.move.getPromotion().value_or(m_state.getPromotionChoice());
    std::vector<Move> legalMoves = m_state.getMoves(info.from, true, promotion);
    return std::any_of(legalMoves.begin(), legalMoves.end(),
        [&info](const Move& m) {
            return m.data() == info.move.data();
        });
}

} // namespace Schaak
