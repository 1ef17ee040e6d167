#include "GameState.hpp"
#include "ChessLogic.hpp"
#include <algorithm>
#include <stdexcept>

namespace Schaak {

GameState::GameState() {
    reset();
}

void GameState::reset() {
    m_board.initialize();
    m_currentTurn = Color::White;
    m_history.clear();
    m_promotionChoice = PieceType::Queen;
    m_selectedSquare.reset();
    m_running = true;
}

bool GameState::setPromotionChoice(PieceType type) {
    if (type == PieceType::Pawn || type == PieceType::King) {
        return false;
    }
    m_promotionChoice = type;
    return true;
}

std::vector<Move> GameState::getMoves(const Coordinate& coord, bool filterForChecks) const {
    return getMoves(coord, filterForChecks, m_promotionChoice);
}

std::vector<Move> GameState::getMoves(const Coordinate& coord, bool filterForChecks, PieceType promotion) const {
    const std::optional<Piece>& piece = m_board.getPiece(coord);
    if (!piece) {
        throw std::logic_error("move query on empty square " + coord.toString());
    }

    ChessLogic logic(m_board);
    std::vector<Coordinate> destinations = logic.getPseudoLegalDestinations(coord);

    if (filterForChecks) {
        // Try every candidate on a scratch copy as a plain relocation
        Color color = piece->getColor();
        destinations.erase(
            std::remove_if(destinations.begin(), destinations.end(),
                [&](const Coordinate& destination) {
                    GameState scratch = *this;
                    scratch.m_board.movePiece(coord, destination);
                    return scratch.isInCheck(color);
                }),
            destinations.end());
    }

    std::vector<Move> moves;
    moves.reserve(destinations.size() + 2);
    for (const Coordinate& destination : destinations) {
        moves.push_back(logic.classifyMove(coord, destination, promotion));
    }

    std::vector<Move> castling = logic.getCastlingMoves(coord);
    moves.insert(moves.end(), castling.begin(), castling.end());

    return moves;
}

std::vector<MoveInfo> GameState::getAllLegalMoves(Color color) const {
    std::vector<MoveInfo> allMoves;
    for (const Coordinate& coord : m_board.findPieces(color)) {
        for (const Move& move : getMoves(coord, true)) {
            allMoves.push_back({coord, move});
        }
    }
    return allMoves;
}

bool GameState::isInCheck(Color color) const {
    return ChessLogic(m_board).isInCheck(color);
}

bool GameState::isCheckmate(Color color) const {
    if (!isInCheck(color)) {
        return false;
    }

    for (const Coordinate& coord : m_board.findPieces(color)) {
        if (!getMoves(coord, true).empty()) {
            return false;
        }
    }
    return true;
}

GameStatus GameState::getStatus() const {
    if (!m_running) {
        return GameStatus::Checkmate;
    }
    if (isInCheck(m_currentTurn)) {
        return GameStatus::Check;
    }
    return GameStatus::Playing;
}

void GameState::makeMove(const Coordinate& from, const Move& move) {
    if (!move.apply(*this)) {
        m_board.movePiece(from, move.getDestination());
    }
}

void GameState::endTurn() {
    m_currentTurn = flip(m_currentTurn);
    m_board.clearEnPassant(m_currentTurn);

    // Only checkmate ends the game; a side without moves that is not in
    // check keeps the game running.
    if (isCheckmate(m_currentTurn)) {
        m_running = false;
    }
}

bool GameState::selectSquare(const Coordinate& coord) {
    if (!m_running || !coord.isValid()) {
        return false;
    }

    const std::optional<Piece>& piece = m_board.getPiece(coord);
    if (!piece || piece->getColor() != m_currentTurn) {
        return false;
    }

    m_selectedSquare = coord;
    return true;
}

bool GameState::attemptMove(const Coordinate& target) {
    if (!m_selectedSquare) {
        return false;
    }

    Coordinate source = *m_selectedSquare;
    m_selectedSquare.reset();

    if (!m_running || !target.isValid() || source == target) {
        return false;
    }

    const std::optional<Piece>& occupant = m_board.getPiece(target);
    if (occupant && occupant->getColor() == m_board.getPiece(source)->getColor()) {
        return false;
    }

    std::vector<Move> moves = getMoves(source, true);
    auto it = std::find(moves.begin(), moves.end(), target);
    if (it == moves.end()) {
        return false;
    }

    Move chosen = *it;
    makeMove(source, chosen);
    endTurn();
    return true;
}

bool GameState::operator==(const GameState& other) const {
    return m_board == other.m_board
        && m_currentTurn == other.m_currentTurn
        && m_history == other.m_history
        && m_promotionChoice == other.m_promotionChoice
        && m_running == other.m_running;
}

} // namespace Schaak
