#pragma once

#include "Types.hpp"
#include "Board.hpp"
#include "Move.hpp"
#include <optional>
#include <vector>

namespace Schaak {

struct MoveInfo {
    Coordinate from;
    Move move;
};

// Everything a game needs. Copying a GameState gives a complete, independent
// position, which is how the legality filter and the player mirrors work.
class GameState {
public:
    GameState();

    // Back to the starting position
    void reset();

    const Board& getBoard() const { return m_board; }
    Board& getBoard() { return m_board; }

    Color getCurrentTurn() const { return m_currentTurn; }
    void setCurrentTurn(Color color) { m_currentTurn = color; }

    const std::vector<PerformedMove>& getHistory() const { return m_history; }
    void recordMove(const PerformedMove& move) { m_history.push_back(move); }

    PieceType getPromotionChoice() const { return m_promotionChoice; }
    // Rejects Pawn and King
    bool setPromotionChoice(PieceType type);

    bool isRunning() const { return m_running; }

    // Moves for the piece on `coord`, promotions using the pending choice.
    // Throws std::logic_error if the square is empty.
    std::vector<Move> getMoves(const Coordinate& coord, bool filterForChecks) const;
    std::vector<Move> getMoves(const Coordinate& coord, bool filterForChecks, PieceType promotion) const;

    std::vector<MoveInfo> getAllLegalMoves(Color color) const;

    bool isInCheck(Color color) const;
    bool isCheckmate(Color color) const;
    GameStatus getStatus() const;

    // Runs the move's effect, then the plain relocation if the effect left it
    void makeMove(const Coordinate& from, const Move& move);

    // Hands the move to the other side and forgets stale en passant flags
    void endTurn();

    // Selection used by the input layer
    const std::optional<Coordinate>& getSelectedSquare() const { return m_selectedSquare; }
    bool selectSquare(const Coordinate& coord);
    void clearSelection() { m_selectedSquare.reset(); }

    // Moves the selected piece to `target` and ends the turn.
    // Returns false (and does nothing besides dropping the selection) when the
    // move is not legal.
    bool attemptMove(const Coordinate& target);

    // Compares the position and history, not the selection
    bool operator==(const GameState& other) const;
    bool operator!=(const GameState& other) const { return !(*this == other); }

private:
    Board m_board;
    Color m_currentTurn;
    std::vector<PerformedMove> m_history;
    PieceType m_promotionChoice;
    std::optional<Coordinate> m_selectedSquare;
    bool m_running;
};

} // namespace Schaak
