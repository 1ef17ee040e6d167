#include <gtest/gtest.h>

#include <stdexcept>

#include "Board.hpp"

namespace Schaak {

TEST(BoardTest, StartingLayout) {
    Board board;
    board.initialize();

    EXPECT_EQ(board.findPieces(Color::White).size(), 16u);
    EXPECT_EQ(board.findPieces(Color::Black).size(), 16u);

    EXPECT_EQ(board.getPiece({0, 0}), Piece(PieceType::Rook, Color::White));
    EXPECT_EQ(board.getPiece({3, 0}), Piece(PieceType::Queen, Color::White));
    EXPECT_EQ(board.getPiece({4, 0}), Piece(PieceType::King, Color::White));
    EXPECT_EQ(board.getPiece({6, 7}), Piece(PieceType::Knight, Color::Black));
    EXPECT_EQ(board.getPiece({3, 7}), Piece(PieceType::Queen, Color::Black));
    EXPECT_EQ(board.getPiece({4, 7}), Piece(PieceType::King, Color::Black));

    for (int file = 0; file < 8; ++file) {
        EXPECT_EQ(board.getPiece({file, 1}), Piece(PieceType::Pawn, Color::White));
        EXPECT_EQ(board.getPiece({file, 6}), Piece(PieceType::Pawn, Color::Black));
        for (int rank = 2; rank < 6; ++rank) {
            EXPECT_TRUE(board.isEmpty({file, rank}));
        }
    }

    EXPECT_EQ(board.findKing(Color::White), (Coordinate{4, 0}));
    EXPECT_EQ(board.findKing(Color::Black), (Coordinate{4, 7}));
}

TEST(BoardTest, SquaresKnowTheirCoordinate) {
    Board board;
    for (int rank = 0; rank < 8; ++rank) {
        for (int file = 0; file < 8; ++file) {
            EXPECT_EQ(board.getSquare(file, rank).coord, (Coordinate{file, rank}));
            EXPECT_TRUE(board.getSquare(file, rank).isEmpty());
            EXPECT_EQ(&board.getSquare(Coordinate{file, rank}), &board.getSquare(file, rank));
        }
    }
}

TEST(BoardTest, MovePieceSetsMovedAndClearsSource) {
    Board board;
    board.setPiece({1, 0}, Piece(PieceType::Knight, Color::White));

    board.movePiece({1, 0}, {2, 2});

    EXPECT_TRUE(board.isEmpty({1, 0}));
    ASSERT_TRUE(board.getPiece({2, 2}).has_value());
    EXPECT_EQ(board.getPiece({2, 2})->getType(), PieceType::Knight);
    EXPECT_TRUE(board.getPiece({2, 2})->hasMoved());
}

TEST(BoardTest, MovePieceReplacesCapturedPiece) {
    Board board;
    board.setPiece({0, 0}, Piece(PieceType::Rook, Color::White));
    board.setPiece({0, 6}, Piece(PieceType::Pawn, Color::Black));

    board.movePiece({0, 0}, {0, 6});

    EXPECT_EQ(board.getPiece({0, 6})->getColor(), Color::White);
    EXPECT_TRUE(board.findPieces(Color::Black).empty());
}

TEST(BoardTest, MissingKingThrows) {
    Board board;
    EXPECT_THROW(board.findKing(Color::White), std::logic_error);

    board.setPiece({4, 7}, Piece(PieceType::King, Color::Black));
    EXPECT_THROW(board.findKing(Color::White), std::logic_error);
    EXPECT_EQ(board.findKing(Color::Black), (Coordinate{4, 7}));
}

TEST(BoardTest, ClearEnPassantOnlyTouchesOneColor) {
    Board board;
    Piece white(PieceType::Pawn, Color::White);
    Piece black(PieceType::Pawn, Color::Black);
    white.setEnPassantEligible(true);
    black.setEnPassantEligible(true);
    board.setPiece({4, 3}, white);
    board.setPiece({3, 4}, black);

    board.clearEnPassant(Color::White);

    EXPECT_FALSE(board.getPiece({4, 3})->isEnPassantEligible());
    EXPECT_TRUE(board.getPiece({3, 4})->isEnPassantEligible());
}

TEST(BoardTest, Equality) {
    Board a;
    Board b;
    a.initialize();
    b.initialize();
    EXPECT_EQ(a, b);

    b.movePiece({4, 1}, {4, 3});
    EXPECT_NE(a, b);

    b.clear();
    EXPECT_EQ(b, Board());
}

} // namespace Schaak
