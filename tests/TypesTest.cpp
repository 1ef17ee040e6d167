#include <gtest/gtest.h>

#include "Types.hpp"
#include "Piece.hpp"
#include "Move.hpp"
#include "MoveTables.hpp"

namespace Schaak {

TEST(CoordinateTest, Properties) {
    Coordinate a1 = {0, 0};
    Coordinate e4 = {4, 3};
    Coordinate e4b = {4, 3};

    EXPECT_NE(a1, e4);
    EXPECT_EQ(e4, e4b);
    EXPECT_TRUE(a1.isValid());
    EXPECT_FALSE((Coordinate{8, 0}).isValid());
    EXPECT_FALSE((Coordinate{0, -1}).isValid());
    EXPECT_EQ(a1.index(), 0);
    EXPECT_EQ((Coordinate{7, 7}).index(), 63);
}

TEST(CoordinateTest, ToString) {
    EXPECT_EQ((Coordinate{0, 0}).toString(), "a1");
    EXPECT_EQ((Coordinate{7, 7}).toString(), "h8");
    EXPECT_EQ((Coordinate{4, 3}).toString(), "e4");
}

TEST(CoordinateTest, FromString) {
    std::optional<Coordinate> e4 = Coordinate::fromString("e4");
    ASSERT_TRUE(e4.has_value());
    EXPECT_EQ(*e4, (Coordinate{4, 3}));
    EXPECT_EQ(Coordinate::fromString("h8"), (Coordinate{7, 7}));

    EXPECT_FALSE(Coordinate::fromString("i1").has_value());
    EXPECT_FALSE(Coordinate::fromString("a9").has_value());
    EXPECT_FALSE(Coordinate::fromString("a0").has_value());
    EXPECT_FALSE(Coordinate::fromString("e").has_value());
    EXPECT_FALSE(Coordinate::fromString("e44").has_value());
}

TEST(ColorTest, Flip) {
    EXPECT_EQ(flip(Color::White), Color::Black);
    EXPECT_EQ(flip(Color::Black), Color::White);
    EXPECT_STREQ(toString(Color::White), "white");
    EXPECT_STREQ(toString(Color::Black), "black");
}

TEST(PieceTest, FromChar) {
    std::optional<Piece> king = Piece::fromChar('K');
    ASSERT_TRUE(king.has_value());
    EXPECT_EQ(king->getType(), PieceType::King);
    EXPECT_EQ(king->getColor(), Color::White);
    EXPECT_FALSE(king->hasMoved());
    EXPECT_FALSE(king->isEnPassantEligible());

    std::optional<Piece> knight = Piece::fromChar('n');
    ASSERT_TRUE(knight.has_value());
    EXPECT_EQ(knight->getType(), PieceType::Knight);
    EXPECT_EQ(knight->getColor(), Color::Black);

    EXPECT_FALSE(Piece::fromChar('x').has_value());
    EXPECT_FALSE(Piece::fromChar('.').has_value());
}

TEST(PieceTest, Flags) {
    Piece pawn(PieceType::Pawn, Color::Black);
    EXPECT_FALSE(pawn.isSliding());

    pawn.setEnPassantEligible(true);
    pawn.setMoved();
    EXPECT_TRUE(pawn.isEnPassantEligible());
    EXPECT_TRUE(pawn.hasMoved());
    EXPECT_NE(pawn, Piece(PieceType::Pawn, Color::Black));

    EXPECT_TRUE(Piece(PieceType::Queen, Color::White).isSliding());
    EXPECT_FALSE(Piece(PieceType::Knight, Color::White).isSliding());
}

TEST(PieceTest, UnicodeChar) {
    EXPECT_EQ(Piece(PieceType::King, Color::White).getUnicodeChar(), U'\u2654');
    EXPECT_EQ(Piece(PieceType::Pawn, Color::White).getUnicodeChar(), U'\u2659');
    EXPECT_EQ(Piece(PieceType::King, Color::Black).getUnicodeChar(), U'\u265A');
    EXPECT_EQ(Piece(PieceType::Pawn, Color::Black).getUnicodeChar(), U'\u265F');
}

TEST(MoveTablesTest, Offsets) {
    EXPECT_EQ(MoveTables::getRookOffsets().size(), 4u);
    EXPECT_EQ(MoveTables::getBishopOffsets().size(), 4u);
    EXPECT_EQ(MoveTables::getQueenOffsets().size(), 8u);
    EXPECT_EQ(MoveTables::getKnightOffsets().size(), 8u);
    EXPECT_EQ(MoveTables::getKingOffsets().size(), 8u);
    EXPECT_TRUE(MoveTables::getOffsets(PieceType::Pawn).empty());

    EXPECT_EQ(MoveTables::getForwardDirection(Color::White), 1);
    EXPECT_EQ(MoveTables::getForwardDirection(Color::Black), -1);
    EXPECT_EQ(MoveTables::getBackRank(Color::Black), 7);
    EXPECT_EQ(MoveTables::getPromotionRank(Color::White), 7);
}

TEST(PerformedMoveTest, ToString) {
    PerformedMove move({4, 1}, {4, 3});
    EXPECT_EQ(move.toString(), "e2e4");
    EXPECT_EQ(move, PerformedMove({4, 1}, {4, 3}));
    EXPECT_NE(move, PerformedMove({4, 1}, {4, 2}));
}

} // namespace Schaak
