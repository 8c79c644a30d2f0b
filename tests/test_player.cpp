#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "core/Board.hpp"
#include "core/MoveStrategy.hpp"
#include "core/Player.hpp"

using ::testing::_;
using ::testing::Return;

class MockMoveInput : public IMoveInput {
public:
    MOCK_METHOD(int, RequestMove, (const Board& board, char mark), (override));
};

TEST(HumanPlayer, DelegatesToInput) {
    MockMoveInput input;
    EXPECT_CALL(input, RequestMove(_, 'X')).WillOnce(Return(6));
    HumanPlayer player('X', input);
    EXPECT_EQ(player.Symbol(), 'X');
    EXPECT_EQ(player.ChooseMove(Board()), 6);
    EXPECT_EQ(player.Describe(), "human");
}

TEST(HumanPlayer, FullBoardDoesNotPrompt) {
    MockMoveInput input;
    EXPECT_CALL(input, RequestMove(_, _)).Times(0);
    HumanPlayer player('O', input);
    EXPECT_FALSE(player.ChooseMove(Board::FromString("XOXXOOOXX")).has_value());
}

TEST(AIPlayer, DefaultsToFirstOpen) {
    AIPlayer player('O');
    player.SetLogMoves(false);
    EXPECT_EQ(player.ChooseMove(Board::FromString("X________")), 1);
    EXPECT_EQ(player.Describe(), "AI (first-open)");
}

TEST(AIPlayer, UsesGivenStrategyAndLeavesBoardAlone) {
    AIPlayer player('O', std::make_unique<WeightedStrategy>(17u));
    player.SetLogMoves(false);
    const Board board = Board::FromString("X________");
    const auto move = player.ChooseMove(board);
    EXPECT_EQ(move, 4);
    EXPECT_EQ(board.MarksPlaced(), 1);
    ASSERT_NE(player.Strategy(), nullptr);
    EXPECT_EQ(player.Strategy()->Name(), "weighted");
}

TEST(AIPlayer, RejectsNullStrategy) {
    EXPECT_THROW(AIPlayer('O', nullptr), std::invalid_argument);
}

TEST(SeatFactory, ParsesSeatKinds) {
    EXPECT_EQ(ParseSeatKind("h"), SeatKind::Human);
    EXPECT_EQ(ParseSeatKind("HUMAN"), SeatKind::Human);
    EXPECT_EQ(ParseSeatKind("f"), SeatKind::FirstOpen);
    EXPECT_EQ(ParseSeatKind("random"), SeatKind::Random);
    EXPECT_EQ(ParseSeatKind("w"), SeatKind::Weighted);
    EXPECT_FALSE(ParseSeatKind("q").has_value());
}

TEST(SeatFactory, HumanSeatNeedsInput) {
    EXPECT_THROW(MakePlayer(SeatKind::Human, 'X', nullptr), std::invalid_argument);

    MockMoveInput input;
    auto human = MakePlayer(SeatKind::Human, 'X', &input);
    EXPECT_EQ(human->Describe(), "human");
}

TEST(SeatFactory, BuildsAiSeats) {
    auto seat = MakePlayer(SeatKind::Random, 'O', nullptr, 3u);
    EXPECT_EQ(seat->Symbol(), 'O');
    EXPECT_EQ(seat->Describe(), "AI (random)");
}
