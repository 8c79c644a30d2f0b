#include <gtest/gtest.h>
#include <memory>
#include "TestPlayers.hpp"
#include "core/Match.hpp"
#include "core/MoveStrategy.hpp"

namespace {

std::unique_ptr<Player> Quiet(SeatKind kind, char symbol, unsigned seed) {
    auto player = MakePlayer(kind, symbol, nullptr, seed);
    static_cast<AIPlayer&>(*player).SetLogMoves(false);
    return player;
}

std::unique_ptr<Player> Script(char symbol, std::vector<std::optional<int>> moves) {
    return std::make_unique<ScriptedPlayer>(symbol, std::move(moves));
}

class RecordingDisplay : public IMatchDisplay {
public:
    void ShowBoard(const Board& board) override { boards.push_back(board.MarksPlaced()); }
    void ShowResult(const MatchResult& result) override { results.push_back(result); }

    std::vector<int> boards;
    std::vector<MatchResult> results;
};

} // namespace

TEST(Match, StartsOngoingWithFirstSeat) {
    Match match(Quiet(SeatKind::FirstOpen, 'X', 0), Quiet(SeatKind::FirstOpen, 'O', 0));
    EXPECT_EQ(match.Status(), MatchStatus::Ongoing);
    EXPECT_TRUE(match.GetBoard().IsEmpty());
    EXPECT_EQ(match.Current().Symbol(), 'X');
}

TEST(Match, FirstOpenOpensAtZeroAndPassesTurn) {
    Match match(Quiet(SeatKind::FirstOpen, 'X', 0), Quiet(SeatKind::FirstOpen, 'O', 0));
    EXPECT_EQ(match.Step(), MatchStatus::Ongoing);
    EXPECT_EQ(match.GetBoard().At(0), 'X');
    EXPECT_EQ(match.Current().Symbol(), 'O');
}

TEST(Match, FirstOpenMirrorGameWinsOnDiagonal) {
    Match match(Quiet(SeatKind::FirstOpen, 'X', 0), Quiet(SeatKind::FirstOpen, 'O', 0));
    const MatchResult result = match.Play();
    EXPECT_EQ(result.status, MatchStatus::Won);
    EXPECT_EQ(result.winner, 'X');
    EXPECT_EQ(result.moves, (std::vector<int>{0, 1, 2, 3, 4, 5, 6}));
}

TEST(Match, FullBoardWithoutLineIsDrawn) {
    Match match(Script('X', {0, 2, 3, 7, 8}), Script('O', {1, 4, 5, 6}));
    const MatchResult result = match.Play();
    EXPECT_EQ(result.status, MatchStatus::Drawn);
    EXPECT_FALSE(result.winner.has_value());
    EXPECT_TRUE(match.GetBoard().IsFull());
    EXPECT_FALSE(match.GetBoard().Winner().has_value());
    EXPECT_EQ(result.moves.size(), 9u);
}

TEST(Match, WinOnLastCellBeatsDraw) {
    // X completes 2-4-6 with the ninth mark.
    Match match(Script('X', {0, 2, 4, 7, 6}), Script('O', {1, 3, 5, 8}));
    EXPECT_EQ(match.Play().status, MatchStatus::Won);
    EXPECT_EQ(match.WinnerMark(), 'X');
}

TEST(Match, IllegalMoveAbortsTurn) {
    Match match(Script('X', {0}), Script('O', {0, 9}));
    match.Step();
    EXPECT_THROW(match.Step(), IllegalMoveError);
    EXPECT_EQ(match.GetBoard().MarksPlaced(), 1);
    EXPECT_EQ(match.Current().Symbol(), 'O');
    EXPECT_EQ(match.Status(), MatchStatus::Ongoing);

    EXPECT_THROW(match.Step(), IllegalMoveError);
    EXPECT_EQ(match.History(), (std::vector<int>{0}));
}

TEST(Match, MissingMoveIsRejected) {
    Match match(Script('X', {std::nullopt}), Script('O', {}));
    EXPECT_THROW(match.Step(), IllegalMoveError);
    EXPECT_TRUE(match.GetBoard().IsEmpty());
}

TEST(Match, StepAfterEndThrows) {
    Match match(Quiet(SeatKind::FirstOpen, 'X', 0), Quiet(SeatKind::FirstOpen, 'O', 0));
    match.Play();
    EXPECT_THROW(match.Step(), std::logic_error);
}

TEST(Match, RejectsMalformedSetup) {
    EXPECT_THROW(Match(Quiet(SeatKind::FirstOpen, 'X', 0), Quiet(SeatKind::Random, 'X', 0)),
                 MatchSetupError);
    EXPECT_THROW(Match(Quiet(SeatKind::FirstOpen, Board::kEmpty, 0), Quiet(SeatKind::Random, 'O', 0)),
                 MatchSetupError);
    EXPECT_THROW(Match(nullptr, Quiet(SeatKind::Random, 'O', 0)), MatchSetupError);
    EXPECT_THROW(Match(Quiet(SeatKind::FirstOpen, 'X', 0), Quiet(SeatKind::Random, 'O', 0),
                       Board::FromString("____X____")),
                 MatchSetupError);
}

TEST(Match, DisplaySeesEverySnapshotAndOneResult) {
    Match match(Quiet(SeatKind::FirstOpen, 'X', 0), Quiet(SeatKind::FirstOpen, 'O', 0));
    RecordingDisplay display;
    match.Play(&display);
    EXPECT_EQ(display.boards, (std::vector<int>{0, 1, 2, 3, 4, 5, 6, 7}));
    ASSERT_EQ(display.results.size(), 1u);
    EXPECT_EQ(display.results[0].winner, 'X');
}

TEST(Match, RandomGamesEndWithinNineMoves) {
    for (unsigned seed = 0; seed < 200; ++seed) {
        const SeatKind kindX = (seed % 2 == 0) ? SeatKind::Random : SeatKind::Weighted;
        Match match(Quiet(kindX, 'X', seed), Quiet(SeatKind::Random, 'O', seed + 7919));
        while (match.Status() == MatchStatus::Ongoing) {
            match.Step();
            const Board& board = match.GetBoard();
            if (board.MarksPlaced() < 5) {
                EXPECT_FALSE(board.Winner().has_value());
            }
        }
        EXPECT_LE(match.History().size(), 9u);
        if (match.Status() == MatchStatus::Won) {
            EXPECT_GE(match.History().size(), 5u);
            // The winner is whoever moved last.
            const char last = (match.History().size() % 2 == 1) ? 'X' : 'O';
            EXPECT_EQ(match.WinnerMark(), last);
        } else {
            EXPECT_EQ(match.History().size(), 9u);
        }
    }
}

TEST(Match, ResetStartsAFreshGameWithSameSeats) {
    Match match(Quiet(SeatKind::Weighted, 'X', 4), Quiet(SeatKind::FirstOpen, 'O', 0));
    match.Play();
    match.Reset();
    EXPECT_EQ(match.Status(), MatchStatus::Ongoing);
    EXPECT_TRUE(match.GetBoard().IsEmpty());
    EXPECT_TRUE(match.History().empty());
    EXPECT_FALSE(match.WinnerMark().has_value());
    EXPECT_EQ(match.Current().Symbol(), 'X');
    EXPECT_EQ(match.Seat(0).Describe(), "AI (weighted)");

    const MatchResult again = match.Play();
    EXPECT_NE(again.status, MatchStatus::Ongoing);
}

TEST(Match, StatusNames) {
    EXPECT_EQ(ToString(MatchStatus::Ongoing), "ongoing");
    EXPECT_EQ(ToString(MatchStatus::Won), "won");
    EXPECT_EQ(ToString(MatchStatus::Drawn), "drawn");
}
