#include <gtest/gtest.h>
#include <initializer_list>
#include <string>
#include <vector>

#include "carrom/core/errors.hpp"
#include "carrom/rules/rule_engine.hpp"

using Components::DiscKind;

namespace {

class FakeBoard : public IBoardControl {
public:
    void returnQueenToCenter() override { ++queenReturns; }

    void resetStriker(Seat seat) override { strikerResets.push_back(seat); }

    int remainingCoins(DiscKind kind) const override {
        switch (kind) {
            case DiscKind::RegularLight:
                return light;
            case DiscKind::RegularDark:
                return dark;
            default:
                return 1;
        }
    }

    int queenReturns = 0;
    std::vector<Seat> strikerResets;
    int light = 9;
    int dark = 9;
};

ShotRecord shotOf(std::initializer_list<DiscKind> kinds) {
    ShotRecord record;
    int id = 1;
    for (auto kind : kinds) {
        record.record(kind == DiscKind::Striker ? 0 : id++, kind);
    }
    return record;
}

MatchConfig twoPlayers() {
    return MatchConfig{};
}

MatchConfig fourPlayers() {
    MatchConfig config;
    config.playerCount = 4;
    return config;
}

TurnOutcome play(RuleEngine& engine, std::initializer_list<DiscKind> kinds) {
    engine.onShotReleased();
    return engine.resolveShot(shotOf(kinds));
}

bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

} // namespace

TEST(RuleEngineTest, FreshMatch) {
    FakeBoard board;
    RuleEngine engine(twoPlayers(), board);

    const MatchState& s = engine.getState();
    EXPECT_EQ(s.scores, std::vector<int>({0, 0}));
    EXPECT_EQ(s.currentPlayer, 1);
    EXPECT_EQ(s.foulCount, 0);
    EXPECT_EQ(s.phase, Phase::AwaitingShot);
    EXPECT_FALSE(s.winner.has_value());
}

TEST(RuleEngineTest, ReleaseBumpsFoulCounterProvisionally) {
    FakeBoard board;
    RuleEngine engine(twoPlayers(), board);

    engine.onShotReleased();
    EXPECT_EQ(engine.phase(), Phase::ShotInFlight);
    EXPECT_EQ(engine.getState().foulCount, 1);
}

TEST(RuleEngineTest, StrikerCaptureIsFoulAndPassesTurn) {
    FakeBoard board;
    RuleEngine engine(twoPlayers(), board);

    TurnOutcome out = play(engine, {DiscKind::Striker});

    EXPECT_TRUE(out.foul);
    EXPECT_TRUE(out.turnPassed);
    EXPECT_TRUE(out.strikerReset);
    EXPECT_EQ(out.currentPlayer, 2);
    EXPECT_TRUE(contains(out.message, "striker"));
    EXPECT_EQ(engine.getState().foulCount, 0);
    ASSERT_EQ(board.strikerResets.size(), 1u);
    EXPECT_EQ(board.strikerResets.back(), Seat::Top);
}

TEST(RuleEngineTest, StrikerCaptureAfterOwnCoinStillPasses) {
    FakeBoard board;
    RuleEngine engine(twoPlayers(), board);

    TurnOutcome out = play(engine, {DiscKind::RegularLight, DiscKind::Striker});

    // Points count, but the foul costs the turn
    EXPECT_EQ(out.scores, std::vector<int>({1, 0}));
    EXPECT_TRUE(out.foul);
    EXPECT_EQ(out.currentPlayer, 2);
}

TEST(RuleEngineTest, StrikerEntryAnywhereInRecordIsFoul) {
    FakeBoard board;
    RuleEngine engine(twoPlayers(), board);

    ShotRecord record;
    record.captures.push_back({3, DiscKind::RegularLight});
    record.captures.push_back({0, DiscKind::Striker});
    EXPECT_TRUE(record.strikerCaptured());

    engine.onShotReleased();
    TurnOutcome out = engine.resolveShot(record);

    EXPECT_TRUE(out.foul);
    EXPECT_TRUE(out.turnPassed);
    EXPECT_EQ(out.currentPlayer, 2);
    EXPECT_TRUE(contains(out.message, "striker"));

    record.clear();
    EXPECT_FALSE(record.strikerCaptured());
}

TEST(RuleEngineTest, OwnCoinScoresAndKeepsTurn) {
    FakeBoard board;
    RuleEngine engine(twoPlayers(), board);

    TurnOutcome out = play(engine, {DiscKind::RegularLight});

    EXPECT_EQ(out.scores, std::vector<int>({1, 0}));
    EXPECT_EQ(out.currentPlayer, 1);
    EXPECT_FALSE(out.turnPassed);
    EXPECT_FALSE(out.foul);
    EXPECT_TRUE(out.strikerReset);
    EXPECT_EQ(engine.getState().foulCount, 0);
    EXPECT_EQ(board.strikerResets.back(), Seat::Bottom);
}

TEST(RuleEngineTest, DarkPlayerScoresDarkCoins) {
    FakeBoard board;
    RuleEngine engine(twoPlayers(), board);

    play(engine, {});                                    // player 1 misses
    TurnOutcome out = play(engine, {DiscKind::RegularDark, DiscKind::RegularDark});

    EXPECT_EQ(out.scores, std::vector<int>({0, 2}));
    EXPECT_EQ(out.currentPlayer, 2);
}

TEST(RuleEngineTest, QueenCoveredInSameShot) {
    FakeBoard board;
    RuleEngine engine(twoPlayers(), board);

    TurnOutcome out = play(engine, {DiscKind::Queen, DiscKind::RegularLight});

    EXPECT_EQ(out.scores, std::vector<int>({4, 0}));
    EXPECT_FALSE(out.turnPassed);
    EXPECT_FALSE(out.queenReturned);
    EXPECT_TRUE(contains(out.message, "covered the queen"));

    const MatchState& s = engine.getState();
    EXPECT_TRUE(s.queenPocketed);
    EXPECT_TRUE(s.queenCovered);
    EXPECT_FALSE(s.pendingCover);
    EXPECT_EQ(board.queenReturns, 0);
}

TEST(RuleEngineTest, QueenCoveredOnFollowingShot) {
    FakeBoard board;
    RuleEngine engine(twoPlayers(), board);

    // Own coin before the queen: the cover is still owed after this shot
    TurnOutcome first = play(engine, {DiscKind::RegularLight, DiscKind::Queen});
    EXPECT_EQ(first.scores, std::vector<int>({1, 0}));
    EXPECT_FALSE(first.turnPassed);
    EXPECT_TRUE(engine.getState().pendingCover);
    EXPECT_EQ(engine.getState().coverOwner, 1);

    TurnOutcome second = play(engine, {DiscKind::RegularLight});
    EXPECT_EQ(second.scores, std::vector<int>({5, 0}));    // exactly +1 +3
    EXPECT_FALSE(engine.getState().pendingCover);
    EXPECT_TRUE(engine.getState().queenCovered);
    EXPECT_EQ(board.queenReturns, 0);
}

TEST(RuleEngineTest, UncoveredQueenReturnsWhenTurnPasses) {
    FakeBoard board;
    RuleEngine engine(twoPlayers(), board);

    TurnOutcome first = play(engine, {DiscKind::Queen});
    EXPECT_TRUE(first.turnPassed);
    EXPECT_TRUE(first.queenReturned);
    EXPECT_FALSE(first.foul);
    EXPECT_EQ(first.currentPlayer, 2);
    EXPECT_EQ(board.queenReturns, 1);

    const MatchState& s = engine.getState();
    EXPECT_FALSE(s.pendingCover);
    EXPECT_FALSE(s.queenPocketed);
    EXPECT_EQ(s.coverOwner, 0);
    EXPECT_EQ(s.foulCount, 0);

    TurnOutcome second = play(engine, {});
    EXPECT_TRUE(second.turnPassed);
    EXPECT_FALSE(second.queenReturned);
    EXPECT_EQ(second.currentPlayer, 1);
    EXPECT_EQ(board.queenReturns, 1);
}

TEST(RuleEngineTest, PendingQueenReturnsOnLaterMiss) {
    FakeBoard board;
    RuleEngine engine(twoPlayers(), board);

    play(engine, {DiscKind::RegularLight, DiscKind::Queen});
    TurnOutcome out = play(engine, {});

    EXPECT_TRUE(out.queenReturned);
    EXPECT_EQ(board.queenReturns, 1);
    EXPECT_FALSE(engine.getState().pendingCover);
    EXPECT_EQ(out.scores, std::vector<int>({1, 0}));
}

TEST(RuleEngineTest, OpponentCoinIsFoul) {
    FakeBoard board;
    RuleEngine engine(twoPlayers(), board);

    TurnOutcome out = play(engine, {DiscKind::RegularDark});

    EXPECT_TRUE(out.foul);
    EXPECT_TRUE(out.turnPassed);
    EXPECT_EQ(out.scores, std::vector<int>({0, 0}));
    EXPECT_TRUE(contains(out.message, "opponent"));
    EXPECT_EQ(engine.getState().foulCount, 1);
}

TEST(RuleEngineTest, OpponentCoinReturnsPendingQueen) {
    FakeBoard board;
    RuleEngine engine(twoPlayers(), board);

    TurnOutcome out = play(engine, {DiscKind::Queen, DiscKind::RegularDark});

    EXPECT_TRUE(out.foul);
    EXPECT_TRUE(out.queenReturned);
    EXPECT_EQ(board.queenReturns, 1);
    EXPECT_EQ(out.currentPlayer, 2);
}

TEST(RuleEngineTest, ThreeCaptureFreeShotsForceFoulSwitch) {
    FakeBoard board;
    RuleEngine engine(twoPlayers(), board);

    TurnOutcome first = play(engine, {});
    EXPECT_EQ(engine.getState().foulCount, 1);
    EXPECT_EQ(first.currentPlayer, 2);
    EXPECT_TRUE(contains(first.message, "Player 2's turn"));

    TurnOutcome second = play(engine, {});
    EXPECT_EQ(engine.getState().foulCount, 2);
    EXPECT_EQ(second.currentPlayer, 1);

    TurnOutcome third = play(engine, {});
    EXPECT_EQ(engine.getState().foulCount, 0);
    EXPECT_EQ(third.currentPlayer, 2);
    EXPECT_TRUE(third.turnPassed);
    EXPECT_TRUE(contains(third.message, "3 consecutive fouls"));
}

TEST(RuleEngineTest, OwnCaptureClearsFoulStreak) {
    FakeBoard board;
    RuleEngine engine(twoPlayers(), board);

    play(engine, {});
    play(engine, {});
    TurnOutcome out = play(engine, {DiscKind::RegularLight});

    EXPECT_EQ(engine.getState().foulCount, 0);
    EXPECT_FALSE(out.turnPassed);
    EXPECT_FALSE(contains(out.message, "consecutive"));
}

TEST(RuleEngineTest, FourPlayersRotateSeats) {
    FakeBoard board;
    RuleEngine engine(fourPlayers(), board);

    std::vector<int> order;
    for (int i = 0; i < 4; ++i) {
        order.push_back(play(engine, {DiscKind::Striker}).currentPlayer);
    }

    EXPECT_EQ(order, std::vector<int>({2, 3, 4, 1}));
    EXPECT_EQ(board.strikerResets,
              std::vector<Seat>({Seat::Right, Seat::Top, Seat::Left, Seat::Bottom}));
}

TEST(RuleEngineTest, FourPlayerPartnersShareColour) {
    FakeBoard board;
    RuleEngine engine(fourPlayers(), board);

    play(engine, {DiscKind::Striker});   // 1 -> 2
    play(engine, {DiscKind::Striker});   // 2 -> 3

    TurnOutcome out = play(engine, {DiscKind::RegularLight});
    EXPECT_EQ(out.scores, std::vector<int>({0, 0, 1, 0}));
    EXPECT_EQ(out.currentPlayer, 3);
    EXPECT_FALSE(out.foul);
}

TEST(RuleEngineTest, LastLightCoinWinsForLightSide) {
    FakeBoard board;
    RuleEngine engine(twoPlayers(), board);

    engine.onShotReleased();
    board.light = 0;
    TurnOutcome out = engine.resolveShot(shotOf({DiscKind::RegularLight}));

    ASSERT_TRUE(out.winner.has_value());
    EXPECT_EQ(*out.winner, 1);
    EXPECT_FALSE(out.strikerReset);
    EXPECT_TRUE(board.strikerResets.empty());
    EXPECT_EQ(engine.phase(), Phase::GameOver);
    EXPECT_TRUE(contains(out.message, "wins"));

    // Finished matches do not take more shots
    EXPECT_THROW(engine.onShotReleased(), RulesError);
    EXPECT_EQ(engine.getState().scores, std::vector<int>({1, 0}));
}

TEST(RuleEngineTest, DarkSideWinsInFourPlayerGame) {
    FakeBoard board;
    RuleEngine engine(fourPlayers(), board);

    play(engine, {DiscKind::Striker});   // 1 -> 2
    play(engine, {DiscKind::Striker});   // 2 -> 3
    play(engine, {DiscKind::Striker});   // 3 -> 4

    engine.onShotReleased();
    board.dark = 0;
    TurnOutcome out = engine.resolveShot(shotOf({DiscKind::RegularDark}));

    ASSERT_TRUE(out.winner.has_value());
    EXPECT_EQ(*out.winner, 2);
    EXPECT_EQ(out.scores, std::vector<int>({0, 0, 0, 1}));
}

TEST(RuleEngineTest, FoulOnWinningShotLeavesCounterInRange) {
    FakeBoard board;
    RuleEngine engine(twoPlayers(), board);

    play(engine, {});   // 1 -> 2
    play(engine, {});   // 2 -> 1
    EXPECT_EQ(engine.getState().foulCount, 2);

    // Player 1 sinks the last dark coin, handing the match to the dark side
    engine.onShotReleased();
    EXPECT_EQ(engine.getState().foulCount, 3);
    board.dark = 0;
    TurnOutcome out = engine.resolveShot(shotOf({DiscKind::RegularDark}));

    EXPECT_TRUE(out.foul);
    ASSERT_TRUE(out.winner.has_value());
    EXPECT_EQ(*out.winner, 2);
    EXPECT_EQ(engine.phase(), Phase::GameOver);
    EXPECT_EQ(engine.getState().foulCount, 0);
}

TEST(RuleEngineTest, MisuseThrows) {
    FakeBoard board;
    RuleEngine engine(twoPlayers(), board);

    EXPECT_THROW(engine.resolveShot(ShotRecord{}), RulesError);

    engine.onShotReleased();
    EXPECT_THROW(engine.onShotReleased(), RulesError);
    EXPECT_EQ(engine.getState().foulCount, 1);
}

TEST(RuleEngineTest, RestoredStateMustMatchPlayerCount) {
    FakeBoard board;
    EXPECT_THROW({ RuleEngine mismatched(fourPlayers(), board, MatchState::initial(2)); }, RulesError);

    MatchState restored = MatchState::initial(2);
    restored.currentPlayer = 2;
    restored.scores = {3, 4};
    RuleEngine engine(twoPlayers(), board, restored);
    EXPECT_EQ(engine.currentPlayer(), 2);
    EXPECT_EQ(engine.getState().scores, std::vector<int>({3, 4}));
}

TEST(MatchStateTest, SidesSeatsAndRotation) {
    EXPECT_EQ(sideOf(1), DiscKind::RegularLight);
    EXPECT_EQ(sideOf(2), DiscKind::RegularDark);
    EXPECT_EQ(sideOf(3), DiscKind::RegularLight);
    EXPECT_EQ(sideOf(4), DiscKind::RegularDark);

    EXPECT_EQ(seatOf(1, 2), Seat::Bottom);
    EXPECT_EQ(seatOf(2, 2), Seat::Top);
    EXPECT_EQ(seatOf(2, 4), Seat::Right);
    EXPECT_EQ(seatOf(4, 4), Seat::Left);

    EXPECT_EQ(nextPlayer(2, 2), 1);
    EXPECT_EQ(nextPlayer(3, 4), 4);
    EXPECT_EQ(nextPlayer(4, 4), 1);
}
