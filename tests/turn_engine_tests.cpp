#include <gtest/gtest.h>

#include "engine/round_dealer.hpp"
#include "game/config.hpp"
#include "game/game_types.hpp"
#include "test_utils.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

class TurnEngineTest : public DogGameTest {
protected:
    static Action move(const std::string& cardName, int from, int to) {
        return Action{ .card = makeCard(cardName), .posFrom = from, .posTo = to };
    }

    static Action substitute(const std::string& cardName) {
        return Action{ .card = makeCard("JKR"), .cardSwap = makeCard(cardName) };
    }

    void expectRejected(const std::optional<Action>& action, GameErrorCode code) {
        GameState before = game.getState();
        Result<TurnOutcome, GameError> result = game.applyAction(action);
        ASSERT_TRUE(result.isError());
        EXPECT_EQ(result.getError().code, code);
        EXPECT_EQ(game.getState(), before);
    }
};

TEST_F(TurnEngineTest, FoldDiscardsHand) {
    giveCard(0, "4h");
    giveCard(0, "Qs");
    commit();
    std::size_t discardSize = game.getState().discardPile.size();

    ASSERT_TRUE(game.getListAction().empty());
    Result<TurnOutcome, GameError> result = game.applyAction(std::nullopt);
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.getValue(), TurnOutcome::TurnEnded);

    const GameState& after = game.getState();
    EXPECT_TRUE(after.players[0].hand.empty());
    EXPECT_EQ(after.discardPile.size(), discardSize + 2);
    EXPECT_EQ(after.activePlayer, 1);
    EXPECT_EQ(countCards(after), dog::DeckSize);
}

TEST_F(TurnEngineTest, EmptyHandPasses) {
    commit();

    Result<TurnOutcome, GameError> result = game.applyAction(std::nullopt);
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(game.getState().activePlayer, 1);
    EXPECT_EQ(countCards(game.getState()), dog::DeckSize);
}

TEST_F(TurnEngineTest, TwoMovesToFreeSquare) {
    placeMarble(0, 0, 10);
    giveCard(0, "2c");
    commit();

    Result<TurnOutcome, GameError> result = game.applyAction(move("2c", 10, 12));
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(marbleAt(0, 0), (Marble{ .pos = 12, .isSafe = true }));
}

TEST_F(TurnEngineTest, FoldAllowedWithLegalActions) {
    giveCard(0, "Ah");
    commit();

    ASSERT_FALSE(game.getListAction().empty());
    Result<TurnOutcome, GameError> result = game.applyAction(std::nullopt);
    ASSERT_TRUE(result.isValue());
    EXPECT_TRUE(game.getState().players[0].hand.empty());
}

TEST_F(TurnEngineTest, MarbleLeavesKennel) {
    giveCard(0, "Ah");
    commit();

    Result<TurnOutcome, GameError> result = game.applyAction(move("Ah", 64, 0));
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.getValue(), TurnOutcome::TurnEnded);

    EXPECT_EQ(marbleAt(0, 0), (Marble{ .pos = 0, .isSafe = true }));
    EXPECT_TRUE(game.getState().players[0].hand.empty());
    EXPECT_EQ(game.getState().discardPile.back(), makeCard("Ah"));
    EXPECT_EQ(game.getState().activePlayer, 1);
}

TEST_F(TurnEngineTest, NumberedMoveCapturesOpponent) {
    placeMarble(0, 0, 10);
    placeMarble(1, 0, 15);
    giveCard(0, "5s");
    commit();

    Result<TurnOutcome, GameError> result = game.applyAction(move("5s", 10, 15));
    ASSERT_TRUE(result.isValue());

    EXPECT_EQ(marbleAt(0, 0), (Marble{ .pos = 15, .isSafe = true }));
    EXPECT_EQ(marbleAt(1, 0), (Marble{ .pos = 72, .isSafe = false }));
}

TEST_F(TurnEngineTest, KennelExitCapturesOpponentOnStart) {
    placeMarble(1, 0, 0, true);
    giveCard(0, "Kh");
    commit();

    Result<TurnOutcome, GameError> result = game.applyAction(move("Kh", 64, 0));
    ASSERT_TRUE(result.isValue());

    EXPECT_EQ(marbleAt(0, 0), (Marble{ .pos = 0, .isSafe = true }));
    EXPECT_EQ(marbleAt(1, 0), (Marble{ .pos = 72, .isSafe = false }));
    EXPECT_EQ(countCards(game.getState()), dog::DeckSize);
}

TEST_F(TurnEngineTest, KennelExitCapturesOwnMarbleOnStart) {
    placeMarble(0, 1, 0, true);
    giveCard(0, "Kh");
    commit();

    Result<TurnOutcome, GameError> result = game.applyAction(move("Kh", 64, 0));
    ASSERT_TRUE(result.isValue());

    EXPECT_EQ(marbleAt(0, 0), (Marble{ .pos = 0, .isSafe = true }));
    EXPECT_EQ(marbleAt(0, 1), (Marble{ .pos = 65, .isSafe = false }));
}

TEST_F(TurnEngineTest, JackSwapsMarbles) {
    placeMarble(0, 0, 5, true);
    placeMarble(1, 0, 20);
    giveCard(0, "Js");
    commit();

    Result<TurnOutcome, GameError> result = game.applyAction(move("Js", 5, 20));
    ASSERT_TRUE(result.isValue());

    EXPECT_EQ(marbleAt(0, 0), (Marble{ .pos = 20, .isSafe = true }));
    EXPECT_EQ(marbleAt(1, 0), (Marble{ .pos = 5, .isSafe = false }));
    EXPECT_TRUE(game.getState().players[0].hand.empty());
}

TEST_F(TurnEngineTest, JokerSubstitutionIsVirtual) {
    placeMarble(0, 0, 5);
    giveCard(0, "JKR");
    commit();
    std::size_t discardSize = game.getState().discardPile.size();

    Result<TurnOutcome, GameError> swapResult = game.applyAction(substitute("5h"));
    ASSERT_TRUE(swapResult.isValue());
    EXPECT_EQ(swapResult.getValue(), TurnOutcome::TurnContinues);
    EXPECT_EQ(game.getState().activeCard, makeCard("5h"));
    EXPECT_EQ(game.getState().activePlayer, 0);
    EXPECT_EQ(game.getState().discardPile.size(), discardSize + 1);

    ActionSet expected = { move("5h", 5, 10) };
    ASSERT_EQ(game.getListAction(), expected);

    Result<TurnOutcome, GameError> moveResult = game.applyAction(move("5h", 5, 10));
    ASSERT_TRUE(moveResult.isValue());
    EXPECT_EQ(moveResult.getValue(), TurnOutcome::TurnEnded);
    EXPECT_EQ(marbleAt(0, 0).pos, 10);
    EXPECT_EQ(game.getState().activeCard, std::nullopt);
    EXPECT_EQ(game.getState().discardPile.size(), discardSize + 1);
    EXPECT_EQ(countCards(game.getState()), dog::DeckSize);
}

TEST_F(TurnEngineTest, JokerCannotStandInForJoker) {
    giveCard(0, "JKR");
    commit();

    expectRejected(Action{ .card = makeCard("JKR"), .cardSwap = makeCard("JKR") }, GameErrorCode::InvalidAction);
}

TEST_F(TurnEngineTest, JokerCannotSwapWhileCardActive) {
    giveCard(0, "JKR");
    state.activeCard = makeCard("5h");
    commit();

    expectRejected(substitute("Ah"), GameErrorCode::InvalidAction);
}

TEST_F(TurnEngineTest, JokerLimitedToStartCardsInBeginningPhase) {
    giveCard(0, "JKR");
    commit();

    ASSERT_FALSE(game.getListAction().contains(substitute("7c")));
    expectRejected(substitute("7c"), GameErrorCode::InvalidAction);
    EXPECT_EQ(game.getState().activeCard, std::nullopt);

    Result<TurnOutcome, GameError> result = game.applyAction(substitute("Kc"));
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(game.getState().activeCard, makeCard("Kc"));
}

TEST_F(TurnEngineTest, RejectsCardNotInHand) {
    giveCard(0, "2s");
    commit();

    expectRejected(move("Ah", 64, 0), GameErrorCode::InvalidAction);
}

TEST_F(TurnEngineTest, RejectsMoveOfMarbleNotOwned) {
    placeMarble(1, 0, 10);
    giveCard(0, "5s");
    commit();

    expectRejected(move("5s", 10, 15), GameErrorCode::InvalidAction);
}

TEST_F(TurnEngineTest, RejectsBlockedMove) {
    placeMarble(0, 0, 10);
    placeMarble(1, 0, 13, true);
    giveCard(0, "5s");
    commit();

    expectRejected(move("5s", 10, 15), GameErrorCode::InvalidAction);
}

TEST_F(TurnEngineTest, RejectsActionsAfterGameFinished) {
    giveCard(0, "Ah");
    state.phase = GamePhase::Finished;
    commit();

    expectRejected(move("Ah", 64, 0), GameErrorCode::InvalidAction);
    expectRejected(std::nullopt, GameErrorCode::InvalidAction);
}

TEST_F(TurnEngineTest, LastSeatStartsNextRound) {
    state.activePlayer = 3;
    for (int seat = 0; seat < dog::NumPlayers; ++seat) {
        giveCard(seat, "Qh");
    }
    commit();

    Result<TurnOutcome, GameError> result = game.applyAction(std::nullopt);
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.getValue(), TurnOutcome::RoundEnded);

    const GameState& after = game.getState();
    EXPECT_EQ(after.round, 2);
    EXPECT_EQ(after.startedPlayer, 1);
    EXPECT_EQ(after.activePlayer, 1);
    for (const PlayerState& player : after.players) {
        EXPECT_EQ(player.hand.size(), 5);
    }
    EXPECT_EQ(countCards(after), dog::DeckSize);
}

class CardExchangeTest : public DogGameTest {
protected:
    static DogGame::Settings getExchangeSettings() {
        DogGame::Settings settings = getTestSettings();
        settings.cardExchange = true;
        return settings;
    }

    CardExchangeTest() : DogGameTest(getExchangeSettings()) {}
};

TEST_F(CardExchangeTest, CardsGoToPartner) {
    const std::string suits = "shdc";
    for (int seat = 0; seat < dog::NumPlayers; ++seat) {
        giveCard(seat, std::string{ '2', suits[seat] });
        giveCard(seat, std::string{ '3', suits[seat] });
    }
    state.cardExchanged = false;
    commit();

    for (int seat = 0; seat < dog::NumPlayers; ++seat) {
        ASSERT_EQ(game.getState().activePlayer, seat);
        Result<TurnOutcome, GameError> result = game.applyAction(Action{ .card = makeCard(std::string{ '2', suits[seat] }) });
        ASSERT_TRUE(result.isValue());
        EXPECT_EQ(countCards(game.getState()), dog::DeckSize);
    }

    const GameState& after = game.getState();
    EXPECT_TRUE(after.cardExchanged);
    EXPECT_EQ(after.activePlayer, after.startedPlayer);
    EXPECT_EQ(after.players[0].hand, (std::vector<Card>{ makeCard("3s"), makeCard("2d") }));
    EXPECT_EQ(after.players[1].hand, (std::vector<Card>{ makeCard("3h"), makeCard("2c") }));
    EXPECT_EQ(after.players[2].hand, (std::vector<Card>{ makeCard("3d"), makeCard("2s") }));
    EXPECT_EQ(after.players[3].hand, (std::vector<Card>{ makeCard("3c"), makeCard("2h") }));
    for (const std::optional<Card>& card : after.exchangeBuffer) {
        EXPECT_FALSE(card.has_value());
    }
}

TEST_F(CardExchangeTest, ExchangeNeedsACardFromHand) {
    giveCard(0, "2s");
    state.cardExchanged = false;
    commit();

    GameState before = game.getState();
    Result<TurnOutcome, GameError> noneResult = game.applyAction(std::nullopt);
    ASSERT_TRUE(noneResult.isError());
    EXPECT_EQ(noneResult.getError().code, GameErrorCode::InvalidAction);

    Result<TurnOutcome, GameError> missingResult = game.applyAction(Action{ .card = makeCard("Ah") });
    ASSERT_TRUE(missingResult.isError());
    EXPECT_EQ(game.getState(), before);
}
