#include <gtest/gtest.h>

#include "engine/round_dealer.hpp"
#include "game/config.hpp"
#include "game/dog_game.hpp"
#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "player/random_player.hpp"
#include "runner/game_runner.hpp"
#include "runner/self_play.hpp"
#include "util/result.hpp"

#include <optional>
#include <set>

namespace {
void expectValidBoard(const GameState& state) {
    std::set<int> positions;
    for (int seat = 0; seat < dog::NumPlayers; ++seat) {
        for (const Marble& marble : state.players[seat].marbles) {
            EXPECT_TRUE(isOnTrack(marble.pos) || isInKennel(marble.pos, seat) || isInFinish(marble.pos, seat))
                << "seat " << seat << " marble at " << marble.pos;
            positions.insert(marble.pos);
        }
    }
    EXPECT_EQ(positions.size(), dog::NumPlayers * dog::MarblesPerPlayer);
}
} // namespace

TEST(SelfPlayTest, RandomGamesKeepInvariants) {
    static constexpr int NumGames = 5;
    static constexpr int MaxTurns = 2000;

    for (int gameIndex = 0; gameIndex < NumGames; ++gameIndex) {
        DogGame::Settings settings = DogGame::getDefaultSettings();
        settings.seed = 100 + gameIndex;
        settings.cardExchange = (gameIndex % 2 == 0);
        DogGame game(settings);

        RandomPlayer p0(gameIndex * 4 + 1), p1(gameIndex * 4 + 2), p2(gameIndex * 4 + 3), p3(gameIndex * 4 + 4);
        PlayerSeats players = { &p0, &p1, &p2, &p3 };

        int previousRound = game.getState().round;
        for (int turn = 0; turn < MaxTurns && game.getState().phase == GamePhase::Running; ++turn) {
            int seat = game.getState().activePlayer;
            std::optional<Action> action = players[seat]->selectAction(game.getPlayerView(seat), game.getListAction());

            Result<TurnOutcome, GameError> result = game.applyAction(action);
            ASSERT_TRUE(result.isValue()) << result.getError().message;

            const GameState& state = game.getState();
            ASSERT_EQ(countCards(state), dog::DeckSize);
            ASSERT_GE(state.round, previousRound);
            previousRound = state.round;
            expectValidBoard(state);
        }
    }
}

TEST(SelfPlayTest, SameSeedSameGame) {
    DogGame::Settings settings = DogGame::getDefaultSettings();
    settings.seed = 77;

    DogGame first(settings);
    DogGame second(settings);
    RandomPlayer a0(1), a1(2), a2(3), a3(4);
    RandomPlayer b0(1), b1(2), b2(3), b3(4);

    Result<GameRecord, GameError> firstRecord = playGame(first, { &a0, &a1, &a2, &a3 }, 500);
    Result<GameRecord, GameError> secondRecord = playGame(second, { &b0, &b1, &b2, &b3 }, 500);
    ASSERT_TRUE(firstRecord.isValue());
    ASSERT_TRUE(secondRecord.isValue());
    EXPECT_EQ(firstRecord.getValue().finalState, secondRecord.getValue().finalState);
}

TEST(SelfPlayTest, BatchAccountsForEveryGame) {
    SelfPlaySettings settings = getDefaultSelfPlaySettings();
    settings.games = 6;
    settings.threads = 2;
    settings.maxTurns = 1500;
    settings.seed = 3;

    SelfPlaySummary summary = runSelfPlay(settings);
    EXPECT_EQ(summary.failedGames, 0);
    EXPECT_EQ(summary.teamWins[0] + summary.teamWins[1] + summary.unfinishedGames, settings.games);
    EXPECT_GT(summary.totalTurns, 0);
}
