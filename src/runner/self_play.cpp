#include "runner/self_play.hpp"

#include "engine/round_dealer.hpp"
#include "game/config.hpp"
#include "game/dog_game.hpp"
#include "player/random_player.hpp"
#include "runner/game_runner.hpp"
#include "util/result.hpp"
#include "util/scoped_timer.hpp"

#include <array>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace {
struct GameSummary {
    std::optional<int> winningTeam;
    int turns;
    std::optional<std::string> error;
};

GameSummary playSelfPlayGame(const SelfPlaySettings& settings, int gameIndex) {
    RandomEngine seeder{ settings.seed + static_cast<std::uint64_t>(gameIndex) };

    DogGame::Settings gameSettings = DogGame::getDefaultSettings();
    gameSettings.seed = seeder();
    gameSettings.cardExchange = settings.cardExchange;
    DogGame game(gameSettings);

    std::array<RandomPlayer, dog::NumPlayers> players = {
        RandomPlayer(seeder()), RandomPlayer(seeder()), RandomPlayer(seeder()), RandomPlayer(seeder())
    };
    PlayerSeats seats = { &players[0], &players[1], &players[2], &players[3] };

    Result<GameRecord, GameError> result = playGame(game, seats, settings.maxTurns);
    if (result.isError()) {
        return GameSummary{ .winningTeam = std::nullopt, .turns = 0, .error = result.getError().message };
    }

    const GameRecord& record = result.getValue();
    return GameSummary{ .winningTeam = record.winningTeam, .turns = static_cast<int>(record.turns.size()), .error = std::nullopt };
}
} // namespace

SelfPlaySettings getDefaultSelfPlaySettings() {
    return SelfPlaySettings{
        .games = 100,
        .threads = 1,
        .maxTurns = 5000,
        .seed = 0,
        .cardExchange = true
    };
}

SelfPlaySummary runSelfPlay(const SelfPlaySettings& settings) {
    std::vector<GameSummary> gameSummaries(settings.games);

    {
        ScopedTimer timer("Playing " + std::to_string(settings.games) + " games...", "Finished playing");

        #ifdef _OPENMP
        omp_set_num_threads(settings.threads);

        #pragma omp parallel
        {
            #pragma omp single
            std::cout << "Playing in parallel with " << omp_get_num_threads() << " threads.\n" << std::flush;

            #pragma omp for schedule(dynamic)
            for (int i = 0; i < settings.games; ++i) {
                gameSummaries[i] = playSelfPlayGame(settings, i);
            }
        }
        #else
        std::cout << "Playing in single-threaded mode.\n" << std::flush;
        for (int i = 0; i < settings.games; ++i) {
            gameSummaries[i] = playSelfPlayGame(settings, i);
        }
        #endif
    }

    SelfPlaySummary summary{ .teamWins = { 0, 0 }, .unfinishedGames = 0, .failedGames = 0, .totalTurns = 0 };
    for (int i = 0; i < settings.games; ++i) {
        const GameSummary& game = gameSummaries[i];
        if (game.error) {
            std::cerr << *game.error << " (game " << i << ")\n";
            ++summary.failedGames;
            continue;
        }

        summary.totalTurns += game.turns;
        if (game.winningTeam) {
            ++summary.teamWins[*game.winningTeam];
        }
        else {
            ++summary.unfinishedGames;
        }
    }

    std::cout << "Team 0 wins: " << summary.teamWins[0] << ", team 1 wins: " << summary.teamWins[1]
        << ", unfinished: " << summary.unfinishedGames << ", failed: " << summary.failedGames
        << ", turns played: " << summary.totalTurns << "\n";

    return summary;
}
