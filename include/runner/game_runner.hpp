#ifndef GAME_RUNNER_HPP
#define GAME_RUNNER_HPP

#include "game/config.hpp"
#include "game/game_interface.hpp"
#include "game/game_types.hpp"
#include "player/player.hpp"
#include "util/result.hpp"

#include <array>
#include <optional>
#include <vector>

struct TurnRecord {
    int round;
    int seat;
    std::optional<Action> action;
    TurnOutcome outcome;
};

struct GameRecord {
    std::vector<TurnRecord> turns;
    std::optional<int> winningTeam;
    GameState finalState;
};

using PlayerSeats = std::array<IPlayer*, dog::NumPlayers>;

// Plays until a team wins or maxTurns actions have been applied. Every player
// only sees its own view of the state.
Result<GameRecord, GameError> playGame(IGame& game, const PlayerSeats& players, int maxTurns);

#endif // GAME_RUNNER_HPP
