#ifndef WIN_DETECTOR_HPP
#define WIN_DETECTOR_HPP

#include "game/game_types.hpp"

#include <optional>

bool isTeamFinished(const GameState& state, int team);
std::optional<int> getWinningTeam(const GameState& state);

// Marks the game finished the first time a team has all eight marbles home.
// Returns that team once; any later call returns nothing.
std::optional<int> checkWinner(GameState& state);

#endif // WIN_DETECTOR_HPP
