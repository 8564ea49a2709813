#ifndef ACTION_GENERATOR_HPP
#define ACTION_GENERATOR_HPP

#include "game/game_types.hpp"

bool isCardExchangePending(const GameState& state, const RuleOptions& options);

// True while every marble of the active player is still in its kennel
bool isBeginningPhase(const GameState& state);

int getSevenStepsRemaining(const GameState& state);

ActionSet getLegalActions(const GameState& state, const RuleOptions& options);

#endif // ACTION_GENERATOR_HPP
