#ifndef TURN_ENGINE_HPP
#define TURN_ENGINE_HPP

#include "engine/round_dealer.hpp"
#include "game/game_types.hpp"
#include "util/result.hpp"

#include <optional>

// Clears the active card and passes the turn on. Deals the next round once the
// turn comes back to the seat that started the round.
Result<TurnOutcome, GameError> advanceTurn(GameState& state, RandomEngine& rng);

// Applies one action for the active seat. No action means fold, or abandon a
// seven in flight. A rejected action leaves the state unchanged.
Result<TurnOutcome, GameError> applyAction(GameState& state, const std::optional<Action>& action, const RuleOptions& options, RandomEngine& rng);

#endif // TURN_ENGINE_HPP
