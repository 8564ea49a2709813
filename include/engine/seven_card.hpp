#ifndef SEVEN_CARD_HPP
#define SEVEN_CARD_HPP

#include "game/game_types.hpp"
#include "util/result.hpp"

bool isSevenInProgress(const GameState& state);

BoardSnapshot takeBoardSnapshot(const GameState& state);
void restoreBoardSnapshot(GameState& state, const BoardSnapshot& snapshot);

// Undoes every partial move of the seven in flight
void rollbackSeven(GameState& state);

// Applies one partial move of a seven. Returns true once all seven steps are
// used, at which point the card is discarded (if it came from the hand) and the
// caller should end the turn. On error the state is untouched.
Result<bool, GameError> applySevenStep(GameState& state, const Action& action);

#endif // SEVEN_CARD_HPP
