#ifndef ROUND_DEALER_HPP
#define ROUND_DEALER_HPP

#include "game/game_types.hpp"
#include "util/result.hpp"

#include <random>

using RandomEngine = std::mt19937_64;

// 6, 5, 4, 3, 2, then the cycle repeats
int cardsForRound(int round);

// Cards in the piles, the hands, and the exchange buffer
int countCards(const GameState& state);

// Deals from the back of the draw pile, reshuffling the discard pile into it
// when it runs short. Returns the number of cards dealt per seat.
Result<int, GameError> dealCards(GameState& state, int cardsPerPlayer, RandomEngine& rng);

// Moves to the next round: rotates the starting seat, collects the hands,
// and deals the new round's hand size
Result<int, GameError> dealNextRound(GameState& state, RandomEngine& rng);

#endif // ROUND_DEALER_HPP
