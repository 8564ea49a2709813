#include "engine/round_dealer.hpp"

#include "game/config.hpp"
#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "util/result.hpp"

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

int cardsForRound(int round) {
    assert(round >= 1);
    return dog::StartingHandSize + 1 - ((round - 1) % dog::HandSizeCycle + 1);
}

int countCards(const GameState& state) {
    std::size_t count = state.drawPile.size() + state.discardPile.size();
    for (const PlayerState& player : state.players) {
        count += player.hand.size();
    }
    for (const std::optional<Card>& card : state.exchangeBuffer) {
        if (card) {
            ++count;
        }
    }
    return static_cast<int>(count);
}

Result<int, GameError> dealCards(GameState& state, int cardsPerPlayer, RandomEngine& rng) {
    std::size_t needed = static_cast<std::size_t>(cardsPerPlayer) * dog::NumPlayers;

    if (state.drawPile.size() < needed) {
        state.drawPile.insert(state.drawPile.end(), state.discardPile.begin(), state.discardPile.end());
        state.discardPile.clear();
        std::shuffle(state.drawPile.begin(), state.drawPile.end(), rng);
    }

    if (state.drawPile.size() < needed) {
        return GameError{
            .code = GameErrorCode::DeckExhausted,
            .message = "Error: Need " + std::to_string(needed) + " cards to deal but only " + std::to_string(state.drawPile.size()) + " are left."
        };
    }

    for (int i = 0; i < cardsPerPlayer; ++i) {
        for (int seat = 0; seat < dog::NumPlayers; ++seat) {
            int receiver = (state.startedPlayer + seat) % dog::NumPlayers;
            state.players[receiver].hand.push_back(state.drawPile.back());
            state.drawPile.pop_back();
        }
    }

    return cardsPerPlayer;
}

Result<int, GameError> dealNextRound(GameState& state, RandomEngine& rng) {
    ++state.round;
    state.startedPlayer = getNextSeat(state.startedPlayer);
    state.activePlayer = state.startedPlayer;
    state.activeCard = std::nullopt;
    state.cardExchanged = false;
    state.seven = std::nullopt;

    for (PlayerState& player : state.players) {
        state.discardPile.insert(state.discardPile.end(), player.hand.begin(), player.hand.end());
        player.hand.clear();
    }
    for (std::optional<Card>& card : state.exchangeBuffer) {
        if (card) {
            state.discardPile.push_back(*card);
            card = std::nullopt;
        }
    }

    return dealCards(state, cardsForRound(state.round), rng);
}
