#include "engine/seven_card.hpp"

#include "engine/action_generator.hpp"
#include "engine/board.hpp"
#include "game/config.hpp"
#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "util/result.hpp"

#include <algorithm>
#include <cassert>
#include <optional>
#include <string>
#include <vector>

namespace {
GameError makeSevenError(GameErrorCode code, const Action& action, const std::string& reason) {
    return GameError{ .code = code, .message = "Error: Cannot play " + getActionName(action) + ", " + reason + "." };
}
} // namespace

bool isSevenInProgress(const GameState& state) {
    return state.seven.has_value();
}

BoardSnapshot takeBoardSnapshot(const GameState& state) {
    BoardSnapshot snapshot;
    for (int seat = 0; seat < dog::NumPlayers; ++seat) {
        snapshot.marbles[seat] = state.players[seat].marbles;
        snapshot.hands[seat] = state.players[seat].hand;
    }
    snapshot.activeCard = state.activeCard;
    snapshot.activePlayer = state.activePlayer;
    return snapshot;
}

void restoreBoardSnapshot(GameState& state, const BoardSnapshot& snapshot) {
    for (int seat = 0; seat < dog::NumPlayers; ++seat) {
        state.players[seat].marbles = snapshot.marbles[seat];
        state.players[seat].hand = snapshot.hands[seat];
    }
    state.activeCard = snapshot.activeCard;
    state.activePlayer = snapshot.activePlayer;
}

void rollbackSeven(GameState& state) {
    assert(isSevenInProgress(state));
    BoardSnapshot snapshot = state.seven->snapshot;
    restoreBoardSnapshot(state, snapshot);
    state.seven = std::nullopt;
}

Result<bool, GameError> applySevenStep(GameState& state, const Action& action) {
    assert(action.card.rank == Rank::Seven);

    if (!action.posFrom || !action.posTo) {
        return makeSevenError(GameErrorCode::InvalidAction, action, "a seven needs a start and a destination");
    }

    std::optional<MarbleRef> mover = findMarbleAt(state, *action.posFrom, getMovableSeats(state));
    if (!mover) {
        return makeSevenError(GameErrorCode::InvalidAction, action, "no movable marble at the start position");
    }

    std::optional<Path> path = getPathBetween(mover->seat, *action.posFrom, *action.posTo);
    if (!path) {
        return makeSevenError(GameErrorCode::InvalidAction, action, "the destination is not ahead of the marble");
    }

    int cost = static_cast<int>(path->size());
    int stepsRemaining = getSevenStepsRemaining(state);
    if (cost > stepsRemaining) {
        return makeSevenError(GameErrorCode::StepBudgetExceeded, action,
            "it needs " + std::to_string(cost) + " steps but only " + std::to_string(stepsRemaining) + " remain");
    }

    if (isPathBlocked(state, *path)) {
        return makeSevenError(GameErrorCode::InvalidAction, action, "the path is blocked");
    }

    std::optional<MarbleRef> victim = findFirstMarbleOnPath(state, *path, *mover);
    std::optional<MarbleRef> occupant = findMarbleAt(state, *action.posTo);
    if (occupant && occupant != victim) {
        return makeSevenError(GameErrorCode::InvalidAction, action, "the destination would be shared");
    }

    if (!isSevenInProgress(state)) {
        state.seven = SevenProgress{
            .stepsRemaining = dog::SevenSteps,
            .cardFromHand = !state.activeCard.has_value(),
            .snapshot = takeBoardSnapshot(state)
        };
        state.activeCard = action.card;
    }

    if (victim) {
        sendMarbleHome(state, *victim);
    }
    getMarble(state, *mover).pos = *action.posTo;

    state.seven->stepsRemaining -= cost;
    if (state.seven->stepsRemaining > 0) {
        return false;
    }

    if (state.seven->cardFromHand) {
        std::vector<Card>& hand = state.players[state.activePlayer].hand;
        auto it = std::find(hand.begin(), hand.end(), action.card);
        assert(it != hand.end());
        hand.erase(it);
        state.discardPile.push_back(action.card);
    }
    state.seven = std::nullopt;
    state.activeCard = std::nullopt;
    return true;
}
