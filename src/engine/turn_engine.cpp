#include "engine/turn_engine.hpp"

#include "engine/action_generator.hpp"
#include "engine/board.hpp"
#include "engine/round_dealer.hpp"
#include "engine/seven_card.hpp"
#include "engine/win_detector.hpp"
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
GameError makeInvalidAction(const std::string& message) {
    return GameError{ .code = GameErrorCode::InvalidAction, .message = "Error: " + message };
}

bool isInHand(const std::vector<Card>& hand, Card card) {
    return std::find(hand.begin(), hand.end(), card) != hand.end();
}

void takeFromHand(std::vector<Card>& hand, Card card) {
    auto it = std::find(hand.begin(), hand.end(), card);
    assert(it != hand.end());
    hand.erase(it);
}

// A card declared through a joker never sat in the hand, so nothing is discarded
void discardPlayedCard(GameState& state, Card card) {
    if (state.activeCard) {
        return;
    }
    takeFromHand(state.players[state.activePlayer].hand, card);
    state.discardPile.push_back(card);
}

Result<TurnOutcome, GameError> finishAction(GameState& state, bool turnOver, RandomEngine& rng) {
    if (checkWinner(state)) {
        state.seven = std::nullopt;
        state.activeCard = std::nullopt;
        return TurnOutcome::GameFinished;
    }

    if (!turnOver) {
        return TurnOutcome::TurnContinues;
    }
    return advanceTurn(state, rng);
}

Result<TurnOutcome, GameError> applyExchange(GameState& state, const std::optional<Action>& action) {
    if (!action) {
        return makeInvalidAction("Every player must give a card to their partner before the round starts.");
    }

    std::vector<Card>& hand = state.players[state.activePlayer].hand;
    if (!isInHand(hand, action->card)) {
        return makeInvalidAction("Cannot exchange " + getCardName(action->card) + ", it is not in the hand.");
    }

    takeFromHand(hand, action->card);
    state.exchangeBuffer[state.activePlayer] = action->card;

    bool allGiven = std::all_of(state.exchangeBuffer.begin(), state.exchangeBuffer.end(), [](const std::optional<Card>& card) {
        return card.has_value();
    });
    if (!allGiven) {
        state.activePlayer = getNextSeat(state.activePlayer);
        return TurnOutcome::TurnEnded;
    }

    for (int seat = 0; seat < dog::NumPlayers; ++seat) {
        state.players[seat].hand.push_back(*state.exchangeBuffer[getPartnerSeat(seat)]);
    }
    for (std::optional<Card>& card : state.exchangeBuffer) {
        card = std::nullopt;
    }
    state.cardExchanged = true;
    state.activePlayer = state.startedPlayer;
    return TurnOutcome::TurnEnded;
}

Result<TurnOutcome, GameError> applyNoAction(GameState& state, RandomEngine& rng) {
    if (isSevenInProgress(state)) {
        rollbackSeven(state);
        return advanceTurn(state, rng);
    }

    std::vector<Card>& hand = state.players[state.activePlayer].hand;
    state.discardPile.insert(state.discardPile.end(), hand.begin(), hand.end());
    hand.clear();
    return advanceTurn(state, rng);
}

Result<TurnOutcome, GameError> applyJokerSwap(GameState& state, const Action& action, const RuleOptions& options) {
    if (action.card.rank != Rank::Joker) {
        return makeInvalidAction("Only a joker can stand in for another card.");
    }
    if (state.activeCard) {
        return makeInvalidAction("Cannot play a joker while " + getCardName(*state.activeCard) + " is active.");
    }
    if (action.cardSwap->rank == Rank::Joker) {
        return makeInvalidAction("A joker cannot stand in for another joker.");
    }
    if (!getLegalActions(state, options).contains(action)) {
        return makeInvalidAction("Joker cannot stand in for " + getCardName(*action.cardSwap) + " now.");
    }

    takeFromHand(state.players[state.activePlayer].hand, action.card);
    state.discardPile.push_back(action.card);
    state.activeCard = action.cardSwap;
    return TurnOutcome::TurnContinues;
}

void applyJackSwap(GameState& state, const Action& action) {
    std::optional<MarbleRef> first = findMarbleAt(state, *action.posFrom);
    std::optional<MarbleRef> second = findMarbleAt(state, *action.posTo);
    assert(first && second);

    getMarble(state, *first).pos = *action.posTo;
    getMarble(state, *second).pos = *action.posFrom;
}

void applyMove(GameState& state, const Action& action) {
    std::optional<MarbleRef> mover = findMarbleAt(state, *action.posFrom, getMovableSeats(state));
    assert(mover);

    std::optional<MarbleRef> occupant = findMarbleAt(state, *action.posTo);
    if (occupant) {
        sendMarbleHome(state, *occupant);
    }

    Marble& marble = getMarble(state, *mover);
    marble.pos = *action.posTo;
    marble.isSafe = true;
}
} // namespace

Result<TurnOutcome, GameError> advanceTurn(GameState& state, RandomEngine& rng) {
    state.activeCard = std::nullopt;
    state.activePlayer = getNextSeat(state.activePlayer);
    if (state.activePlayer != state.startedPlayer) {
        return TurnOutcome::TurnEnded;
    }

    Result<int, GameError> dealResult = dealNextRound(state, rng);
    if (dealResult.isError()) {
        return dealResult.getError();
    }
    return TurnOutcome::RoundEnded;
}

Result<TurnOutcome, GameError> applyAction(GameState& state, const std::optional<Action>& action, const RuleOptions& options, RandomEngine& rng) {
    if (state.phase == GamePhase::Finished) {
        return makeInvalidAction("The game is already finished.");
    }

    if (isCardExchangePending(state, options)) {
        return applyExchange(state, action);
    }

    if (!action) {
        return applyNoAction(state, rng);
    }

    bool cardAvailable = state.activeCard
        ? action->card == *state.activeCard
        : isInHand(state.players[state.activePlayer].hand, action->card);
    if (!cardAvailable) {
        return makeInvalidAction("Cannot play " + getCardName(action->card) + ", it is not available.");
    }

    if (action->cardSwap) {
        return applyJokerSwap(state, *action, options);
    }

    switch (action->card.rank) {
        case Rank::Seven: {
            Result<bool, GameError> stepResult = applySevenStep(state, *action);
            if (stepResult.isError()) {
                return stepResult.getError();
            }
            return finishAction(state, stepResult.getValue(), rng);
        }
        case Rank::Jack:
            if (!getLegalActions(state, options).contains(*action)) {
                return makeInvalidAction("Swap " + getActionName(*action) + " is not allowed.");
            }
            applyJackSwap(state, *action);
            discardPlayedCard(state, action->card);
            return finishAction(state, true, rng);
        case Rank::Two:
        case Rank::Three:
        case Rank::Five:
        case Rank::Six:
        case Rank::Eight:
        case Rank::Nine:
        case Rank::Ten:
        case Rank::King:
        case Rank::Ace:
        case Rank::Joker:
            if (!getLegalActions(state, options).contains(*action)) {
                return makeInvalidAction("Move " + getActionName(*action) + " is not allowed.");
            }
            applyMove(state, *action);
            discardPlayedCard(state, action->card);
            return finishAction(state, true, rng);
        case Rank::Four:
        case Rank::Queen:
            return makeInvalidAction("Card " + getCardName(action->card) + " has no moves.");
    }

    assert(false);
    return makeInvalidAction("Unknown card rank.");
}
