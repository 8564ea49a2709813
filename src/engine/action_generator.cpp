#include "engine/action_generator.hpp"

#include "engine/board.hpp"
#include "game/config.hpp"
#include "game/game_types.hpp"
#include "game/game_utils.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <vector>

namespace {
struct ConsideredMarble {
    MarbleRef ref;
    int pos;
};

std::vector<ConsideredMarble> getConsideredMarbles(const GameState& state, const std::vector<int>& seats) {
    std::vector<ConsideredMarble> marbles;
    for (int seat : seats) {
        for (int i = 0; i < dog::MarblesPerPlayer; ++i) {
            marbles.push_back({ .ref = { seat, i }, .pos = state.players[seat].marbles[i].pos });
        }
    }
    return marbles;
}

void addKennelExitActions(const std::vector<ConsideredMarble>& marbles, Card card, ActionSet& actions) {
    for (const ConsideredMarble& marble : marbles) {
        if (isInKennel(marble.pos, marble.ref.seat)) {
            actions.insert(Action{ .card = card, .posFrom = marble.pos, .posTo = getStartSquare(marble.ref.seat) });
        }
    }
}

void addAceStepActions(const GameState& state, const std::vector<ConsideredMarble>& marbles, Card card, ActionSet& actions) {
    for (const ConsideredMarble& marble : marbles) {
        if (!isOnTrack(marble.pos)) {
            continue;
        }

        int target = (marble.pos + 1) % dog::TrackSize;
        std::optional<MarbleRef> occupant = findMarbleAt(state, target);
        if (occupant && getMarble(state, *occupant).isSafe) {
            continue;
        }
        actions.insert(Action{ .card = card, .posFrom = marble.pos, .posTo = target });
    }
}

void addForwardActions(const GameState& state, const std::vector<ConsideredMarble>& marbles, Card card, int steps, ActionSet& actions) {
    for (const ConsideredMarble& marble : marbles) {
        for (const Path& path : getForwardPaths(marble.ref.seat, marble.pos, steps)) {
            if (!isPathBlocked(state, path)) {
                actions.insert(Action{ .card = card, .posFrom = marble.pos, .posTo = path.back() });
            }
        }
    }
}

void addJackActions(const GameState& state, const std::vector<ConsideredMarble>& marbles, Card card, ActionSet& actions) {
    std::vector<int> ownPositions;
    for (const ConsideredMarble& marble : marbles) {
        if (isOnTrack(marble.pos)) {
            ownPositions.push_back(marble.pos);
        }
    }

    int ownTeam = getTeam(state.activePlayer);
    bool foundOpponent = false;
    for (int seat = 0; seat < dog::NumPlayers; ++seat) {
        if (getTeam(seat) == ownTeam) {
            continue;
        }

        for (const Marble& opponent : state.players[seat].marbles) {
            if (!isOnTrack(opponent.pos) || opponent.isSafe) {
                continue;
            }

            for (int own : ownPositions) {
                foundOpponent = true;
                actions.insert(Action{ .card = card, .posFrom = own, .posTo = opponent.pos });
                actions.insert(Action{ .card = card, .posFrom = opponent.pos, .posTo = own });
            }
        }
    }

    if (foundOpponent) {
        return;
    }

    for (std::size_t i = 0; i < ownPositions.size(); ++i) {
        for (std::size_t j = i + 1; j < ownPositions.size(); ++j) {
            actions.insert(Action{ .card = card, .posFrom = ownPositions[i], .posTo = ownPositions[j] });
            actions.insert(Action{ .card = card, .posFrom = ownPositions[j], .posTo = ownPositions[i] });
        }
    }
}

void addJokerActions(const GameState& state, const std::vector<ConsideredMarble>& marbles, Card card, ActionSet& actions) {
    addKennelExitActions(marbles, card, actions);

    bool beginningPhase = isBeginningPhase(state);
    for (int suit = 0; suit < dog::NumSuits; ++suit) {
        for (int rank = 0; rank < dog::NumSuitedRanks; ++rank) {
            Rank swapRank = static_cast<Rank>(rank);
            if (beginningPhase && swapRank != Rank::Ace && swapRank != Rank::King) {
                continue;
            }
            actions.insert(Action{ .card = card, .cardSwap = Card{ static_cast<Suit>(suit), swapRank } });
        }
    }
}

void addSevenActions(const GameState& state, const std::vector<ConsideredMarble>& marbles, Card card, ActionSet& actions) {
    int stepsRemaining = getSevenStepsRemaining(state);
    for (const ConsideredMarble& marble : marbles) {
        for (int steps = 1; steps <= stepsRemaining; ++steps) {
            for (const Path& path : getForwardPaths(marble.ref.seat, marble.pos, steps)) {
                if (isPathBlocked(state, path)) {
                    continue;
                }

                // Only the first marble met is sent home, so a second one on the
                // destination would end up sharing the square with the mover
                std::optional<MarbleRef> occupant = findMarbleAt(state, path.back());
                if (occupant && findFirstMarbleOnPath(state, path, marble.ref) != occupant) {
                    continue;
                }

                actions.insert(Action{ .card = card, .posFrom = marble.pos, .posTo = path.back() });
            }
        }
    }
}

void addActionsForCard(const GameState& state, const std::vector<int>& seats, Card card, ActionSet& actions) {
    std::vector<ConsideredMarble> marbles = getConsideredMarbles(state, seats);

    switch (card.rank) {
        case Rank::Two:
        case Rank::Three:
        case Rank::Five:
        case Rank::Six:
        case Rank::Eight:
        case Rank::Nine:
        case Rank::Ten:
            addForwardActions(state, marbles, card, *getForwardSteps(card.rank), actions);
            break;
        case Rank::Seven:
            addSevenActions(state, marbles, card, actions);
            break;
        case Rank::Jack:
            addJackActions(state, marbles, card, actions);
            break;
        case Rank::Ace:
            addKennelExitActions(marbles, card, actions);
            addAceStepActions(state, marbles, card, actions);
            break;
        case Rank::King:
            addKennelExitActions(marbles, card, actions);
            break;
        case Rank::Joker:
            addJokerActions(state, marbles, card, actions);
            break;
        case Rank::Four:
        case Rank::Queen:
            break;
    }
}
} // namespace

bool isCardExchangePending(const GameState& state, const RuleOptions& options) {
    return options.cardExchange && !state.cardExchanged;
}

bool isBeginningPhase(const GameState& state) {
    const MarbleArray& marbles = state.players[state.activePlayer].marbles;
    return std::all_of(marbles.begin(), marbles.end(), [&state](const Marble& marble) {
        return isInKennel(marble.pos, state.activePlayer);
    });
}

int getSevenStepsRemaining(const GameState& state) {
    return state.seven ? state.seven->stepsRemaining : dog::SevenSteps;
}

ActionSet getLegalActions(const GameState& state, const RuleOptions& options) {
    ActionSet actions;
    if (state.phase == GamePhase::Finished) {
        return actions;
    }

    const std::vector<Card>& hand = state.players[state.activePlayer].hand;

    if (isCardExchangePending(state, options)) {
        for (Card card : hand) {
            actions.insert(Action{ .card = card });
        }
        return actions;
    }

    std::vector<int> seats = getMovableSeats(state);
    if (state.activeCard) {
        addActionsForCard(state, seats, *state.activeCard, actions);
    }
    else {
        for (Card card : hand) {
            addActionsForCard(state, seats, card, actions);
        }
    }

    return actions;
}
