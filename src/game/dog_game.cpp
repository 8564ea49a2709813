#include "game/dog_game.hpp"

#include "engine/action_generator.hpp"
#include "engine/round_dealer.hpp"
#include "engine/turn_engine.hpp"
#include "engine/win_detector.hpp"
#include "game/config.hpp"
#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "util/result.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <optional>
#include <string>

DogGame::Settings DogGame::getDefaultSettings() {
    return Settings{
        .seed = 0,
        .playerNames = { "Player 1", "Player 2", "Player 3", "Player 4" },
        .cardExchange = true,
        .verbose = false
    };
}

DogGame::DogGame(const Settings& settings) : m_settings{ settings }, m_rng{ settings.seed } {
    reset();
}

void DogGame::reset() {
    m_rng.seed(m_settings.seed);

    m_state = GameState{
        .phase = GamePhase::Running,
        .round = 1,
        .startedPlayer = 0,
        .activePlayer = 0,
        .players = {},
        .drawPile = buildFullDeck(),
        .discardPile = {},
        .activeCard = std::nullopt,
        .cardExchanged = false,
        .exchangeBuffer = {},
        .seven = std::nullopt
    };

    for (int seat = 0; seat < dog::NumPlayers; ++seat) {
        PlayerState& player = m_state.players[seat];
        player.name = m_settings.playerNames[seat];
        for (int i = 0; i < dog::MarblesPerPlayer; ++i) {
            player.marbles[i] = Marble{ .pos = getKennelStart(seat) + i, .isSafe = false };
        }
    }

    std::shuffle(m_state.drawPile.begin(), m_state.drawPile.end(), m_rng);

    // A full deck always covers the first deal
    Result<int, GameError> dealResult = dealCards(m_state, cardsForRound(m_state.round), m_rng);
    assert(dealResult.isValue());

    if (m_settings.verbose) {
        std::cout << "Round 1 started, dealt " << dealResult.getValue() << " cards to each player.\n";
    }
}

const GameState& DogGame::getState() const {
    return m_state;
}

void DogGame::setState(const GameState& state) {
    m_state = state;
}

ActionSet DogGame::getListAction() const {
    return getLegalActions(m_state, getRuleOptions());
}

Result<TurnOutcome, GameError> DogGame::applyAction(const std::optional<Action>& action) {
    int seat = m_state.activePlayer;
    Result<TurnOutcome, GameError> result = ::applyAction(m_state, action, getRuleOptions(), m_rng);

    if (result.isError()) {
        if (m_settings.verbose) {
            std::cerr << result.getError().message << "\n";
        }
        return result;
    }

    logOutcome(action, seat, result.getValue());
    return result;
}

GameState DogGame::getPlayerView(int seat) const {
    assert(seat >= 0 && seat < dog::NumPlayers);

    GameState view = m_state;
    view.drawPile.clear();
    view.discardPile.clear();

    for (int other = 0; other < dog::NumPlayers; ++other) {
        if (other == seat) {
            continue;
        }
        view.players[other].hand.clear();
        view.exchangeBuffer[other] = std::nullopt;
        if (view.seven) {
            view.seven->snapshot.hands[other].clear();
        }
    }

    return view;
}

const DogGame::Settings& DogGame::getSettings() const {
    return m_settings;
}

RuleOptions DogGame::getRuleOptions() const {
    return RuleOptions{ .cardExchange = m_settings.cardExchange };
}

void DogGame::logOutcome(const std::optional<Action>& action, int seat, TurnOutcome outcome) const {
    if (!m_settings.verbose) {
        return;
    }

    const std::string& name = m_state.players[seat].name;
    if (action) {
        std::cout << name << " played " << getActionName(*action) << ".\n";
    }
    else {
        std::cout << name << " passed.\n";
    }

    switch (outcome) {
        case TurnOutcome::TurnContinues:
        case TurnOutcome::TurnEnded:
            break;
        case TurnOutcome::RoundEnded:
            std::cout << "Round " << m_state.round << " started, dealt " << cardsForRound(m_state.round) << " cards to each player.\n";
            break;
        case TurnOutcome::GameFinished: {
            std::optional<int> team = getWinningTeam(m_state);
            assert(team);
            std::cout << "Team " << *team << " (" << m_state.players[*team].name << " and "
                << m_state.players[getPartnerSeat(*team)].name << ") won in round " << m_state.round << ".\n";
            break;
        }
    }
}
