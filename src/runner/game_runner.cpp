#include "runner/game_runner.hpp"

#include "engine/round_dealer.hpp"
#include "engine/win_detector.hpp"
#include "game/config.hpp"
#include "game/game_interface.hpp"
#include "game/game_types.hpp"
#include "player/player.hpp"
#include "util/result.hpp"

#include <cassert>
#include <optional>

Result<GameRecord, GameError> playGame(IGame& game, const PlayerSeats& players, int maxTurns) {
    GameRecord record;

    for (int turn = 0; turn < maxTurns; ++turn) {
        const GameState& state = game.getState();
        if (state.phase == GamePhase::Finished) {
            break;
        }

        int seat = state.activePlayer;
        int round = state.round;
        assert(players[seat] != nullptr);

        std::optional<Action> action = players[seat]->selectAction(game.getPlayerView(seat), game.getListAction());
        Result<TurnOutcome, GameError> result = game.applyAction(action);
        if (result.isError()) {
            return result.getError();
        }

        assert(countCards(game.getState()) == dog::DeckSize);
        record.turns.push_back(TurnRecord{ .round = round, .seat = seat, .action = action, .outcome = result.getValue() });
    }

    record.winningTeam = getWinningTeam(game.getState());
    record.finalState = game.getState();
    return record;
}
