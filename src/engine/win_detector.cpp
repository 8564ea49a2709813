#include "engine/win_detector.hpp"

#include "engine/board.hpp"
#include "game/config.hpp"
#include "game/game_types.hpp"
#include "game/game_utils.hpp"

#include <optional>

bool isTeamFinished(const GameState& state, int team) {
    return isSeatFinished(state, team) && isSeatFinished(state, getPartnerSeat(team));
}

std::optional<int> getWinningTeam(const GameState& state) {
    for (int team = 0; team < dog::NumPlayers / 2; ++team) {
        if (isTeamFinished(state, team)) {
            return team;
        }
    }
    return std::nullopt;
}

std::optional<int> checkWinner(GameState& state) {
    if (state.phase == GamePhase::Finished) {
        return std::nullopt;
    }

    std::optional<int> winner = getWinningTeam(state);
    if (winner) {
        state.phase = GamePhase::Finished;
    }
    return winner;
}
