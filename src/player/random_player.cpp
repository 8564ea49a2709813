#include "player/random_player.hpp"

#include "game/game_types.hpp"

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <random>

RandomPlayer::RandomPlayer(std::uint64_t seed) : m_rng{ seed } {}

std::optional<Action> RandomPlayer::selectAction(const GameState& /*view*/, const ActionSet& actions) {
    if (actions.empty()) {
        return std::nullopt;
    }

    std::uniform_int_distribution<std::size_t> distribution(0, actions.size() - 1);
    return *std::next(actions.begin(), static_cast<std::ptrdiff_t>(distribution(m_rng)));
}
