#ifndef RANDOM_PLAYER_HPP
#define RANDOM_PLAYER_HPP

#include "game/game_types.hpp"
#include "player/player.hpp"

#include <cstdint>
#include <optional>
#include <random>

class RandomPlayer final : public IPlayer {
public:
    RandomPlayer(std::uint64_t seed);

    std::optional<Action> selectAction(const GameState& view, const ActionSet& actions) override;

private:
    std::mt19937_64 m_rng;
};

#endif // RANDOM_PLAYER_HPP
