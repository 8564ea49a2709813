#ifndef PLAYER_HPP
#define PLAYER_HPP

#include "game/game_types.hpp"

#include <optional>

class IPlayer {
public:
    virtual ~IPlayer() = default;

    // Chooses one of the legal actions for the seat that owns the view.
    // No action folds the hand, or abandons a seven in flight.
    virtual std::optional<Action> selectAction(const GameState& view, const ActionSet& actions) = 0;
};

#endif // PLAYER_HPP
