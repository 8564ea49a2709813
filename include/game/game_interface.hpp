#ifndef GAME_INTERFACE_HPP
#define GAME_INTERFACE_HPP

#include "game/game_types.hpp"
#include "util/result.hpp"

#include <optional>

class IGame {
public:
    virtual ~IGame() = default;

    // Functions for managing the whole state
    virtual void reset() = 0;
    virtual const GameState& getState() const = 0;
    virtual void setState(const GameState& state) = 0;

    // Functions for playing turns
    virtual ActionSet getListAction() const = 0;
    virtual Result<TurnOutcome, GameError> applyAction(const std::optional<Action>& action) = 0;

    // Functions for players
    virtual GameState getPlayerView(int seat) const = 0;
};

#endif // GAME_INTERFACE_HPP
