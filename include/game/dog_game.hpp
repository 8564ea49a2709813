#ifndef DOG_GAME_HPP
#define DOG_GAME_HPP

#include "engine/round_dealer.hpp"
#include "game/config.hpp"
#include "game/game_interface.hpp"
#include "game/game_types.hpp"
#include "util/result.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>

class DogGame final : public IGame {
public:
    struct Settings {
        std::uint64_t seed;
        std::array<std::string, dog::NumPlayers> playerNames;
        bool cardExchange;
        bool verbose;
    };

    static Settings getDefaultSettings();

    DogGame(const Settings& settings);

    void reset() override;
    const GameState& getState() const override;
    void setState(const GameState& state) override;
    ActionSet getListAction() const override;
    Result<TurnOutcome, GameError> applyAction(const std::optional<Action>& action) override;
    GameState getPlayerView(int seat) const override;

    const Settings& getSettings() const;
    RuleOptions getRuleOptions() const;

private:
    void logOutcome(const std::optional<Action>& action, int seat, TurnOutcome outcome) const;

    Settings m_settings;
    RandomEngine m_rng;
    GameState m_state;
};

#endif // DOG_GAME_HPP
