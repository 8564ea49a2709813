#ifndef GAME_TYPES_HPP
#define GAME_TYPES_HPP

#include "game/config.hpp"

#include <array>
#include <compare>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

enum class Suit : std::uint8_t {
    Spades,
    Hearts,
    Diamonds,
    Clubs,
    None
};

enum class Rank : std::uint8_t {
    Two,
    Three,
    Four,
    Five,
    Six,
    Seven,
    Eight,
    Nine,
    Ten,
    Jack,
    Queen,
    King,
    Ace,
    Joker
};

// Ordered by suit, then rank
struct Card {
    Suit suit;
    Rank rank;

    auto operator<=>(const Card&) const = default;
};

struct Marble {
    int pos;
    bool isSafe;

    bool operator==(const Marble&) const = default;
};

using MarbleArray = std::array<Marble, dog::MarblesPerPlayer>;

struct PlayerState {
    std::string name;
    std::vector<Card> hand;
    MarbleArray marbles;

    bool operator==(const PlayerState&) const = default;
};

enum class GamePhase : std::uint8_t {
    Running,
    Finished
};

// Everything a seven-card turn may touch, captured before its first step
struct BoardSnapshot {
    std::array<MarbleArray, dog::NumPlayers> marbles;
    std::array<std::vector<Card>, dog::NumPlayers> hands;
    std::optional<Card> activeCard;
    int activePlayer;

    bool operator==(const BoardSnapshot&) const = default;
};

struct SevenProgress {
    int stepsRemaining;
    // False when the seven was declared by a joker and never sat in the hand
    bool cardFromHand;
    BoardSnapshot snapshot;

    bool operator==(const SevenProgress&) const = default;
};

struct GameState {
    GamePhase phase;
    int round;
    int startedPlayer;
    int activePlayer;
    std::array<PlayerState, dog::NumPlayers> players;
    std::vector<Card> drawPile;
    std::vector<Card> discardPile;
    std::optional<Card> activeCard;
    bool cardExchanged;
    std::array<std::optional<Card>, dog::NumPlayers> exchangeBuffer;
    std::optional<SevenProgress> seven;

    bool operator==(const GameState&) const = default;
};

struct Action {
    Card card;
    std::optional<int> posFrom;
    std::optional<int> posTo;
    std::optional<Card> cardSwap;

    auto operator<=>(const Action&) const = default;
};

using ActionSet = std::set<Action>;

struct RuleOptions {
    bool cardExchange;
};

enum class TurnOutcome : std::uint8_t {
    TurnContinues,
    TurnEnded,
    RoundEnded,
    GameFinished
};

enum class GameErrorCode : std::uint8_t {
    InvalidAction,
    StepBudgetExceeded,
    DeckExhausted
};

struct GameError {
    GameErrorCode code;
    std::string message;
};

#endif // GAME_TYPES_HPP
