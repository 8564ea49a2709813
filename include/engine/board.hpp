#ifndef BOARD_HPP
#define BOARD_HPP

#include "game/game_types.hpp"

#include <optional>
#include <vector>

struct MarbleRef {
    int seat;
    int index;

    bool operator==(const MarbleRef&) const = default;
};

using Path = std::vector<int>;

// Marble lookup
std::optional<MarbleRef> findMarbleAt(const GameState& state, int pos);
std::optional<MarbleRef> findMarbleAt(const GameState& state, int pos, const std::vector<int>& seats);
Marble& getMarble(GameState& state, MarbleRef ref);
const Marble& getMarble(const GameState& state, MarbleRef ref);

// The active seat, plus its partner once every own marble is in the finish lane
bool isSeatFinished(const GameState& state, int seat);
std::vector<int> getMovableSeats(const GameState& state);

// A path lists every square entered during a move, the destination last.
// Up to two paths exist for a given step count: one staying on the track and
// one turning into the owner's finish lane.
std::vector<Path> getForwardPaths(int owner, int from, int steps);
std::optional<int> getStepCost(int owner, int from, int to);
std::optional<Path> getPathBetween(int owner, int from, int to);

// Safe marbles block track squares, any marble blocks a finish square
bool isPathBlocked(const GameState& state, const Path& path);
std::optional<MarbleRef> findFirstMarbleOnPath(const GameState& state, const Path& path, MarbleRef mover);

// Moves a marble to the first free square of its owner's kennel
void sendMarbleHome(GameState& state, MarbleRef ref);

#endif // BOARD_HPP
