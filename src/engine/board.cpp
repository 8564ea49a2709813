#include "engine/board.hpp"

#include "game/config.hpp"
#include "game/game_types.hpp"
#include "game/game_utils.hpp"

#include <algorithm>
#include <cassert>
#include <optional>
#include <vector>

namespace {
int wrapTrack(int pos) {
    return ((pos % dog::TrackSize) + dog::TrackSize) % dog::TrackSize;
}

bool isPositionOccupied(const GameState& state, int pos) {
    return findMarbleAt(state, pos).has_value();
}
} // namespace

std::optional<MarbleRef> findMarbleAt(const GameState& state, int pos) {
    for (int seat = 0; seat < dog::NumPlayers; ++seat) {
        const MarbleArray& marbles = state.players[seat].marbles;
        for (int i = 0; i < dog::MarblesPerPlayer; ++i) {
            if (marbles[i].pos == pos) {
                return MarbleRef{ seat, i };
            }
        }
    }
    return std::nullopt;
}

std::optional<MarbleRef> findMarbleAt(const GameState& state, int pos, const std::vector<int>& seats) {
    for (int seat : seats) {
        const MarbleArray& marbles = state.players[seat].marbles;
        for (int i = 0; i < dog::MarblesPerPlayer; ++i) {
            if (marbles[i].pos == pos) {
                return MarbleRef{ seat, i };
            }
        }
    }
    return std::nullopt;
}

Marble& getMarble(GameState& state, MarbleRef ref) {
    assert(ref.seat >= 0 && ref.seat < dog::NumPlayers);
    assert(ref.index >= 0 && ref.index < dog::MarblesPerPlayer);
    return state.players[ref.seat].marbles[ref.index];
}

const Marble& getMarble(const GameState& state, MarbleRef ref) {
    assert(ref.seat >= 0 && ref.seat < dog::NumPlayers);
    assert(ref.index >= 0 && ref.index < dog::MarblesPerPlayer);
    return state.players[ref.seat].marbles[ref.index];
}

bool isSeatFinished(const GameState& state, int seat) {
    const MarbleArray& marbles = state.players[seat].marbles;
    return std::all_of(marbles.begin(), marbles.end(), [seat](const Marble& marble) {
        return isInFinish(marble.pos, seat);
    });
}

std::vector<int> getMovableSeats(const GameState& state) {
    std::vector<int> seats = { state.activePlayer };
    if (isSeatFinished(state, state.activePlayer)) {
        seats.push_back(getPartnerSeat(state.activePlayer));
    }
    return seats;
}

std::vector<Path> getForwardPaths(int owner, int from, int steps) {
    assert(steps > 0);
    std::vector<Path> paths;

    if (isOnTrack(from)) {
        Path trackPath;
        for (int step = 1; step <= steps; ++step) {
            trackPath.push_back(wrapTrack(from + step));
        }
        paths.push_back(trackPath);

        // A marble sitting on its own start square has just come out of the
        // kennel, so it has to go around the track before it can turn in
        int startSquare = getStartSquare(owner);
        if (from != startSquare) {
            int stepsToStart = wrapTrack(startSquare - from);
            int finishIndex = steps - stepsToStart - 1;
            if (finishIndex >= 0 && finishIndex < dog::MarblesPerPlayer) {
                Path finishPath(trackPath.begin(), trackPath.begin() + stepsToStart);
                for (int i = 0; i <= finishIndex; ++i) {
                    finishPath.push_back(getFinishStart(owner) + i);
                }
                paths.push_back(finishPath);
            }
        }
    }
    else if (isInFinish(from, owner)) {
        int finishIndex = from - getFinishStart(owner);
        if (finishIndex + steps < dog::MarblesPerPlayer) {
            Path finishPath;
            for (int step = 1; step <= steps; ++step) {
                finishPath.push_back(from + step);
            }
            paths.push_back(finishPath);
        }
    }

    return paths;
}

std::optional<int> getStepCost(int owner, int from, int to) {
    if (isOnTrack(from) && isOnTrack(to)) {
        int cost = wrapTrack(to - from);
        if (cost == 0) {
            return std::nullopt;
        }
        return cost;
    }

    if (isOnTrack(from) && isInFinish(to, owner)) {
        int startSquare = getStartSquare(owner);
        if (from == startSquare) {
            return std::nullopt;
        }
        return wrapTrack(startSquare - from) + (to - getFinishStart(owner)) + 1;
    }

    if (isInFinish(from, owner) && isInFinish(to, owner) && to > from) {
        return to - from;
    }

    return std::nullopt;
}

std::optional<Path> getPathBetween(int owner, int from, int to) {
    std::optional<int> cost = getStepCost(owner, from, to);
    if (!cost) {
        return std::nullopt;
    }

    for (const Path& path : getForwardPaths(owner, from, *cost)) {
        if (path.back() == to) {
            return path;
        }
    }
    return std::nullopt;
}

bool isPathBlocked(const GameState& state, const Path& path) {
    for (int pos : path) {
        std::optional<MarbleRef> ref = findMarbleAt(state, pos);
        if (!ref) {
            continue;
        }

        if (!isOnTrack(pos) || getMarble(state, *ref).isSafe) {
            return true;
        }
    }
    return false;
}

std::optional<MarbleRef> findFirstMarbleOnPath(const GameState& state, const Path& path, MarbleRef mover) {
    for (int pos : path) {
        std::optional<MarbleRef> ref = findMarbleAt(state, pos);
        if (ref && *ref != mover) {
            return ref;
        }
    }
    return std::nullopt;
}

void sendMarbleHome(GameState& state, MarbleRef ref) {
    int kennelStart = getKennelStart(ref.seat);
    for (int pos = kennelStart; pos < kennelStart + dog::MarblesPerPlayer; ++pos) {
        if (!isPositionOccupied(state, pos)) {
            Marble& marble = getMarble(state, ref);
            marble.pos = pos;
            marble.isSafe = false;
            return;
        }
    }

    // The marble being sent home is outside the kennel, so a square is always free
    assert(false);
}
