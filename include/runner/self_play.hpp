#ifndef SELF_PLAY_HPP
#define SELF_PLAY_HPP

#include <array>
#include <cstdint>

struct SelfPlaySettings {
    int games;
    int threads;
    int maxTurns;
    std::uint64_t seed;
    bool cardExchange;
};

struct SelfPlaySummary {
    std::array<int, 2> teamWins;
    int unfinishedGames;
    int failedGames;
    long long totalTurns;
};

SelfPlaySettings getDefaultSelfPlaySettings();

// Plays independent games between random players, one game per thread at a time
SelfPlaySummary runSelfPlay(const SelfPlaySettings& settings);

#endif // SELF_PLAY_HPP
