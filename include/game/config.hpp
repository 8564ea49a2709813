#ifndef CONFIG_HPP
#define CONFIG_HPP

namespace dog {
constexpr int NumPlayers = 4;
constexpr int MarblesPerPlayer = 4;

// Board layout: the shared track is [0, 63], then each seat owns 8 positions
// starting at 64 + 8 * seat, the kennel first and the finish lane after it
constexpr int TrackSize = 64;
constexpr int KennelOffset = 64;
constexpr int FinishOffset = 68;
constexpr int SeatStride = 8;
constexpr int StartSquareStride = TrackSize / NumPlayers;

// 2 copies of (4 suits * 13 ranks + 3 jokers)
constexpr int NumSuits = 4;
constexpr int NumSuitedRanks = 13;
constexpr int JokersPerCopy = 3;
constexpr int DeckCopies = 2;
constexpr int DeckSize = DeckCopies * (NumSuits * NumSuitedRanks + JokersPerCopy);

constexpr int StartingHandSize = 6;
constexpr int HandSizeCycle = 5;
constexpr int SevenSteps = 7;
} // namespace dog

#endif // CONFIG_HPP
