#ifndef GAME_UTILS_HPP
#define GAME_UTILS_HPP

#include "game/game_types.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>
#include <vector>

// Seat functions
int getNextSeat(int seat);
int getPartnerSeat(int seat);
int getTeam(int seat);

// Position functions
int getKennelStart(int seat);
int getFinishStart(int seat);
int getStartSquare(int seat);
bool isOnTrack(int pos);
bool isInKennel(int pos, int seat);
bool isInFinish(int pos, int seat);

// Card functions
std::string getCardName(Card card);
Result<Card> getCardFromName(const std::string& cardName);
std::vector<std::string> getCardNames(const std::vector<Card>& cards);
std::optional<int> getForwardSteps(Rank rank);
std::vector<Card> buildFullDeck();

// Action functions
std::string getActionName(const Action& action);

#endif // GAME_UTILS_HPP
