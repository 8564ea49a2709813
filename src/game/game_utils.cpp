#include "game/game_utils.hpp"

#include "game/config.hpp"
#include "game/game_types.hpp"
#include "util/result.hpp"

#include <cassert>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace {
const std::string CardRankNames = "23456789TJQKA";
const std::string CardSuitNames = "shdc";
const std::string JokerName = "JKR";
} // namespace

int getNextSeat(int seat) {
    assert(seat >= 0 && seat < dog::NumPlayers);
    return (seat + 1) % dog::NumPlayers;
}

int getPartnerSeat(int seat) {
    assert(seat >= 0 && seat < dog::NumPlayers);
    return (seat + 2) % dog::NumPlayers;
}

int getTeam(int seat) {
    assert(seat >= 0 && seat < dog::NumPlayers);
    return seat % 2;
}

int getKennelStart(int seat) {
    assert(seat >= 0 && seat < dog::NumPlayers);
    return dog::KennelOffset + dog::SeatStride * seat;
}

int getFinishStart(int seat) {
    assert(seat >= 0 && seat < dog::NumPlayers);
    return dog::FinishOffset + dog::SeatStride * seat;
}

int getStartSquare(int seat) {
    assert(seat >= 0 && seat < dog::NumPlayers);
    return dog::StartSquareStride * seat;
}

bool isOnTrack(int pos) {
    return pos >= 0 && pos < dog::TrackSize;
}

bool isInKennel(int pos, int seat) {
    int kennelStart = getKennelStart(seat);
    return pos >= kennelStart && pos < kennelStart + dog::MarblesPerPlayer;
}

bool isInFinish(int pos, int seat) {
    int finishStart = getFinishStart(seat);
    return pos >= finishStart && pos < finishStart + dog::MarblesPerPlayer;
}

std::string getCardName(Card card) {
    if (card.rank == Rank::Joker) {
        return JokerName;
    }

    assert(card.suit != Suit::None);
    std::string cardName = { CardRankNames[static_cast<int>(card.rank)], CardSuitNames[static_cast<int>(card.suit)] };
    return cardName;
}

Result<Card> getCardFromName(const std::string& cardName) {
    if (cardName == JokerName) {
        return Card{ Suit::None, Rank::Joker };
    }

    if (cardName.size() != 2) {
        return "Error: Card name " + cardName + " should be two characters or " + JokerName + ".";
    }

    std::size_t rank = CardRankNames.find(cardName[0]);
    if (rank == std::string::npos) {
        return "Error: Card name " + cardName + " has an invalid rank.";
    }

    std::size_t suit = CardSuitNames.find(cardName[1]);
    if (suit == std::string::npos) {
        return "Error: Card name " + cardName + " has an invalid suit.";
    }

    return Card{ static_cast<Suit>(suit), static_cast<Rank>(rank) };
}

std::vector<std::string> getCardNames(const std::vector<Card>& cards) {
    std::vector<std::string> cardNames;
    cardNames.reserve(cards.size());
    for (Card card : cards) {
        cardNames.push_back(getCardName(card));
    }
    return cardNames;
}

std::optional<int> getForwardSteps(Rank rank) {
    switch (rank) {
        case Rank::Two:
            return 2;
        case Rank::Three:
            return 3;
        case Rank::Five:
            return 5;
        case Rank::Six:
            return 6;
        case Rank::Eight:
            return 8;
        case Rank::Nine:
            return 9;
        case Rank::Ten:
            return 10;
        default:
            return std::nullopt;
    }
}

std::vector<Card> buildFullDeck() {
    std::vector<Card> deck;
    deck.reserve(dog::DeckSize);

    for (int copy = 0; copy < dog::DeckCopies; ++copy) {
        for (int rank = 0; rank < dog::NumSuitedRanks; ++rank) {
            for (int suit = 0; suit < dog::NumSuits; ++suit) {
                deck.push_back(Card{ static_cast<Suit>(suit), static_cast<Rank>(rank) });
            }
        }
        for (int joker = 0; joker < dog::JokersPerCopy; ++joker) {
            deck.push_back(Card{ Suit::None, Rank::Joker });
        }
    }

    assert(deck.size() == dog::DeckSize);
    return deck;
}

std::string getActionName(const Action& action) {
    std::string actionName = getCardName(action.card);
    if (action.posFrom && action.posTo) {
        actionName += " " + std::to_string(*action.posFrom) + "->" + std::to_string(*action.posTo);
    }
    if (action.cardSwap) {
        actionName += " as " + getCardName(*action.cardSwap);
    }
    return actionName;
}
