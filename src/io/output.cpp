#include "io/output.hpp"

#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "runner/game_runner.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {
using json = nlohmann::ordered_json;

json buildJSONOptionalCard(const std::optional<Card>& card) {
    return card ? json(getCardName(*card)) : json(nullptr);
}

json buildJSONMarbles(const MarbleArray& marbles) {
    json j = json::array();
    for (const Marble& marble : marbles) {
        j.push_back({ { "Position", marble.pos }, { "Safe", marble.isSafe } });
    }
    return j;
}

json buildJSONAction(const std::optional<Action>& action) {
    if (!action) {
        return json(nullptr);
    }

    json j;
    j["Card"] = getCardName(action->card);
    j["From"] = action->posFrom ? json(*action->posFrom) : json(nullptr);
    j["To"] = action->posTo ? json(*action->posTo) : json(nullptr);
    j["CardSwap"] = buildJSONOptionalCard(action->cardSwap);
    return j;
}

std::string getOutcomeName(TurnOutcome outcome) {
    switch (outcome) {
        case TurnOutcome::TurnContinues:
            return "TurnContinues";
        case TurnOutcome::TurnEnded:
            return "TurnEnded";
        case TurnOutcome::RoundEnded:
            return "RoundEnded";
        case TurnOutcome::GameFinished:
            return "GameFinished";
    }
    return "";
}
} // namespace

json buildGameStateJSON(const GameState& state) {
    json j;
    j["Phase"] = (state.phase == GamePhase::Running) ? "Running" : "Finished";
    j["Round"] = state.round;
    j["StartedPlayer"] = state.startedPlayer;
    j["ActivePlayer"] = state.activePlayer;

    auto& players = j["Players"];
    players = json::array();
    for (const PlayerState& player : state.players) {
        json p;
        p["Name"] = player.name;
        p["Hand"] = getCardNames(player.hand);
        p["Marbles"] = buildJSONMarbles(player.marbles);
        players.push_back(p);
    }

    j["DrawPile"] = getCardNames(state.drawPile);
    j["DiscardPile"] = getCardNames(state.discardPile);
    j["ActiveCard"] = buildJSONOptionalCard(state.activeCard);
    j["CardExchanged"] = state.cardExchanged;

    auto& exchangeBuffer = j["ExchangeBuffer"];
    exchangeBuffer = json::array();
    for (const std::optional<Card>& card : state.exchangeBuffer) {
        exchangeBuffer.push_back(buildJSONOptionalCard(card));
    }

    if (state.seven) {
        j["Seven"] = { { "StepsRemaining", state.seven->stepsRemaining }, { "CardFromHand", state.seven->cardFromHand } };
    }
    else {
        j["Seven"] = nullptr;
    }

    return j;
}

json buildGameRecordJSON(const GameRecord& record) {
    json j;
    j["WinningTeam"] = record.winningTeam ? json(*record.winningTeam) : json(nullptr);
    j["NumTurns"] = record.turns.size();

    auto& turns = j["Turns"];
    turns = json::array();
    for (const TurnRecord& turn : record.turns) {
        json t;
        t["Round"] = turn.round;
        t["Player"] = turn.seat;
        t["Action"] = buildJSONAction(turn.action);
        t["Outcome"] = getOutcomeName(turn.outcome);
        turns.push_back(t);
    }

    j["FinalState"] = buildGameStateJSON(record.finalState);
    return j;
}

bool outputGameRecordToJSON(const GameRecord& record, const std::string& filePath) {
    std::ofstream file(filePath);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open " << filePath << " for writing.\n";
        return false;
    }

    json j = buildGameRecordJSON(record);
    file << j.dump(4) << std::endl;
    return static_cast<bool>(file);
}
