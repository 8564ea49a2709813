#ifndef OUTPUT_HPP
#define OUTPUT_HPP

#include "game/game_types.hpp"
#include "runner/game_runner.hpp"

#include <nlohmann/json.hpp>

#include <string>

nlohmann::ordered_json buildGameStateJSON(const GameState& state);
nlohmann::ordered_json buildGameRecordJSON(const GameRecord& record);

// Returns false if the file could not be written
bool outputGameRecordToJSON(const GameRecord& record, const std::string& filePath);

#endif // OUTPUT_HPP
