#ifndef SETTINGS_LOADER_HPP
#define SETTINGS_LOADER_HPP

#include "game/dog_game.hpp"
#include "runner/self_play.hpp"
#include "util/result.hpp"

#include <string>

// Both read the same YAML file: the game fields at the top level, the batch
// fields under "self-play"
Result<DogGame::Settings> loadSettingsFromFile(const std::string& filePath);
Result<SelfPlaySettings> loadSelfPlaySettingsFromFile(const std::string& filePath);

#endif // SETTINGS_LOADER_HPP
