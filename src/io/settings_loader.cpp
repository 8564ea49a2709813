#include "io/settings_loader.hpp"

#include "game/config.hpp"
#include "game/dog_game.hpp"
#include "runner/self_play.hpp"
#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <cstdint>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace {
template <typename T>
bool loadField(T& field, const YAML::Node& node, const std::vector<std::string>& indices, std::size_t depth) {
    if (!node.IsDefined() || node.IsNull()) {
        return false;
    }

    if (depth == indices.size()) {
        try {
            field = node.as<T>();
            std::cout << "Successfully loaded field " << join(indices, "::") << ".\n";
            return true;
        }
        catch (const YAML::Exception& e) {
            std::cerr << "Error: Field " << join(indices, "::") << " has the wrong type. " << e.what() << "\n";
            return false;
        }
    }

    return loadField(field, node[indices[depth]], indices, depth + 1);
}

template <typename T>
bool loadFieldRequired(T& field, const YAML::Node& root, const std::vector<std::string>& indices) {
    bool success = loadField(field, root, indices, 0);
    if (!success) {
        std::cerr << "Error: Could not load field " << join(indices, "::") << ".\n";
        return false;
    }

    return true;
}

template <typename T>
void loadFieldOptional(T& field, const YAML::Node& root, const std::vector<std::string>& indices, const T& defaultValue) {
    bool success = loadField(field, root, indices, 0);
    if (!success) {
        std::cout << "Could not load field " << join(indices, "::") << ", using default.\n";
        field = defaultValue;
    }
}

Result<YAML::Node> loadSettingsNode(const std::string& filePath) {
    try {
        return YAML::LoadFile(filePath);
    }
    catch (const YAML::Exception& e) {
        return "Error: Could not load settings file " + filePath + ". " + e.what();
    }
}

std::uint64_t loadSeed(const YAML::Node& root) {
    std::uint64_t seed;
    if (!loadField(seed, root, { "seed" }, 0)) {
        std::random_device device;
        seed = (static_cast<std::uint64_t>(device()) << 32) | device();
        std::cout << "Could not load field seed, using random seed " << seed << ".\n";
    }
    return seed;
}
} // namespace

Result<DogGame::Settings> loadSettingsFromFile(const std::string& filePath) {
    Result<YAML::Node> nodeResult = loadSettingsNode(filePath);
    if (nodeResult.isError()) {
        return nodeResult.getError();
    }
    const YAML::Node& root = nodeResult.getValue();

    std::cout << "Loading game settings from " << filePath << ":\n";

    DogGame::Settings defaults = DogGame::getDefaultSettings();
    DogGame::Settings settings = defaults;

    // Load seed
    settings.seed = loadSeed(root);

    // Load player names
    std::vector<std::string> playerNames;
    if (loadField(playerNames, root, { "player-names" }, 0)) {
        if (playerNames.size() != dog::NumPlayers) {
            return "Error: Expected " + std::to_string(dog::NumPlayers) + " player names but found " + std::to_string(playerNames.size()) + ".";
        }
        for (int seat = 0; seat < dog::NumPlayers; ++seat) {
            settings.playerNames[seat] = playerNames[seat];
        }
    }
    else {
        std::cout << "Could not load field player-names, using default.\n";
    }

    // Load rule and logging switches
    loadFieldOptional(settings.cardExchange, root, { "card-exchange" }, defaults.cardExchange);
    loadFieldOptional(settings.verbose, root, { "verbose" }, defaults.verbose);

    std::cout << "Successfully loaded game settings.\n\n";
    return settings;
}

Result<SelfPlaySettings> loadSelfPlaySettingsFromFile(const std::string& filePath) {
    Result<YAML::Node> nodeResult = loadSettingsNode(filePath);
    if (nodeResult.isError()) {
        return nodeResult.getError();
    }
    const YAML::Node& root = nodeResult.getValue();

    std::cout << "Loading self-play settings from " << filePath << ":\n";

    SelfPlaySettings defaults = getDefaultSelfPlaySettings();
    SelfPlaySettings settings = defaults;

    // Load number of games
    if (!loadFieldRequired(settings.games, root, { "self-play", "games" })) {
        return "Error: Self-play settings need a number of games.";
    }
    if (settings.games <= 0) {
        return "Error: Number of games must be positive.";
    }

    // Load threads
    loadFieldOptional(settings.threads, root, { "self-play", "threads" }, defaults.threads);
    if (settings.threads <= 0) {
        return "Error: Number of threads must be positive.";
    }

    // Load turn limit
    loadFieldOptional(settings.maxTurns, root, { "self-play", "max-turns" }, defaults.maxTurns);
    if (settings.maxTurns <= 0) {
        return "Error: Maximum number of turns must be positive.";
    }

    settings.seed = loadSeed(root);
    loadFieldOptional(settings.cardExchange, root, { "card-exchange" }, defaults.cardExchange);

    std::cout << "Successfully loaded self-play settings.\n\n";
    return settings;
}
