#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/BoardGenerator.hpp"
#include "core/BoardValidator.hpp"

namespace sweeper::controller {

enum class Level {
    Beginner,     //  8 x  8, 10 mines, 1 treasure
    Intermediate, // 16 x 16, 40 mines, 2 treasures
    Expert,       // 16 x 30, 99 mines, 3 treasures
    Classic,      // 10 x 10, 10 mines, 1 treasure
    Custom        // rows/cols/mines/treasures given explicitly
};

struct GameConfig {
    Level level{Level::Beginner};

    int rows{8};
    int cols{8};
    int mineCount{10};
    int treasureCount{1};

    std::string layoutPath;            // test mode when not empty
    std::optional<std::uint32_t> seed; // random seed when empty
};

// Preset values for a level; Custom returns the Beginner numbers
GameConfig presetFor(Level level);

std::optional<Level> levelFromName(const std::string& name);
const char* levelName(Level level);

struct ConfigParseResult {
    bool ok{false};
    bool helpRequested{false};
    GameConfig config;
    std::string error;
};

// Parses command-line style arguments (without the program name):
//   --level beginner|intermediate|expert|classic
//   --rows N --cols N --mines N --treasures N   (switch to Custom)
//   --layout FILE  --seed N  --help
ConfigParseResult parseArguments(const std::vector<std::string>& args);

std::string usage(const std::string& program);

// Reads a fixed layout file and validates it as a test-mode board.
// An unreadable file is reported as a failed result.
core::ValidationResult loadLayoutFile(const std::string& path);

// Engine parameters for config, using layout when test mode is active
core::GameParameters toParameters(const GameConfig& config,
                                  const std::optional<core::Layout>& layout = std::nullopt);

} // namespace sweeper::controller
