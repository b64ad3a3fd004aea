#include "controller/GameConfig.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <utility>

namespace sweeper::controller {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<long> parseNumber(const std::string& text) {
    if (text.empty()) return std::nullopt;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    if (text.size() > 9) return std::nullopt; // keeps it inside int range
    return std::stol(text);
}

} // namespace

GameConfig presetFor(Level level) {
    GameConfig config;
    config.level = level;

    switch (level) {
    case Level::Beginner:
    case Level::Custom:
        config.rows = 8;  config.cols = 8;  config.mineCount = 10; config.treasureCount = 1;
        break;
    case Level::Intermediate:
        config.rows = 16; config.cols = 16; config.mineCount = 40; config.treasureCount = 2;
        break;
    case Level::Expert:
        config.rows = 16; config.cols = 30; config.mineCount = 99; config.treasureCount = 3;
        break;
    case Level::Classic:
        config.rows = 10; config.cols = 10; config.mineCount = 10; config.treasureCount = 1;
        break;
    }
    return config;
}

std::optional<Level> levelFromName(const std::string& name) {
    const std::string n = toLower(name);
    if (n == "beginner")     return Level::Beginner;
    if (n == "intermediate") return Level::Intermediate;
    if (n == "expert")       return Level::Expert;
    if (n == "classic")      return Level::Classic;
    if (n == "custom")       return Level::Custom;
    return std::nullopt;
}

const char* levelName(Level level) {
    switch (level) {
    case Level::Beginner:     return "beginner";
    case Level::Intermediate: return "intermediate";
    case Level::Expert:       return "expert";
    case Level::Classic:      return "classic";
    case Level::Custom:       return "custom";
    }
    return "unknown";
}

ConfigParseResult parseArguments(const std::vector<std::string>& args) {
    ConfigParseResult result;
    result.config = presetFor(Level::Beginner);

    auto fail = [&result](std::string message) {
        result.ok = false;
        result.error = std::move(message);
        return result;
    };

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h") {
            result.helpRequested = true;
            continue;
        }

        if (i + 1 >= args.size()) {
            return fail("Missing value for " + arg);
        }
        const std::string& value = args[++i];

        if (arg == "--level") {
            auto level = levelFromName(value);
            if (!level) {
                return fail("Unknown level: " + value);
            }
            // A level replaces the board numbers but keeps --layout and --seed
            GameConfig preset = presetFor(*level);
            preset.layoutPath = result.config.layoutPath;
            preset.seed = result.config.seed;
            result.config = preset;
        } else if (arg == "--layout") {
            result.config.layoutPath = value;
        } else if (arg == "--rows" || arg == "--cols" || arg == "--mines"
                   || arg == "--treasures" || arg == "--seed") {
            auto number = parseNumber(value);
            if (!number) {
                return fail("Expected a non-negative integer for " + arg + ", got: " + value);
            }
            const int n = static_cast<int>(*number);
            if (arg == "--seed") {
                result.config.seed = static_cast<std::uint32_t>(*number);
                continue;
            }
            if ((arg == "--rows" || arg == "--cols") && (n < 1 || n > core::kMaxBoardSide)) {
                return fail("Expected " + arg + " between 1 and "
                            + std::to_string(core::kMaxBoardSide) + ", got: " + value);
            }
            result.config.level = Level::Custom;
            if (arg == "--rows")           result.config.rows = n;
            else if (arg == "--cols")      result.config.cols = n;
            else if (arg == "--mines")     result.config.mineCount = n;
            else                           result.config.treasureCount = n;
        } else {
            return fail("Unknown option: " + arg);
        }
    }

    result.ok = true;
    return result;
}

std::string usage(const std::string& program) {
    std::ostringstream os;
    os << "Usage: " << program << " [options]\n"
       << "  --level NAME      beginner (default), intermediate, expert, classic\n"
       << "  --rows N          board rows, 1 to " << core::kMaxBoardSide << " (custom board)\n"
       << "  --cols N          board columns, 1 to " << core::kMaxBoardSide << " (custom board)\n"
       << "  --mines N         number of mines (custom board)\n"
       << "  --treasures N     number of treasures (custom board)\n"
       << "  --layout FILE     test mode: 8x8 comma-separated board (0 empty, 1 mine, 2 treasure)\n"
       << "  --seed N          seed for mine and treasure placement\n"
       << "  --help            show this message\n";
    return os.str();
}

core::ValidationResult loadLayoutFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        core::ValidationResult result;
        result.ok = false;
        result.message = "Cannot open layout file: " + path;
        return result;
    }

    std::ostringstream contents;
    contents << in.rdbuf();
    return core::parseLayout(contents.str());
}

core::GameParameters toParameters(const GameConfig& config,
                                  const std::optional<core::Layout>& layout) {
    core::GameParameters params;
    if (layout) {
        params.rows = static_cast<int>(layout->size());
        params.cols = layout->empty() ? 0 : static_cast<int>(layout->front().size());
        params.mineCount = config.mineCount;
        params.treasureCount = config.treasureCount;
        params.layout = layout;
        return params;
    }

    params.rows = config.rows;
    params.cols = config.cols;
    params.mineCount = config.mineCount;
    params.treasureCount = config.treasureCount;
    return params;
}

} // namespace sweeper::controller
