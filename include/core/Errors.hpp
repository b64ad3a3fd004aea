#pragma once

#include <stdexcept>
#include <string>

namespace sweeper::core {

// Invalid construction parameters (sizes, counts, layouts, saved data).
// Thrown before any Board or GameState is handed out.
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what)
        : std::invalid_argument{what} {}
};

// Reveal/flag position outside the board. No state is changed.
class InvalidCoordinate : public std::out_of_range {
public:
    explicit InvalidCoordinate(const std::string& what)
        : std::out_of_range{what} {}
};

// Mutating call on a game that is already Won or Lost. No state is changed.
class IllegalOperation : public std::logic_error {
public:
    explicit IllegalOperation(const std::string& what)
        : std::logic_error{what} {}
};

} // namespace sweeper::core
