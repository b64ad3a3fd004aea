#pragma once

#include <string>
#include <optional>
#include "core/SavedGame.hpp"

namespace sweeper::persistence {

/// Serialize a SavedGame into a line-oriented text document.
std::string serialize(const core::SavedGame& saved);

/// Parse a SavedGame produced by serialize().
/// Returns std::nullopt on parse error or unsupported version.
/// The result is not checked for game consistency; GameState::restore does that.
std::optional<core::SavedGame> deserialize(const std::string& text);

} // namespace sweeper::persistence
