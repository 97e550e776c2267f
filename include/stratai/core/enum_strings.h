#pragma once

#include <string>

#include "stratai/core/config.h"

namespace stratai {

// Shared string <-> enum conversion helpers.
//
// Used by the config loader, the diagnostics export and the CLI so the
// on-disk strings and the printed labels cannot drift apart.

std::string difficulty_level_to_string(DifficultyLevel l);

// Returns false for unknown strings. Accepts "grand_admiral" and "grandadmiral".
bool difficulty_level_from_string(const std::string& s, DifficultyLevel& out);

} // namespace stratai
