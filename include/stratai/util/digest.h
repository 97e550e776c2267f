#pragma once

#include <cstdint>
#include <string>

#include "stratai/core/evaluator.h"

namespace stratai {

// Compute a stable 64-bit digest of one tick's decision.
//
// Covers the selected action, the score components (in order), the applied
// weights, the recommended doctrine/fleet policy and the ranked candidate
// scores. Two evaluations of the same input must produce the same digest on
// any platform. The tick number and the history snapshot are not included.
std::uint64_t digest_tick_result64(const TickResult& result);

// Format a 64-bit digest as a fixed-width lowercase hex string.
std::string digest64_to_hex(std::uint64_t v);

} // namespace stratai
