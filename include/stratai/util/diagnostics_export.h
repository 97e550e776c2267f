#pragma once

#include <string>
#include <vector>

#include "stratai/core/diagnostics.h"
#include "stratai/core/evaluator.h"
#include "stratai/util/json.h"

namespace stratai {

// Export the rolling history (oldest first) as CSV.
//
// One row per entry; one column per documented score component, in component
// order. Anomaly messages are joined with "; " in the last column.
std::string diagnostics_to_csv(const std::vector<DiagnosticsEntry>& entries);

// Export the rolling history as a JSON array (pretty-printed, trailing newline).
std::string diagnostics_to_json(const std::vector<DiagnosticsEntry>& entries);

// JSON object describing one tick (without the history snapshot).
json::Value tick_result_to_json(const TickResult& result);

} // namespace stratai
