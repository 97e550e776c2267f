#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "stratai/util/json.h"

namespace stratai {

// Per-tick snapshot of the simulation, as seen by the evaluator.
//
// Every field has a neutral default so a partial payload still evaluates.
// Values are sanitized at ingestion (see parse_observation); the scoring
// functions additionally clamp on read so hand-built observations are safe.
struct Observation {
  // Economic signals (non-negative).
  double our_total_economy{0.0};
  double enemy_total_economy{0.0};

  // Pressure signals, normalized to [0, 1].
  double pop_growth_pressure{0.0};
  double planet_capacity_pressure{0.0};
  double alloy_density{0.0};

  // Unlocked game-state features.
  bool bio_ascension{false};
  bool machine_age_virtuality{false};
  bool shattered_ring_origin{false};

  // Opponent archetype name -> confidence in [0, 1]. Ordered for deterministic
  // iteration.
  std::map<std::string, double> steam_meta_signals;
};

inline constexpr double kMaxEconomy = 1.0e15;

struct ObservationParseResult {
  Observation observation;

  // One entry per field that was malformed and replaced by its default.
  std::vector<std::string> issues;

  bool clean() const { return issues.empty(); }
};

// Build an Observation from the JSON payload produced by the save scanner.
//
// Never throws for data reasons: a wrong-typed or non-finite field takes its
// default and is reported in `issues`. Unknown fields are ignored.
ObservationParseResult parse_observation(const json::Value& root);

// Parse text + build. Throws std::runtime_error if the text is not valid JSON.
ObservationParseResult parse_observation_text(const std::string& text);

json::Value observation_to_json(const Observation& obs);

// Clamp a hand-built observation into the documented ranges. Returns the
// names of adjusted fields.
std::vector<std::string> sanitize_observation(Observation& obs);

} // namespace stratai
