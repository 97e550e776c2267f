#pragma once

#include <string>

#include "stratai/util/json.h"

namespace stratai {

// Lightweight heuristic scan of plain-text save content.
//
// This is not a save parser: it looks for a handful of keywords and sums every
// `key = number` assignment for a few keys, regardless of which empire owns them.
struct SaveScanResult {
  bool bio_ascension{false};
  bool machine_age_virtuality{false};
  bool shattered_ring_origin{false};

  // Raw sums.
  double total_pops{0.0};
  double total_planets{0.0};
  double total_alloys{0.0};
  double total_energy{0.0};

  // Derived observation fields.
  double pop_growth_pressure{0.0};
  double planet_capacity_pressure{0.0};
  double alloy_density{0.0};
  double our_total_economy{1.0};
  double enemy_total_economy{1.0};
};

SaveScanResult scan_save_text(const std::string& text);

// The observation payload (the same shape parse_observation consumes).
json::Value save_scan_to_observation_json(const SaveScanResult& scan);

} // namespace stratai
