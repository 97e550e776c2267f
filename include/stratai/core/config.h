#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "stratai/util/json.h"

namespace stratai {

// Difficulty ladder of the host game, lowest first.
enum class DifficultyLevel : std::uint8_t {
  Civilian = 0,
  Ensign = 1,
  Captain = 2,
  Commodore = 3,
  Admiral = 4,
  GrandAdmiral = 5,
};

// Lower difficulties get a capped projection horizon (see PerformanceConfig).
bool is_low_difficulty(DifficultyLevel level);

struct DifficultyProfile {
  DifficultyLevel level{DifficultyLevel::Commodore};

  // Multipliers applied to the economic / research / military score components.
  // Range [0, 2]; 1.0 is neutral.
  double eco_bias{1.0};
  double tech_bias{1.0};
  double mil_bias{1.0};

  // Gate for exploration-oriented actions and the exploration_drive component.
  bool curiosity_enabled{true};
};

// Opt-out flags. Each one disables exactly one scoring adjustment rule.
struct CompatibilityFlags {
  // ascension_synergy is forced to 0 (bio ascension / virtuality ignored).
  bool disable_ascension_bias{false};

  // expansion_need is not damped for shattered-ring origins.
  bool disable_shattered_ring_adjustment{false};

  // threat_pressure ignores alloy_density and uses the enemy economy share only.
  bool disable_alloy_density_bias{false};

  // The meta/counter-meta selector passes weights through unchanged.
  bool disable_meta_counter{false};

  // projected_economy_gap equals the current economic_lead (no lookahead).
  bool disable_economy_projection{false};
};

struct PerformanceConfig {
  // Lookahead used by projection-style scoring on normal/higher difficulty.
  int projection_months{36};

  // Hard cap on the lookahead when the difficulty profile is a lower one.
  int max_projection_months_low_diff{12};
};

struct DiagnosticsConfig {
  // Number of tick snapshots retained by the rolling history.
  int history_capacity{32};
};

struct MetaConfig {
  // An opponent archetype counts as detected when its confidence is strictly
  // above this value.
  double confidence_threshold{0.5};
};

// Session-wide tuning knobs. Loaded once, immutable during a tick.
struct EvaluatorConfig {
  // Scales threat-response and offensive-action weights. Range [0.5, 2.0].
  double aggression_slider{1.0};

  DifficultyProfile difficulty_profile;
  CompatibilityFlags compatibility;
  PerformanceConfig performance;
  DiagnosticsConfig diagnostics;
  MetaConfig meta;
};

// Documented knob ranges.
inline constexpr double kMinAggression = 0.5;
inline constexpr double kMaxAggression = 2.0;
inline constexpr double kMinBias = 0.0;
inline constexpr double kMaxBias = 2.0;
inline constexpr int kMinProjectionMonths = 1;
inline constexpr int kMaxProjectionMonths = 240;
inline constexpr int kMaxLowDifficultyProjectionMonths = 120;
inline constexpr int kMinHistoryCapacity = 1;
inline constexpr int kMaxHistoryCapacity = 4096;

// Clamp every knob into its documented range. Non-finite values take the
// default. Returns one warning per adjusted knob; never throws.
std::vector<std::string> clamp_config(EvaluatorConfig& cfg);

// Result wrapper so callers can surface what was adjusted during loading.
struct ConfigLoadResult {
  EvaluatorConfig config;
  std::vector<std::string> warnings;
};

// Build a configuration from a JSON document.
//
// Rules:
// - Unknown keys are ignored.
// - Missing keys keep their defaults.
// - Wrong-typed values keep their defaults and add a warning.
// - Out-of-range values are clamped and add a warning.
// - "compatibility" may be an object of booleans or an array of flag names.
ConfigLoadResult parse_evaluator_config(const json::Value& root);

// Reads and parses a JSON config file. Throws std::runtime_error when the file
// cannot be read or is not valid JSON.
ConfigLoadResult load_evaluator_config_from_file(const std::string& path);

json::Value evaluator_config_to_json(const EvaluatorConfig& cfg);

// Names of the compatibility flags that are set, in declaration order.
std::vector<std::string> enabled_compatibility_flags(const CompatibilityFlags& flags);

// Effective lookahead after the low-difficulty cap is applied.
int projection_horizon_months(const EvaluatorConfig& cfg);

} // namespace stratai
