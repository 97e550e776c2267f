#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "stratai/core/config.h"
#include "stratai/core/score_components.h"

namespace stratai {

// Opponent behavioral patterns recognized in steam_meta_signals.
enum class OpponentArchetype : std::uint8_t {
  Aggressive = 0,
  Economic = 1,
  BioRush = 2,
  Virtuality = 3,
};

inline constexpr int kArchetypeCount = 4;

const char* opponent_archetype_label(OpponentArchetype a);

// Maps a signal name to an archetype. Accepts the bare archetype name and the
// "<name>_confidence" form ("aggressive", "bio_rush_confidence", ...),
// case-insensitive. Returns false for anything else.
bool archetype_from_signal_name(const std::string& name, OpponentArchetype& out);

// Per-component-group weights applied on top of the score components.
struct WeightVector {
  double economy{1.0};
  double expansion{1.0};
  double threat{1.0};
  double tech{1.0};
  double exploration{1.0};
  double ascension{1.0};

  bool operator==(const WeightVector& o) const;
  bool operator!=(const WeightVector& o) const { return !(*this == o); }
};

// Clamp bounds for the summed counter adjustment and the final weights.
// kMinWeight > 0 so an adjustment can never invert a weight's sign.
inline constexpr double kMaxWeightDelta = 1.0;
inline constexpr double kMinWeight = 0.05;
inline constexpr double kMaxWeight = 4.0;

// Weights before any meta adjustment: threat follows aggression_slider,
// everything else is neutral.
WeightVector base_weights(const EvaluatorConfig& cfg);

// The fixed counter-weight delta for one detected archetype.
WeightVector counter_adjustment(OpponentArchetype a);

// Which weight scales a given component (1.0 for unknown names).
double weight_for_component(const WeightVector& w, const std::string& component);

// components[i] * weight_for_component(...), same order as the input.
ScoreComponents apply_weights(const ScoreComponents& components, const WeightVector& w);

struct ArchetypeDetection {
  OpponentArchetype archetype{OpponentArchetype::Aggressive};
  // Highest confidence among the signals naming this archetype.
  double confidence{0.0};
  bool detected{false};
};

struct MetaAdjustment {
  WeightVector base;
  WeightVector weights;

  // Weighted view of the input components.
  ScoreComponents weighted;

  // One entry per recognized archetype present in the signals, in archetype order.
  std::vector<ArchetypeDetection> detections;

  // Unrecognized signal names (ignored).
  std::vector<std::string> ignored_signals;

  // True when no archetype exceeded the threshold or meta countering is disabled.
  bool pass_through{true};
};

// Meta/counter-meta selection.
//
// For each recognized archetype whose confidence is strictly above
// cfg.meta.confidence_threshold, the fixed counter adjustment is added. The
// summed delta per weight is clamped to [-kMaxWeightDelta, kMaxWeightDelta],
// then the adjusted weight to [kMinWeight, kMaxWeight]. With nothing detected
// the base weights pass through unchanged.
MetaAdjustment select_counter_meta(const std::map<std::string, double>& signals, const ScoreComponents& components,
                                   const EvaluatorConfig& cfg);

} // namespace stratai
