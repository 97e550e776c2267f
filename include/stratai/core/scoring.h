#pragma once

#include <algorithm>
#include <vector>

#include "stratai/core/config.h"
#include "stratai/core/observation.h"
#include "stratai/core/score_components.h"

namespace stratai {

// Component names, in the order compute_score_components emits them.
inline constexpr const char* kEconomicLead = "economic_lead";
inline constexpr const char* kThreatPressure = "threat_pressure";
inline constexpr const char* kExpansionNeed = "expansion_need";
inline constexpr const char* kEconomicCatchUp = "economic_catch_up";
inline constexpr const char* kProjectedEconomyGap = "projected_economy_gap";
inline constexpr const char* kTechOpportunity = "tech_opportunity";
inline constexpr const char* kMilitaryReadiness = "military_readiness";
inline constexpr const char* kExplorationDrive = "exploration_drive";
inline constexpr const char* kAscensionSynergy = "ascension_synergy";

struct ComponentBounds {
  const char* name;
  double min;
  double max;
};

// Documented [min, max] of every component, in emission order.
const std::vector<ComponentBounds>& component_bounds();

// Returns nullptr for unknown names.
const ComponentBounds* find_component_bounds(const std::string& name);

// Denominator floor for economy ratios.
inline constexpr double kEconomyEpsilon = 1.0;

// Monthly growth rates used by the economy projection.
inline constexpr double kBaseMonthlyGrowth = 0.01;
inline constexpr double kBiasMonthlyGrowth = 0.01;
inline constexpr double kEnemyMonthlyGrowth = 0.012;

// Expansion need multiplier for shattered-ring origins.
inline constexpr double kShatteredRingExpansionFactor = 0.75;

// Normalized intermediate signals shared by several components.
struct ScoringSignals {
  // (our - enemy) / max(our + enemy, epsilon), in [-1, 1].
  double lead{0.0};
  // max(0, -lead), in [0, 1].
  double deficit{0.0};
  // enemy / max(our + enemy, epsilon); 0.5 when both economies are zero.
  double enemy_share{0.5};
  // Weighted exposure in [0, 1].
  double threat_base{0.0};
  // 0.5 per unlocked ascension path, in [0, 1].
  double ascension{0.0};
};

ScoringSignals derive_signals(const Observation& obs, const EvaluatorConfig& cfg);

// Projected lead after `months` months of compounding growth, in [-1, 1].
double project_economy_lead(double our, double enemy, double our_monthly_growth, double enemy_monthly_growth,
                            int months);

// Shared pieces for the candidate and policy tables.
inline double positive_part(double v) { return std::max(0.0, v); }
inline double negative_part(double v) { return std::max(0.0, -v); }
inline bool always_feasible(const Observation&, const EvaluatorConfig&) { return true; }

// Pure, bounded scoring pass: identical inputs give bit-identical output.
//
// Inputs outside their documented ranges are clamped on read; the config is
// not mutated (callers are expected to have run clamp_config at load).
ScoreComponents compute_score_components(const Observation& obs, const EvaluatorConfig& cfg);

} // namespace stratai
