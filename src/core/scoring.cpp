#include "stratai/core/scoring.h"

#include <algorithm>
#include <cmath>
#include <string>

namespace stratai {
namespace {

double clamp_finite(double v, double lo, double hi, double fallback) {
  if (!std::isfinite(v)) return fallback;
  if (v < lo) return lo;
  if (v > hi) return hi;
  return v;
}

double unit(double v) { return clamp_finite(v, 0.0, 1.0, 0.0); }
double economy(double v) { return clamp_finite(v, 0.0, kMaxEconomy, 0.0); }
double bias(double v) { return clamp_finite(v, kMinBias, kMaxBias, 1.0); }

} // namespace

const std::vector<ComponentBounds>& component_bounds() {
  static const std::vector<ComponentBounds> kBounds = {
      {kEconomicLead, -1.0, 1.0},
      {kThreatPressure, 0.0, kMaxBias},
      {kExpansionNeed, 0.0, kMaxBias},
      {kEconomicCatchUp, 0.0, kMaxBias},
      {kProjectedEconomyGap, -1.0, 1.0},
      {kTechOpportunity, 0.0, kMaxBias},
      {kMilitaryReadiness, 0.0, kMaxBias},
      {kExplorationDrive, 0.0, 1.0},
      {kAscensionSynergy, 0.0, 1.0},
  };
  return kBounds;
}

const ComponentBounds* find_component_bounds(const std::string& name) {
  for (const auto& b : component_bounds()) {
    if (name == b.name) return &b;
  }
  return nullptr;
}

ScoringSignals derive_signals(const Observation& obs, const EvaluatorConfig& cfg) {
  const double our = economy(obs.our_total_economy);
  const double enemy = economy(obs.enemy_total_economy);
  const double total = our + enemy;
  const double denom = std::max(total, kEconomyEpsilon);

  ScoringSignals s;
  s.lead = std::clamp((our - enemy) / denom, -1.0, 1.0);
  s.deficit = std::max(0.0, -s.lead);
  s.enemy_share = (total <= 0.0) ? 0.5 : std::clamp(enemy / denom, 0.0, 1.0);

  if (cfg.compatibility.disable_alloy_density_bias) {
    s.threat_base = s.enemy_share;
  } else {
    s.threat_base = 0.7 * s.enemy_share + 0.3 * (1.0 - unit(obs.alloy_density));
  }

  if (!cfg.compatibility.disable_ascension_bias) {
    s.ascension = (obs.bio_ascension ? 0.5 : 0.0) + (obs.machine_age_virtuality ? 0.5 : 0.0);
  }
  return s;
}

double project_economy_lead(double our, double enemy, double our_monthly_growth, double enemy_monthly_growth,
                            int months) {
  our = economy(our);
  enemy = economy(enemy);
  const double h = static_cast<double>(std::clamp(months, 0, kMaxProjectionMonths));
  const double g_our = clamp_finite(our_monthly_growth, -0.5, 0.5, 0.0);
  const double g_enemy = clamp_finite(enemy_monthly_growth, -0.5, 0.5, 0.0);

  const double p_our = our * std::pow(1.0 + g_our, h);
  const double p_enemy = enemy * std::pow(1.0 + g_enemy, h);
  const double denom = std::max(p_our + p_enemy, kEconomyEpsilon);
  return clamp_finite((p_our - p_enemy) / denom, -1.0, 1.0, 0.0);
}

ScoreComponents compute_score_components(const Observation& obs, const EvaluatorConfig& cfg) {
  const ScoringSignals s = derive_signals(obs, cfg);
  const auto& dp = cfg.difficulty_profile;
  const double eco_bias = bias(dp.eco_bias);
  const double tech_bias = bias(dp.tech_bias);
  const double mil_bias = bias(dp.mil_bias);
  const double pop_growth = unit(obs.pop_growth_pressure);
  const double capacity = unit(obs.planet_capacity_pressure);

  double expansion = eco_bias * std::clamp(0.65 * pop_growth + 0.35 * capacity, 0.0, 1.0);
  if (obs.shattered_ring_origin && !cfg.compatibility.disable_shattered_ring_adjustment) {
    expansion *= kShatteredRingExpansionFactor;
  }

  double projected = s.lead;
  if (!cfg.compatibility.disable_economy_projection) {
    const double g_our = kBaseMonthlyGrowth + kBiasMonthlyGrowth * eco_bias * pop_growth;
    projected = project_economy_lead(obs.our_total_economy, obs.enemy_total_economy, g_our, kEnemyMonthlyGrowth,
                                     projection_horizon_months(cfg));
  }

  const double calm = 1.0 - s.threat_base;
  const double tech = tech_bias * (0.4 * calm + 0.3 * std::max(0.0, s.lead) + 0.3 * s.ascension);
  const double exploration = dp.curiosity_enabled ? 0.6 * calm : 0.0;

  ScoreComponents out;
  out.set(kEconomicLead, s.lead);
  out.set(kThreatPressure, mil_bias * s.threat_base);
  out.set(kExpansionNeed, expansion);
  out.set(kEconomicCatchUp, eco_bias * s.deficit);
  out.set(kProjectedEconomyGap, projected);
  out.set(kTechOpportunity, tech);
  out.set(kMilitaryReadiness, mil_bias * unit(obs.alloy_density));
  out.set(kExplorationDrive, exploration);
  out.set(kAscensionSynergy, s.ascension);
  return out;
}

} // namespace stratai
