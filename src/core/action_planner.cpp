#include "stratai/core/action_planner.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include "stratai/core/scoring.h"
#include "stratai/util/log.h"
#include "stratai/util/strings.h"

namespace stratai {
namespace {

std::vector<CandidateAction> make_candidates() {
  std::vector<CandidateAction> v;
  v.push_back({kActionFortifyDefenses, always_feasible,
               [](const ScoreComponents& w) {
                 return 0.5 * w.get(kThreatPressure) + 0.1 * negative_part(w.get(kEconomicLead));
               },
               {kDoctrineDefensive}});
  v.push_back({kActionBuildFleet,
               [](const Observation& o, const EvaluatorConfig&) {
                 return o.alloy_density >= kBuildFleetMinAlloyDensity;
               },
               [](const ScoreComponents& w) {
                 return 0.4 * w.get(kThreatPressure) + 0.6 * w.get(kMilitaryReadiness);
               },
               {kDoctrineMilitarist, kDoctrineDefensive}});
  v.push_back({kActionExpandColonies,
               [](const Observation& o, const EvaluatorConfig&) {
                 return o.planet_capacity_pressure < kMaxPlanetCapacityForExpansion;
               },
               [](const ScoreComponents& w) {
                 return 0.8 * w.get(kExpansionNeed) + 0.2 * w.get(kExplorationDrive);
               },
               {kDoctrineExpansionist}});
  v.push_back({kActionBoostEconomy, always_feasible,
               [](const ScoreComponents& w) {
                 return 0.7 * w.get(kEconomicCatchUp) + 0.3 * negative_part(w.get(kProjectedEconomyGap)) +
                        0.1 * w.get(kExpansionNeed);
               },
               {kDoctrineEconomic}});
  v.push_back({kActionResearchPush, always_feasible,
               [](const ScoreComponents& w) {
                 return 0.9 * w.get(kTechOpportunity) + 0.1 * positive_part(w.get(kEconomicLead));
               },
               {kDoctrineTechnologist}});
  v.push_back({kActionExplore,
               [](const Observation&, const EvaluatorConfig& c) { return c.difficulty_profile.curiosity_enabled; },
               [](const ScoreComponents& w) { return 0.9 * w.get(kExplorationDrive); },
               {kDoctrineExpansionist}});
  v.push_back({kActionPursueAscension,
               [](const Observation& o, const EvaluatorConfig&) {
                 return o.bio_ascension || o.machine_age_virtuality;
               },
               [](const ScoreComponents& w) {
                 return 0.7 * w.get(kAscensionSynergy) + 0.3 * w.get(kTechOpportunity);
               },
               {kDoctrineGeneticAscendancy, kDoctrineSyntheticVirtuality}});
  v.push_back({kActionRestoreRingWorld,
               [](const Observation& o, const EvaluatorConfig&) { return o.shattered_ring_origin; },
               [](const ScoreComponents& w) {
                 return 0.4 * w.get(kEconomicCatchUp) + 0.4 * w.get(kExpansionNeed);
               },
               {kDoctrineEconomic}});
  return v;
}

bool serves_doctrine(const CandidateAction& a, const std::string& doctrine) {
  return std::find(a.doctrines.begin(), a.doctrines.end(), doctrine) != a.doctrines.end();
}

} // namespace

const char* planner_phase_label(PlannerPhase p) {
  switch (p) {
    case PlannerPhase::Idle: return "idle";
    case PlannerPhase::Scoring: return "scoring";
    case PlannerPhase::Filtering: return "filtering";
    case PlannerPhase::Selecting: return "selecting";
    case PlannerPhase::Logged: return "logged";
  }
  return "idle";
}

const std::vector<CandidateAction>& default_candidate_actions() {
  static const std::vector<CandidateAction> kCandidates = make_candidates();
  return kCandidates;
}

std::vector<std::string> enforce_component_invariants(ScoreComponents& components) {
  std::vector<std::string> anomalies;
  ScoreComponents fixed;
  for (const auto& c : components) {
    double v = c.value;
    if (!std::isfinite(v)) {
      anomalies.push_back("component '" + c.name + "' is non-finite; substituted 0");
      v = 0.0;
    } else if (const ComponentBounds* b = find_component_bounds(c.name)) {
      if (v < b->min || v > b->max) {
        const double clamped = std::clamp(v, b->min, b->max);
        anomalies.push_back("component '" + c.name + "' = " + format_fixed(v, 6) + " outside [" +
                            format_fixed(b->min) + ", " + format_fixed(b->max) + "]; clamped");
        v = clamped;
      }
    }
    fixed.set(c.name, v);
  }
  components = std::move(fixed);
  return anomalies;
}

ActionPlanner::ActionPlanner() : candidates_(default_candidate_actions()) {}

ActionPlanner::ActionPlanner(std::vector<CandidateAction> candidates) : candidates_(std::move(candidates)) {}

void ActionPlanner::enter(PlannerPhase next, PlanResult& r) {
  phase_ = next;
  r.phase_trace.push_back(next);
}

void ActionPlanner::mark_logged() { phase_ = PlannerPhase::Logged; }

PlanResult ActionPlanner::plan(const Observation& obs, const EvaluatorConfig& cfg) {
  return run(obs, cfg, nullptr);
}

PlanResult ActionPlanner::plan_with_components(const Observation& obs, const EvaluatorConfig& cfg,
                                               ScoreComponents components) {
  return run(obs, cfg, &components);
}

PlanResult ActionPlanner::run(const Observation& raw_obs, const EvaluatorConfig& cfg,
                              const ScoreComponents* precomputed) {
  PlanResult r;
  enter(PlannerPhase::Idle, r);

  Observation obs = raw_obs;
  r.input_issues = sanitize_observation(obs);
  r.projection_months = projection_horizon_months(cfg);

  // --- Scoring ---
  enter(PlannerPhase::Scoring, r);
  r.components = precomputed ? *precomputed : compute_score_components(obs, cfg);
  r.anomalies = enforce_component_invariants(r.components);
  r.meta = select_counter_meta(obs.steam_meta_signals, r.components, cfg);
  r.policy = recommend_policies(obs, cfg, r.meta.weighted);

  std::vector<ActionScore> scored;
  scored.reserve(candidates_.size());
  for (std::size_t i = 0; i < candidates_.size(); ++i) {
    const CandidateAction& a = candidates_[i];
    ActionScore s;
    s.id = a.id;
    s.priority = static_cast<int>(i);
    double base = a.score ? a.score(r.meta.weighted) : 0.0;
    if (!std::isfinite(base)) {
      r.anomalies.push_back("candidate '" + a.id + "' produced a non-finite score; substituted 0");
      base = 0.0;
    }
    s.base_score = base;
    s.doctrine_aligned = serves_doctrine(a, r.policy.doctrine_id);
    s.score = (s.doctrine_aligned && base > 0.0) ? base * kDoctrineAlignmentMultiplier : base;
    scored.push_back(std::move(s));
  }

  // --- Filtering ---
  enter(PlannerPhase::Filtering, r);
  for (std::size_t i = 0; i < scored.size(); ++i) {
    const CandidateAction& a = candidates_[i];
    scored[i].feasible = !a.feasible || a.feasible(obs, cfg);
  }

  // --- Selecting ---
  enter(PlannerPhase::Selecting, r);
  std::sort(scored.begin(), scored.end(), [](const ActionScore& a, const ActionScore& b) {
    if (a.feasible != b.feasible) return a.feasible;
    if (a.score != b.score) return a.score > b.score;
    return a.priority < b.priority;
  });
  r.candidates = std::move(scored);

  if (!r.candidates.empty() && r.candidates.front().feasible) {
    r.selected_action_id = r.candidates.front().id;
    r.selected_score = r.candidates.front().score;
    r.fallback = false;
  } else {
    r.selected_action_id = kHoldAction;
    r.selected_score = 0.0;
    r.fallback = true;
    log::debug("planner: no feasible candidate; holding");
  }

  for (const auto& msg : r.anomalies) log::debug("planner anomaly: " + msg);
  return r;
}

} // namespace stratai
