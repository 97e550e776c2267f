#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "stratai/core/config.h"
#include "stratai/core/fleet_policy.h"
#include "stratai/core/meta_selector.h"
#include "stratai/core/observation.h"
#include "stratai/core/score_components.h"

namespace stratai {

// Planner lifecycle for one tick:
//   Idle -> Scoring -> Filtering -> Selecting -> Logged
// Logged is terminal for the tick; the next plan() starts again from Idle.
enum class PlannerPhase : std::uint8_t {
  Idle = 0,
  Scoring = 1,
  Filtering = 2,
  Selecting = 3,
  Logged = 4,
};

const char* planner_phase_label(PlannerPhase p);

// Action ids, in default priority order.
inline constexpr const char* kActionFortifyDefenses = "fortify_defenses";
inline constexpr const char* kActionBuildFleet = "build_fleet";
inline constexpr const char* kActionExpandColonies = "expand_colonies";
inline constexpr const char* kActionBoostEconomy = "boost_economy";
inline constexpr const char* kActionResearchPush = "research_push";
inline constexpr const char* kActionExplore = "explore";
inline constexpr const char* kActionPursueAscension = "pursue_ascension";
inline constexpr const char* kActionRestoreRingWorld = "restore_ring_world";

// Selected when every candidate is infeasible.
inline constexpr const char* kHoldAction = "hold";

// Score multiplier for actions that match the recommended doctrine.
inline constexpr double kDoctrineAlignmentMultiplier = 1.1;

// Minimum alloy stockpile for new hull construction.
inline constexpr double kBuildFleetMinAlloyDensity = 0.1;

struct CandidateAction {
  std::string id;
  FeasibilityFn feasible;
  WeightedScoreFn score;

  // Doctrines this action serves; a match earns kDoctrineAlignmentMultiplier.
  std::vector<std::string> doctrines;
};

// The statically enumerable candidate set. List position is tie-break priority.
const std::vector<CandidateAction>& default_candidate_actions();

struct ActionScore {
  std::string id;
  double base_score{0.0};
  double score{0.0};
  bool feasible{false};
  bool doctrine_aligned{false};
  int priority{0};
};

struct PlanResult {
  std::string selected_action_id{kHoldAction};
  double selected_score{0.0};

  // True when no candidate was feasible and the hold action was chosen.
  bool fallback{false};

  int projection_months{0};

  // Components after invariant checks (non-finite entries zeroed).
  ScoreComponents components;
  MetaAdjustment meta;
  PolicyAdvice policy;

  // Every candidate, ranked: feasible first, then score, then priority.
  std::vector<ActionScore> candidates;

  // Recovered malformed/out-of-range observation fields.
  std::vector<std::string> input_issues;

  // Internal invariant violations recovered during this tick.
  std::vector<std::string> anomalies;

  // Phases entered during plan(), in order.
  std::vector<PlannerPhase> phase_trace;

  bool anomaly() const { return !anomalies.empty(); }
};

// Replaces non-finite components with 0 and clamps out-of-range ones to their
// documented bounds. One anomaly string per adjusted component.
std::vector<std::string> enforce_component_invariants(ScoreComponents& components);

class ActionPlanner {
 public:
  ActionPlanner();
  explicit ActionPlanner(std::vector<CandidateAction> candidates);

  // Runs scoring, filtering and selection for one tick. Never throws for data
  // reasons; the result always names an action.
  PlanResult plan(const Observation& obs, const EvaluatorConfig& cfg);

  // Same as plan() but with externally computed components (the scoring
  // functions are skipped). The components still go through the invariant
  // checks.
  PlanResult plan_with_components(const Observation& obs, const EvaluatorConfig& cfg, ScoreComponents components);

  // Called once the result has been handed to diagnostics.
  void mark_logged();

  PlannerPhase phase() const { return phase_; }
  const std::vector<CandidateAction>& candidates() const { return candidates_; }

 private:
  void enter(PlannerPhase next, PlanResult& r);
  PlanResult run(const Observation& obs, const EvaluatorConfig& cfg, const ScoreComponents* precomputed);

  std::vector<CandidateAction> candidates_;
  PlannerPhase phase_{PlannerPhase::Idle};
};

} // namespace stratai
