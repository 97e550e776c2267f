#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "stratai/core/action_planner.h"
#include "stratai/core/config.h"
#include "stratai/core/diagnostics.h"
#include "stratai/core/meta_selector.h"
#include "stratai/core/observation.h"
#include "stratai/core/score_components.h"

namespace stratai {

// Per-game evaluation state: the rolling history, the planner and the tick
// counter. Call sites hold a session explicitly and pass it to evaluate_tick().
class EvaluationSession {
 public:
  // History capacity comes from cfg.diagnostics.history_capacity (clamped).
  explicit EvaluationSession(const EvaluatorConfig& cfg = {});
  EvaluationSession(const EvaluatorConfig& cfg, ActionPlanner planner);

  EvaluationSession(const EvaluationSession&) = delete;
  EvaluationSession& operator=(const EvaluationSession&) = delete;

  const EvaluationHistory& history() const { return history_; }
  const ActionPlanner& planner() const { return planner_; }

  // Ticks evaluated so far.
  std::uint64_t tick_count() const { return ticks_; }

 private:
  friend struct TickRunner;

  EvaluationHistory history_;
  DiagnosticsRecorder recorder_;
  ActionPlanner planner_;
  std::uint64_t ticks_{0};
};

struct TickResult {
  std::uint64_t tick{0};

  std::string selected_action_id;
  double selected_score{0.0};

  // Raw (unweighted) components after invariant checks.
  ScoreComponents score_components;

  WeightVector weights;
  bool meta_pass_through{true};
  std::vector<ArchetypeDetection> detections;

  std::string doctrine_id;
  std::string fleet_policy_id;
  std::vector<ActionScore> candidates;

  bool fallback{false};
  bool anomaly{false};
  std::vector<std::string> anomalies;

  // Recovered MalformedInput / ConfigurationOutOfRange conditions.
  std::vector<std::string> input_issues;
  std::vector<std::string> config_warnings;

  int projection_months{0};

  // History after this tick was recorded (oldest first).
  std::vector<DiagnosticsEntry> diagnostics_snapshot;
};

// Evaluate one tick: clamp the config, score, adjust for the opponent meta,
// recommend doctrine/fleet policy, pick an action and record it in the
// session history. Never throws for data reasons.
TickResult evaluate_tick(EvaluationSession& session, const Observation& obs, const EvaluatorConfig& cfg);

} // namespace stratai
