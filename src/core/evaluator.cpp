#include "stratai/core/evaluator.h"

#include <algorithm>
#include <utility>

#include "stratai/util/log.h"

namespace stratai {
namespace {

std::size_t history_capacity(const EvaluatorConfig& cfg) {
  const int cap = std::clamp(cfg.diagnostics.history_capacity, kMinHistoryCapacity, kMaxHistoryCapacity);
  return static_cast<std::size_t>(cap);
}

} // namespace

EvaluationSession::EvaluationSession(const EvaluatorConfig& cfg)
    : history_(history_capacity(cfg)), recorder_(history_) {}

EvaluationSession::EvaluationSession(const EvaluatorConfig& cfg, ActionPlanner planner)
    : history_(history_capacity(cfg)), recorder_(history_), planner_(std::move(planner)) {}

struct TickRunner {
  static TickResult run(EvaluationSession& s, const Observation& obs, const EvaluatorConfig& raw_cfg) {
    EvaluatorConfig cfg = raw_cfg;
    std::vector<std::string> cfg_warnings = clamp_config(cfg);

    PlanResult plan = s.planner_.plan(obs, cfg);

    TickResult out;
    out.tick = ++s.ticks_;
    out.selected_action_id = plan.selected_action_id;
    out.selected_score = plan.selected_score;
    out.score_components = plan.components;
    out.weights = plan.meta.weights;
    out.meta_pass_through = plan.meta.pass_through;
    out.detections = plan.meta.detections;
    out.doctrine_id = plan.policy.doctrine_id;
    out.fleet_policy_id = plan.policy.fleet_policy_id;
    out.candidates = std::move(plan.candidates);
    out.fallback = plan.fallback;
    out.anomaly = plan.anomaly();
    out.anomalies = plan.anomalies;
    out.input_issues = std::move(plan.input_issues);
    out.config_warnings = std::move(cfg_warnings);
    out.projection_months = plan.projection_months;

    DiagnosticsEntry entry;
    entry.tick = out.tick;
    entry.selected_action_id = out.selected_action_id;
    entry.components = out.score_components;
    entry.doctrine_id = out.doctrine_id;
    entry.fleet_policy_id = out.fleet_policy_id;
    entry.fallback = out.fallback;
    entry.anomaly = out.anomaly;
    entry.anomalies = std::move(plan.anomalies);
    entry.input_issues = out.input_issues;
    entry.config_warnings = out.config_warnings;
    s.recorder_.record(std::move(entry));
    s.planner_.mark_logged();

    for (const auto& w : out.config_warnings) log::debug("config: " + w);
    for (const auto& i : out.input_issues) log::debug("observation: " + i);
    log::debug("tick " + std::to_string(out.tick) + ": " + out.selected_action_id);

    out.diagnostics_snapshot = s.history_.entries();
    return out;
  }
};

TickResult evaluate_tick(EvaluationSession& session, const Observation& obs, const EvaluatorConfig& cfg) {
  return TickRunner::run(session, obs, cfg);
}

} // namespace stratai
