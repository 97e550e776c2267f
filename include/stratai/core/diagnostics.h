#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "stratai/core/score_components.h"

namespace stratai {

// One recorded tick.
struct DiagnosticsEntry {
  std::uint64_t tick{0};
  std::string selected_action_id;
  ScoreComponents components;
  std::string doctrine_id;
  std::string fleet_policy_id;
  bool fallback{false};
  bool anomaly{false};
  std::vector<std::string> anomalies;
  // Recovered input problems and clamped knobs from the same tick.
  std::vector<std::string> input_issues;
  std::vector<std::string> config_warnings;
};

class DiagnosticsRecorder;

// Bounded rolling history of evaluations, owned by one session.
//
// Capacity is fixed at construction; appending beyond it evicts the oldest
// entry first. Only DiagnosticsRecorder may append.
class EvaluationHistory {
 public:
  explicit EvaluationHistory(std::size_t capacity);

  EvaluationHistory(const EvaluationHistory&) = delete;
  EvaluationHistory& operator=(const EvaluationHistory&) = delete;

  // Snapshot in insertion order (oldest first).
  std::vector<DiagnosticsEntry> entries() const;

  // Most recent entry; false when empty.
  bool latest(DiagnosticsEntry& out) const;

  std::size_t size() const;
  std::size_t capacity() const { return capacity_; }

 private:
  friend class DiagnosticsRecorder;
  void append(DiagnosticsEntry entry);

  std::size_t capacity_;
  mutable std::mutex mu_;
  std::deque<DiagnosticsEntry> entries_;
};

// The single writer of an EvaluationHistory.
class DiagnosticsRecorder {
 public:
  explicit DiagnosticsRecorder(EvaluationHistory& history) : history_(history) {}

  void record(DiagnosticsEntry entry);

 private:
  EvaluationHistory& history_;
};

} // namespace stratai
