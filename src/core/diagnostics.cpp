#include "stratai/core/diagnostics.h"

#include <algorithm>
#include <utility>

namespace stratai {

EvaluationHistory::EvaluationHistory(std::size_t capacity) : capacity_(std::max<std::size_t>(1, capacity)) {}

std::vector<DiagnosticsEntry> EvaluationHistory::entries() const {
  std::lock_guard<std::mutex> lock(mu_);
  return std::vector<DiagnosticsEntry>(entries_.begin(), entries_.end());
}

bool EvaluationHistory::latest(DiagnosticsEntry& out) const {
  std::lock_guard<std::mutex> lock(mu_);
  if (entries_.empty()) return false;
  out = entries_.back();
  return true;
}

std::size_t EvaluationHistory::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.size();
}

void EvaluationHistory::append(DiagnosticsEntry entry) {
  std::lock_guard<std::mutex> lock(mu_);
  while (entries_.size() >= capacity_) entries_.pop_front();
  entries_.push_back(std::move(entry));
}

void DiagnosticsRecorder::record(DiagnosticsEntry entry) { history_.append(std::move(entry)); }

} // namespace stratai
