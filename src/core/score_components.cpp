#include "stratai/core/score_components.h"

#include <algorithm>
#include <cmath>
#include <cstring>

namespace stratai {

void ScoreComponents::set(const std::string& name, double value) {
  for (auto& e : entries_) {
    if (e.name == name) {
      e.value = value;
      return;
    }
  }
  entries_.push_back(ScoreComponent{name, value});
}

const double* ScoreComponents::find(const std::string& name) const {
  for (const auto& e : entries_) {
    if (e.name == name) return &e.value;
  }
  return nullptr;
}

double ScoreComponents::get(const std::string& name, double def) const {
  const double* v = find(name);
  return v ? *v : def;
}

std::vector<std::string> ScoreComponents::names_by_magnitude() const {
  std::vector<std::size_t> idx(entries_.size());
  for (std::size_t i = 0; i < idx.size(); ++i) idx[i] = i;
  std::stable_sort(idx.begin(), idx.end(), [&](std::size_t a, std::size_t b) {
    return std::fabs(entries_[a].value) > std::fabs(entries_[b].value);
  });

  std::vector<std::string> out;
  out.reserve(idx.size());
  for (const std::size_t i : idx) out.push_back(entries_[i].name);
  return out;
}

bool ScoreComponents::operator==(const ScoreComponents& o) const {
  if (entries_.size() != o.entries_.size()) return false;
  for (std::size_t i = 0; i < entries_.size(); ++i) {
    if (entries_[i].name != o.entries_[i].name) return false;
    // Bitwise, so a snapshot holding NaN still equals itself.
    if (std::memcmp(&entries_[i].value, &o.entries_[i].value, sizeof(double)) != 0) return false;
  }
  return true;
}

} // namespace stratai
