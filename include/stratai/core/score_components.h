#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace stratai {

struct ScoreComponent {
  std::string name;
  double value{0.0};
};

// Ordered name -> value mapping produced fresh each tick.
//
// Insertion order is preserved (it is the documented component order), so
// two evaluations of the same input compare equal entry by entry.
class ScoreComponents {
 public:
  // Replaces the value when `name` already exists, appends otherwise.
  void set(const std::string& name, double value);

  // Returns nullptr when absent.
  const double* find(const std::string& name) const;
  double get(const std::string& name, double def = 0.0) const;
  bool contains(const std::string& name) const { return find(name) != nullptr; }

  const std::vector<ScoreComponent>& entries() const { return entries_; }
  std::size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

  std::vector<ScoreComponent>::const_iterator begin() const { return entries_.begin(); }
  std::vector<ScoreComponent>::const_iterator end() const { return entries_.end(); }

  // Names sorted by descending |value|; ties keep the documented order.
  std::vector<std::string> names_by_magnitude() const;

  bool operator==(const ScoreComponents& o) const;
  bool operator!=(const ScoreComponents& o) const { return !(*this == o); }

 private:
  std::vector<ScoreComponent> entries_;
};

} // namespace stratai
