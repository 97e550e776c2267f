#include "stratai/core/meta_selector.h"

#include <algorithm>
#include <array>
#include <cmath>

#include "stratai/core/scoring.h"
#include "stratai/util/log.h"
#include "stratai/util/strings.h"

namespace stratai {
namespace {

double clamp_weight(double v) {
  if (!std::isfinite(v)) return 1.0;
  return std::clamp(v, kMinWeight, kMaxWeight);
}

double clamp_delta(double v) { return std::clamp(v, -kMaxWeightDelta, kMaxWeightDelta); }

void add(WeightVector& acc, const WeightVector& d) {
  acc.economy += d.economy;
  acc.expansion += d.expansion;
  acc.threat += d.threat;
  acc.tech += d.tech;
  acc.exploration += d.exploration;
  acc.ascension += d.ascension;
}

WeightVector zero_weights() {
  WeightVector w;
  w.economy = w.expansion = w.threat = w.tech = w.exploration = w.ascension = 0.0;
  return w;
}

} // namespace

const char* opponent_archetype_label(OpponentArchetype a) {
  switch (a) {
    case OpponentArchetype::Aggressive: return "aggressive";
    case OpponentArchetype::Economic: return "economic";
    case OpponentArchetype::BioRush: return "bio_rush";
    case OpponentArchetype::Virtuality: return "virtuality";
  }
  return "aggressive";
}

bool archetype_from_signal_name(const std::string& raw, OpponentArchetype& out) {
  std::string s = to_lower(trim_copy(raw));
  const std::string suffix = "_confidence";
  if (ends_with(s, suffix)) s.erase(s.size() - suffix.size());

  for (int i = 0; i < kArchetypeCount; ++i) {
    const auto a = static_cast<OpponentArchetype>(i);
    if (s == opponent_archetype_label(a)) {
      out = a;
      return true;
    }
  }
  return false;
}

bool WeightVector::operator==(const WeightVector& o) const {
  return economy == o.economy && expansion == o.expansion && threat == o.threat && tech == o.tech &&
         exploration == o.exploration && ascension == o.ascension;
}

WeightVector base_weights(const EvaluatorConfig& cfg) {
  WeightVector w;
  double aggression = cfg.aggression_slider;
  if (!std::isfinite(aggression)) aggression = 1.0;
  w.threat = std::clamp(aggression, kMinAggression, kMaxAggression);
  return w;
}

WeightVector counter_adjustment(OpponentArchetype a) {
  WeightVector d = zero_weights();
  switch (a) {
    case OpponentArchetype::Aggressive:
      d.threat = 0.6;
      d.exploration = -0.3;
      break;
    case OpponentArchetype::Economic:
      d.economy = 0.4;
      d.expansion = 0.2;
      break;
    case OpponentArchetype::BioRush:
      d.threat = 0.2;
      d.tech = 0.3;
      break;
    case OpponentArchetype::Virtuality:
      d.tech = 0.2;
      d.economy = 0.2;
      break;
  }
  return d;
}

double weight_for_component(const WeightVector& w, const std::string& component) {
  if (component == kEconomicLead || component == kEconomicCatchUp || component == kProjectedEconomyGap) {
    return w.economy;
  }
  if (component == kExpansionNeed) return w.expansion;
  if (component == kThreatPressure || component == kMilitaryReadiness) return w.threat;
  if (component == kTechOpportunity) return w.tech;
  if (component == kExplorationDrive) return w.exploration;
  if (component == kAscensionSynergy) return w.ascension;
  return 1.0;
}

ScoreComponents apply_weights(const ScoreComponents& components, const WeightVector& w) {
  ScoreComponents out;
  for (const auto& c : components) out.set(c.name, c.value * weight_for_component(w, c.name));
  return out;
}

MetaAdjustment select_counter_meta(const std::map<std::string, double>& signals, const ScoreComponents& components,
                                   const EvaluatorConfig& cfg) {
  MetaAdjustment out;
  out.base = base_weights(cfg);
  out.weights = out.base;

  // Several signal names can name one archetype; keep the strongest.
  std::array<double, kArchetypeCount> best{};
  std::array<bool, kArchetypeCount> seen{};
  for (const auto& [name, conf] : signals) {
    OpponentArchetype a{};
    if (!archetype_from_signal_name(name, a)) {
      out.ignored_signals.push_back(name);
      continue;
    }
    const auto i = static_cast<std::size_t>(a);
    const double c = std::isfinite(conf) ? std::clamp(conf, 0.0, 1.0) : 0.0;
    best[i] = seen[i] ? std::max(best[i], c) : c;
    seen[i] = true;
  }

  const double threshold = std::isfinite(cfg.meta.confidence_threshold)
                               ? std::clamp(cfg.meta.confidence_threshold, 0.0, 1.0)
                               : MetaConfig{}.confidence_threshold;

  WeightVector delta = zero_weights();
  bool any_detected = false;
  for (int i = 0; i < kArchetypeCount; ++i) {
    if (!seen[static_cast<std::size_t>(i)]) continue;
    ArchetypeDetection det;
    det.archetype = static_cast<OpponentArchetype>(i);
    det.confidence = best[static_cast<std::size_t>(i)];
    det.detected = det.confidence > threshold;
    if (det.detected) {
      add(delta, counter_adjustment(det.archetype));
      any_detected = true;
    }
    out.detections.push_back(det);
  }

  if (any_detected && !cfg.compatibility.disable_meta_counter) {
    WeightVector& w = out.weights;
    w.economy = clamp_weight(out.base.economy + clamp_delta(delta.economy));
    w.expansion = clamp_weight(out.base.expansion + clamp_delta(delta.expansion));
    w.threat = clamp_weight(out.base.threat + clamp_delta(delta.threat));
    w.tech = clamp_weight(out.base.tech + clamp_delta(delta.tech));
    w.exploration = clamp_weight(out.base.exploration + clamp_delta(delta.exploration));
    w.ascension = clamp_weight(out.base.ascension + clamp_delta(delta.ascension));
    out.pass_through = false;
  } else if (any_detected) {
    log::debug("meta: archetype detected but meta countering is disabled");
  }

  out.weighted = apply_weights(components, out.weights);
  return out;
}

} // namespace stratai
