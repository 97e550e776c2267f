#include "test.h"

#include <iostream>
#include <map>
#include <string>

#include "stratai/core/config.h"
#include "stratai/core/meta_selector.h"
#include "stratai/core/observation.h"
#include "stratai/core/scoring.h"

using namespace stratai;

#define SAI_ASSERT(cond)                                                                                              \
  do {                                                                                                                 \
    if (!(cond)) {                                                                                                     \
      std::cerr << "FAIL: " << __FILE__ << ":" << __LINE__ << " expected " << #cond << "\n";                        \
      ++failed;                                                                                                        \
    }                                                                                                                  \
  } while (0)

namespace {

ScoreComponents sample_components() {
  Observation o;
  o.our_total_economy = 1000.0;
  o.enemy_total_economy = 2000.0;
  o.pop_growth_pressure = 0.9;
  return compute_score_components(o, EvaluatorConfig{});
}

bool weights_in_bounds(const WeightVector& w) {
  for (double v : {w.economy, w.expansion, w.threat, w.tech, w.exploration, w.ascension}) {
    if (v < kMinWeight || v > kMaxWeight) return false;
  }
  return true;
}

} // namespace

int test_meta_selector() {
  int failed = 0;
  const ScoreComponents comps = sample_components();

  // Signal names.
  {
    OpponentArchetype a{};
    SAI_ASSERT(archetype_from_signal_name("Bio_Rush_Confidence", a));
    SAI_ASSERT(a == OpponentArchetype::BioRush);
    SAI_ASSERT(archetype_from_signal_name("virtuality", a));
    SAI_ASSERT(a == OpponentArchetype::Virtuality);
    SAI_ASSERT(!archetype_from_signal_name("error", a));
    SAI_ASSERT(!archetype_from_signal_name("_confidence", a));
  }

  // No signals: base weights pass through and the weighted view is unchanged.
  {
    const EvaluatorConfig cfg;
    const auto m = select_counter_meta({}, comps, cfg);
    SAI_ASSERT(m.pass_through);
    SAI_ASSERT(m.weights == m.base);
    SAI_ASSERT(m.weighted == comps);
    SAI_ASSERT(m.detections.empty());
  }

  // Aggression scales the threat weight.
  {
    EvaluatorConfig cfg;
    cfg.aggression_slider = 2.0;
    const auto m = select_counter_meta({}, comps, cfg);
    SAI_ASSERT(m.weights.threat == 2.0);
    SAI_ASSERT(approx(m.weighted.get(kThreatPressure), 2.0 * comps.get(kThreatPressure)));
    SAI_ASSERT(m.weighted.get(kExpansionNeed) == comps.get(kExpansionNeed));
  }

  // Detected aggressive opponent.
  {
    const EvaluatorConfig cfg;
    const auto m = select_counter_meta({{"aggressive_confidence", 0.8}, {"error", 0.0}}, comps, cfg);
    SAI_ASSERT(!m.pass_through);
    SAI_ASSERT(approx(m.weights.threat, 1.6));
    SAI_ASSERT(approx(m.weights.exploration, 0.7));
    SAI_ASSERT(m.weights.economy == 1.0);
    SAI_ASSERT(m.detections.size() == 1);
    SAI_ASSERT(m.detections[0].detected);
    SAI_ASSERT(m.ignored_signals.size() == 1);
  }

  // The threshold is strict.
  {
    const EvaluatorConfig cfg;
    const auto m = select_counter_meta({{"economic", 0.5}}, comps, cfg);
    SAI_ASSERT(m.pass_through);
    SAI_ASSERT(m.detections.size() == 1);
    SAI_ASSERT(!m.detections[0].detected);
  }

  // Several names for one archetype: the strongest counts.
  {
    const EvaluatorConfig cfg;
    const auto m = select_counter_meta({{"aggressive", 0.3}, {"aggressive_confidence", 0.9}}, comps, cfg);
    SAI_ASSERT(m.detections.size() == 1);
    SAI_ASSERT(m.detections[0].confidence == 0.9);
    SAI_ASSERT(m.detections[0].detected);
  }

  // Monotonic in confidence and always within the clamp bounds.
  {
    EvaluatorConfig cfg;
    cfg.aggression_slider = 2.0;
    double prev = 0.0;
    for (int i = 0; i <= 20; ++i) {
      const double conf = i / 10.0;  // Deliberately runs past 1.0.
      const auto m = select_counter_meta({{"aggressive", conf}, {"bio_rush", conf}}, comps, cfg);
      SAI_ASSERT(m.weights.threat >= prev);
      SAI_ASSERT(weights_in_bounds(m.weights));
      prev = m.weights.threat;
    }
    SAI_ASSERT(approx(prev, 2.0 + 0.6 + 0.2));
  }

  // All archetypes at once: deltas are summed per weight.
  {
    const EvaluatorConfig cfg;
    const auto m = select_counter_meta(
        {{"aggressive", 1.0}, {"economic", 1.0}, {"bio_rush", 1.0}, {"virtuality", 1.0}}, comps, cfg);
    SAI_ASSERT(m.detections.size() == 4);
    SAI_ASSERT(approx(m.weights.economy, 1.6));
    SAI_ASSERT(approx(m.weights.tech, 1.5));
    SAI_ASSERT(approx(m.weights.threat, 1.8));
    SAI_ASSERT(weights_in_bounds(m.weights));
  }

  // Meta countering can be switched off.
  {
    EvaluatorConfig cfg;
    cfg.compatibility.disable_meta_counter = true;
    const auto m = select_counter_meta({{"aggressive", 1.0}}, comps, cfg);
    SAI_ASSERT(m.pass_through);
    SAI_ASSERT(m.weights == base_weights(cfg));
    SAI_ASSERT(m.detections.size() == 1);
    SAI_ASSERT(m.detections[0].detected);
  }

  // Threshold is configurable.
  {
    EvaluatorConfig cfg;
    cfg.meta.confidence_threshold = 0.2;
    const auto m = select_counter_meta({{"virtuality", 0.3}}, comps, cfg);
    SAI_ASSERT(!m.pass_through);
    SAI_ASSERT(approx(m.weights.tech, 1.2));
  }

  return failed;
}
