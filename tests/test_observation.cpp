#include "test.h"

#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

#include "stratai/core/observation.h"
#include "stratai/util/json.h"

using namespace stratai;

#define SAI_ASSERT(cond)                                                                                              \
  do {                                                                                                                 \
    if (!(cond)) {                                                                                                     \
      std::cerr << "FAIL: " << __FILE__ << ":" << __LINE__ << " expected " << #cond << "\n";                        \
      ++failed;                                                                                                        \
    }                                                                                                                  \
  } while (0)

int test_observation() {
  int failed = 0;

  // Missing fields take neutral defaults.
  {
    const auto res = parse_observation(json::parse("{}"));
    SAI_ASSERT(res.clean());
    SAI_ASSERT(res.observation.our_total_economy == 0.0);
    SAI_ASSERT(res.observation.pop_growth_pressure == 0.0);
    SAI_ASSERT(!res.observation.bio_ascension);
    SAI_ASSERT(res.observation.steam_meta_signals.empty());
  }

  // A full, well-formed payload with an unknown extra field.
  {
    const auto res = parse_observation_text(R"({
      "our_total_economy": 1000, "enemy_total_economy": 2000,
      "pop_growth_pressure": 0.9, "planet_capacity_pressure": 0.4, "alloy_density": 0.3,
      "bio_ascension": true, "machine_age_virtuality": false, "shattered_ring_origin": true,
      "steam_meta_signals": {"aggressive_confidence": 0.7},
      "game_version": "3.12"
    })");
    SAI_ASSERT(res.clean());
    const auto& o = res.observation;
    SAI_ASSERT(o.our_total_economy == 1000.0);
    SAI_ASSERT(o.enemy_total_economy == 2000.0);
    SAI_ASSERT(o.planet_capacity_pressure == 0.4);
    SAI_ASSERT(o.bio_ascension);
    SAI_ASSERT(o.shattered_ring_origin);
    SAI_ASSERT(o.steam_meta_signals.size() == 1);
    SAI_ASSERT(o.steam_meta_signals.at("aggressive_confidence") == 0.7);
  }

  // Malformed fields are recovered, one issue each.
  {
    const auto res = parse_observation_text(R"({
      "our_total_economy": "lots",
      "pop_growth_pressure": 1.7,
      "bio_ascension": 1,
      "machine_age_virtuality": "yes",
      "steam_meta_signals": {"error": "timed out", "bio_rush_confidence": 0.65, "aggressive": 3}
    })");
    const auto& o = res.observation;
    SAI_ASSERT(res.issues.size() == 5);
    SAI_ASSERT(o.our_total_economy == 0.0);
    SAI_ASSERT(o.pop_growth_pressure == 1.0);
    SAI_ASSERT(o.bio_ascension);
    SAI_ASSERT(!o.machine_age_virtuality);
    SAI_ASSERT(o.steam_meta_signals.count("error") == 0);
    SAI_ASSERT(o.steam_meta_signals.at("bio_rush_confidence") == 0.65);
    SAI_ASSERT(o.steam_meta_signals.at("aggressive") == 1.0);
  }

  // Numbers beyond double range are recovered like any other bad value.
  {
    const auto res = parse_observation_text(R"({"our_total_economy": 1e400, "enemy_total_economy": 5})");
    SAI_ASSERT(res.issues.size() == 1);
    SAI_ASSERT(res.observation.our_total_economy == 0.0);
    SAI_ASSERT(res.observation.enemy_total_economy == 5.0);

    const auto neg = parse_observation_text(R"({"alloy_density": -1e400, "pop_growth_pressure": 1e-400})");
    SAI_ASSERT(neg.issues.size() == 1);
    SAI_ASSERT(neg.observation.alloy_density == 0.0);
    SAI_ASSERT(neg.observation.pop_growth_pressure == 0.0);
  }

  // Null is treated like a missing field.
  {
    const auto res = parse_observation_text(R"({"alloy_density": null, "steam_meta_signals": null})");
    SAI_ASSERT(res.clean());
    SAI_ASSERT(res.observation.alloy_density == 0.0);
  }

  // Non-object root.
  {
    const auto res = parse_observation(json::parse("[0.5]"));
    SAI_ASSERT(res.issues.size() == 1);
    SAI_ASSERT(res.observation.enemy_total_economy == 0.0);
  }

  // Invalid JSON text is a loader error, not a data issue.
  {
    bool threw = false;
    try {
      (void)parse_observation_text("{\"our_total_economy\": }");
    } catch (const std::runtime_error&) {
      threw = true;
    }
    SAI_ASSERT(threw);
  }

  // Hand-built observations are sanitized in place.
  {
    Observation o;
    o.our_total_economy = -50.0;
    o.alloy_density = std::numeric_limits<double>::quiet_NaN();
    o.planet_capacity_pressure = 0.5;
    o.steam_meta_signals["economic"] = -0.2;
    const auto issues = sanitize_observation(o);
    SAI_ASSERT(issues.size() == 3);
    SAI_ASSERT(o.our_total_economy == 0.0);
    SAI_ASSERT(o.alloy_density == 0.0);
    SAI_ASSERT(o.planet_capacity_pressure == 0.5);
    SAI_ASSERT(o.steam_meta_signals.at("economic") == 0.0);
  }

  // Serialized observation parses back unchanged.
  {
    Observation o;
    o.our_total_economy = 1234.5;
    o.alloy_density = 0.25;
    o.machine_age_virtuality = true;
    o.steam_meta_signals["virtuality_confidence"] = 0.9;
    const auto res = parse_observation(observation_to_json(o));
    SAI_ASSERT(res.clean());
    SAI_ASSERT(res.observation.our_total_economy == 1234.5);
    SAI_ASSERT(res.observation.alloy_density == 0.25);
    SAI_ASSERT(res.observation.machine_age_virtuality);
    SAI_ASSERT(res.observation.steam_meta_signals.at("virtuality_confidence") == 0.9);
  }

  return failed;
}
