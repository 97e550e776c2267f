#include "stratai/core/observation.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include "stratai/util/log.h"
#include "stratai/util/strings.h"

namespace stratai {
namespace {

bool clamp_field(const char* name, double& v, double lo, double hi, std::vector<std::string>& issues) {
  if (!std::isfinite(v)) {
    issues.push_back(std::string(name) + ": non-finite value replaced by 0");
    v = 0.0;
    return true;
  }
  if (v < lo || v > hi) {
    const double c = std::clamp(v, lo, hi);
    issues.push_back(std::string(name) + ": " + format_fixed(v) + " clamped to " + format_fixed(c));
    v = c;
    return true;
  }
  return false;
}

void read_number(const json::Object& o, const char* key, double lo, double hi, double& out,
                 std::vector<std::string>& issues) {
  const json::Value* v = json::find_key(o, key);
  if (!v || v->is_null()) return;
  const double* d = v->as_number();
  if (!d) {
    issues.push_back(std::string(key) + ": expected number, got " + json::type_name(*v) + "; using default");
    return;
  }
  out = *d;
  clamp_field(key, out, lo, hi, issues);
}

// Flags are accepted as booleans or as 0/1 numbers.
void read_flag(const json::Object& o, const char* key, bool& out, std::vector<std::string>& issues) {
  const json::Value* v = json::find_key(o, key);
  if (!v || v->is_null()) return;
  if (const bool* b = v->as_bool()) {
    out = *b;
    return;
  }
  if (const double* d = v->as_number()) {
    out = (*d != 0.0);
    return;
  }
  issues.push_back(std::string(key) + ": expected bool, got " + json::type_name(*v) + "; using default");
}

void read_signals(const json::Object& o, std::map<std::string, double>& out, std::vector<std::string>& issues) {
  const json::Value* v = json::find_key(o, "steam_meta_signals");
  if (!v || v->is_null()) return;
  const json::Object* signals = v->as_object();
  if (!signals) {
    issues.push_back(std::string("steam_meta_signals: expected object, got ") + json::type_name(*v) +
                     "; no meta signals");
    return;
  }

  for (const auto& [name, conf] : *signals) {
    const double* d = conf.as_number();
    if (!d) {
      issues.push_back("steam_meta_signals." + name + ": expected number, got " + json::type_name(conf) +
                       "; entry skipped");
      continue;
    }
    double c = *d;
    clamp_field(("steam_meta_signals." + name).c_str(), c, 0.0, 1.0, issues);
    out[name] = c;
  }
}

} // namespace

ObservationParseResult parse_observation(const json::Value& root) {
  ObservationParseResult out;
  Observation& obs = out.observation;
  auto& issues = out.issues;

  const json::Object* o = root.as_object();
  if (!o) {
    issues.push_back(std::string("observation root: expected object, got ") + json::type_name(root) +
                     "; using neutral defaults");
    return out;
  }

  read_number(*o, "our_total_economy", 0.0, kMaxEconomy, obs.our_total_economy, issues);
  read_number(*o, "enemy_total_economy", 0.0, kMaxEconomy, obs.enemy_total_economy, issues);
  read_number(*o, "pop_growth_pressure", 0.0, 1.0, obs.pop_growth_pressure, issues);
  read_number(*o, "planet_capacity_pressure", 0.0, 1.0, obs.planet_capacity_pressure, issues);
  read_number(*o, "alloy_density", 0.0, 1.0, obs.alloy_density, issues);

  read_flag(*o, "bio_ascension", obs.bio_ascension, issues);
  read_flag(*o, "machine_age_virtuality", obs.machine_age_virtuality, issues);
  read_flag(*o, "shattered_ring_origin", obs.shattered_ring_origin, issues);

  read_signals(*o, obs.steam_meta_signals, issues);

  for (const auto& msg : issues) log::debug("observation: " + msg);
  return out;
}

ObservationParseResult parse_observation_text(const std::string& text) {
  return parse_observation(json::parse(text));
}

json::Value observation_to_json(const Observation& obs) {
  json::Object signals;
  for (const auto& [name, conf] : obs.steam_meta_signals) signals[name] = conf;

  json::Object o;
  o["our_total_economy"] = obs.our_total_economy;
  o["enemy_total_economy"] = obs.enemy_total_economy;
  o["pop_growth_pressure"] = obs.pop_growth_pressure;
  o["planet_capacity_pressure"] = obs.planet_capacity_pressure;
  o["alloy_density"] = obs.alloy_density;
  o["bio_ascension"] = obs.bio_ascension;
  o["machine_age_virtuality"] = obs.machine_age_virtuality;
  o["shattered_ring_origin"] = obs.shattered_ring_origin;
  o["steam_meta_signals"] = json::object(std::move(signals));
  return json::object(std::move(o));
}

std::vector<std::string> sanitize_observation(Observation& obs) {
  std::vector<std::string> issues;
  clamp_field("our_total_economy", obs.our_total_economy, 0.0, kMaxEconomy, issues);
  clamp_field("enemy_total_economy", obs.enemy_total_economy, 0.0, kMaxEconomy, issues);
  clamp_field("pop_growth_pressure", obs.pop_growth_pressure, 0.0, 1.0, issues);
  clamp_field("planet_capacity_pressure", obs.planet_capacity_pressure, 0.0, 1.0, issues);
  clamp_field("alloy_density", obs.alloy_density, 0.0, 1.0, issues);
  for (auto& [name, conf] : obs.steam_meta_signals) {
    clamp_field(("steam_meta_signals." + name).c_str(), conf, 0.0, 1.0, issues);
  }
  return issues;
}

} // namespace stratai
