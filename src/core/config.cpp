#include "stratai/core/config.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

#include "stratai/core/enum_strings.h"
#include "stratai/util/file_io.h"
#include "stratai/util/log.h"
#include "stratai/util/strings.h"

namespace stratai {
namespace {

struct CompatFlagDef {
  const char* name;
  bool CompatibilityFlags::*member;
};

constexpr CompatFlagDef kCompatFlags[] = {
    {"disable_ascension_bias", &CompatibilityFlags::disable_ascension_bias},
    {"disable_shattered_ring_adjustment", &CompatibilityFlags::disable_shattered_ring_adjustment},
    {"disable_alloy_density_bias", &CompatibilityFlags::disable_alloy_density_bias},
    {"disable_meta_counter", &CompatibilityFlags::disable_meta_counter},
    {"disable_economy_projection", &CompatibilityFlags::disable_economy_projection},
};

void clamp_real(const char* name, double& v, double lo, double hi, double def, std::vector<std::string>& warnings) {
  if (!std::isfinite(v)) {
    warnings.push_back(std::string(name) + ": non-finite value replaced by default " + format_fixed(def));
    v = def;
    return;
  }
  if (v < lo || v > hi) {
    const double c = std::clamp(v, lo, hi);
    warnings.push_back(std::string(name) + ": " + format_fixed(v) + " clamped to " + format_fixed(c));
    v = c;
  }
}

void clamp_count(const char* name, int& v, int lo, int hi, std::vector<std::string>& warnings) {
  if (v < lo || v > hi) {
    const int c = std::clamp(v, lo, hi);
    warnings.push_back(std::string(name) + ": " + std::to_string(v) + " clamped to " + std::to_string(c));
    v = c;
  }
}

// Reads an optional number. Wrong types keep the current value and warn.
void read_real(const json::Object& o, const char* key, const std::string& path, double& out,
               std::vector<std::string>& warnings) {
  const json::Value* v = json::find_key(o, key);
  if (!v) return;
  if (const double* d = v->as_number()) {
    out = *d;
    return;
  }
  warnings.push_back(path + key + ": expected number, got " + json::type_name(*v) + "; using default");
}

// Integer knobs are read as doubles and narrowed after range clamping so huge
// JSON numbers never overflow the conversion.
void read_count(const json::Object& o, const char* key, const std::string& path, int& out, int lo, int hi,
                std::vector<std::string>& warnings) {
  const json::Value* v = json::find_key(o, key);
  if (!v) return;
  const double* d = v->as_number();
  if (!d) {
    warnings.push_back(path + key + ": expected number, got " + json::type_name(*v) + "; using default");
    return;
  }
  const double rounded = std::round(*d);
  if (rounded < static_cast<double>(lo) || rounded > static_cast<double>(hi)) {
    const int c = rounded < static_cast<double>(lo) ? lo : hi;
    warnings.push_back(path + key + ": " + format_fixed(*d, 0) + " clamped to " + std::to_string(c));
    out = c;
    return;
  }
  out = static_cast<int>(rounded);
}

void read_flag(const json::Object& o, const char* key, const std::string& path, bool& out,
               std::vector<std::string>& warnings) {
  const json::Value* v = json::find_key(o, key);
  if (!v) return;
  if (const bool* b = v->as_bool()) {
    out = *b;
    return;
  }
  warnings.push_back(path + key + ": expected bool, got " + json::type_name(*v) + "; using default");
}

const json::Object* read_section(const json::Object& root, const char* key, std::vector<std::string>& warnings) {
  const json::Value* v = json::find_key(root, key);
  if (!v) return nullptr;
  if (const json::Object* o = v->as_object()) return o;
  warnings.push_back(std::string(key) + ": expected object, got " + json::type_name(*v) + "; section ignored");
  return nullptr;
}

bool set_compat_flag_by_name(CompatibilityFlags& flags, const std::string& name, bool value) {
  for (const auto& def : kCompatFlags) {
    if (name == def.name) {
      flags.*(def.member) = value;
      return true;
    }
  }
  return false;
}

void read_compatibility(const json::Value& v, CompatibilityFlags& flags, std::vector<std::string>& warnings) {
  if (const json::Object* o = v.as_object()) {
    for (const auto& def : kCompatFlags) {
      read_flag(*o, def.name, "compatibility.", flags.*(def.member), warnings);
    }
    return;
  }
  if (const json::Array* a = v.as_array()) {
    for (const auto& item : *a) {
      const std::string* name = item.as_string();
      if (!name) {
        warnings.push_back(std::string("compatibility: expected flag name, got ") + json::type_name(item));
        continue;
      }
      if (!set_compat_flag_by_name(flags, trim_copy(*name), true)) {
        warnings.push_back("compatibility: unknown flag '" + *name + "' ignored");
      }
    }
    return;
  }
  warnings.push_back(std::string("compatibility: expected object or array, got ") + json::type_name(v));
}

} // namespace

bool is_low_difficulty(DifficultyLevel level) {
  return static_cast<int>(level) <= static_cast<int>(DifficultyLevel::Captain);
}

std::vector<std::string> clamp_config(EvaluatorConfig& cfg) {
  const EvaluatorConfig defaults;
  std::vector<std::string> w;

  clamp_real("aggression_slider", cfg.aggression_slider, kMinAggression, kMaxAggression, defaults.aggression_slider,
             w);

  auto& dp = cfg.difficulty_profile;
  clamp_real("difficulty_profile.eco_bias", dp.eco_bias, kMinBias, kMaxBias, defaults.difficulty_profile.eco_bias, w);
  clamp_real("difficulty_profile.tech_bias", dp.tech_bias, kMinBias, kMaxBias, defaults.difficulty_profile.tech_bias,
             w);
  clamp_real("difficulty_profile.mil_bias", dp.mil_bias, kMinBias, kMaxBias, defaults.difficulty_profile.mil_bias, w);

  const int raw_level = static_cast<int>(dp.level);
  if (raw_level > static_cast<int>(DifficultyLevel::GrandAdmiral)) {
    w.push_back("difficulty_profile.level: invalid value " + std::to_string(raw_level) + " clamped to grand_admiral");
    dp.level = DifficultyLevel::GrandAdmiral;
  }

  clamp_count("performance.projection_months", cfg.performance.projection_months, kMinProjectionMonths,
              kMaxProjectionMonths, w);
  clamp_count("performance.max_projection_months_low_diff", cfg.performance.max_projection_months_low_diff,
              kMinProjectionMonths, kMaxLowDifficultyProjectionMonths, w);
  clamp_count("diagnostics.history_capacity", cfg.diagnostics.history_capacity, kMinHistoryCapacity,
              kMaxHistoryCapacity, w);
  clamp_real("meta.confidence_threshold", cfg.meta.confidence_threshold, 0.0, 1.0, defaults.meta.confidence_threshold,
             w);

  for (const auto& msg : w) log::debug("config: " + msg);
  return w;
}

ConfigLoadResult parse_evaluator_config(const json::Value& root) {
  ConfigLoadResult out;
  EvaluatorConfig& cfg = out.config;
  auto& w = out.warnings;

  const json::Object* obj = root.as_object();
  if (!obj) {
    w.push_back(std::string("config root: expected object, got ") + json::type_name(root) + "; using defaults");
    return out;
  }

  read_real(*obj, "aggression_slider", "", cfg.aggression_slider, w);

  if (const json::Object* dp = read_section(*obj, "difficulty_profile", w)) {
    if (const json::Value* lv = json::find_key(*dp, "level")) {
      const std::string* name = lv->as_string();
      DifficultyLevel level{};
      if (name && difficulty_level_from_string(*name, level)) {
        cfg.difficulty_profile.level = level;
      } else if (name) {
        w.push_back("difficulty_profile.level: unknown level '" + *name + "'; using default");
      } else {
        w.push_back(std::string("difficulty_profile.level: expected string, got ") + json::type_name(*lv) +
                    "; using default");
      }
    }
    read_real(*dp, "eco_bias", "difficulty_profile.", cfg.difficulty_profile.eco_bias, w);
    read_real(*dp, "tech_bias", "difficulty_profile.", cfg.difficulty_profile.tech_bias, w);
    read_real(*dp, "mil_bias", "difficulty_profile.", cfg.difficulty_profile.mil_bias, w);
    read_flag(*dp, "curiosity_enabled", "difficulty_profile.", cfg.difficulty_profile.curiosity_enabled, w);
  }

  if (const json::Value* compat = json::find_key(*obj, "compatibility")) {
    read_compatibility(*compat, cfg.compatibility, w);
  }

  if (const json::Object* perf = read_section(*obj, "performance", w)) {
    read_count(*perf, "projection_months", "performance.", cfg.performance.projection_months, kMinProjectionMonths,
               kMaxProjectionMonths, w);
    read_count(*perf, "max_projection_months_low_diff", "performance.", cfg.performance.max_projection_months_low_diff,
               kMinProjectionMonths, kMaxLowDifficultyProjectionMonths, w);
  }

  if (const json::Object* diag = read_section(*obj, "diagnostics", w)) {
    read_count(*diag, "history_capacity", "diagnostics.", cfg.diagnostics.history_capacity, kMinHistoryCapacity,
               kMaxHistoryCapacity, w);
  }

  if (const json::Object* meta = read_section(*obj, "meta", w)) {
    read_real(*meta, "confidence_threshold", "meta.", cfg.meta.confidence_threshold, w);
  }

  auto clamped = clamp_config(cfg);
  w.insert(w.end(), clamped.begin(), clamped.end());
  return out;
}

ConfigLoadResult load_evaluator_config_from_file(const std::string& path) {
  const json::Value root = json::parse(read_text_file(path));
  ConfigLoadResult res = parse_evaluator_config(root);
  for (const auto& msg : res.warnings) log::debug(path + ": " + msg);
  return res;
}

json::Value evaluator_config_to_json(const EvaluatorConfig& cfg) {
  json::Object dp;
  dp["level"] = difficulty_level_to_string(cfg.difficulty_profile.level);
  dp["eco_bias"] = cfg.difficulty_profile.eco_bias;
  dp["tech_bias"] = cfg.difficulty_profile.tech_bias;
  dp["mil_bias"] = cfg.difficulty_profile.mil_bias;
  dp["curiosity_enabled"] = cfg.difficulty_profile.curiosity_enabled;

  json::Object compat;
  for (const auto& def : kCompatFlags) compat[def.name] = cfg.compatibility.*(def.member);

  json::Object perf;
  perf["projection_months"] = static_cast<double>(cfg.performance.projection_months);
  perf["max_projection_months_low_diff"] = static_cast<double>(cfg.performance.max_projection_months_low_diff);

  json::Object diag;
  diag["history_capacity"] = static_cast<double>(cfg.diagnostics.history_capacity);

  json::Object meta;
  meta["confidence_threshold"] = cfg.meta.confidence_threshold;

  json::Object root;
  root["aggression_slider"] = cfg.aggression_slider;
  root["difficulty_profile"] = json::object(std::move(dp));
  root["compatibility"] = json::object(std::move(compat));
  root["performance"] = json::object(std::move(perf));
  root["diagnostics"] = json::object(std::move(diag));
  root["meta"] = json::object(std::move(meta));
  return json::object(std::move(root));
}

std::vector<std::string> enabled_compatibility_flags(const CompatibilityFlags& flags) {
  std::vector<std::string> out;
  for (const auto& def : kCompatFlags) {
    if (flags.*(def.member)) out.emplace_back(def.name);
  }
  return out;
}

int projection_horizon_months(const EvaluatorConfig& cfg) {
  const int months = std::clamp(cfg.performance.projection_months, kMinProjectionMonths, kMaxProjectionMonths);
  if (!is_low_difficulty(cfg.difficulty_profile.level)) return months;
  const int cap = std::clamp(cfg.performance.max_projection_months_low_diff, kMinProjectionMonths,
                             kMaxLowDifficultyProjectionMonths);
  return std::min(months, cap);
}

} // namespace stratai
