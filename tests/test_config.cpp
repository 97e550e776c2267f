#include "test.h"

#include <chrono>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

#include "stratai/core/config.h"
#include "stratai/core/enum_strings.h"
#include "stratai/util/file_io.h"
#include "stratai/util/json.h"
#include "stratai/util/log.h"

using namespace stratai;

#define SAI_ASSERT(cond)                                                                                              \
  do {                                                                                                                 \
    if (!(cond)) {                                                                                                     \
      std::cerr << "FAIL: " << __FILE__ << ":" << __LINE__ << " expected " << #cond << "\n";                        \
      ++failed;                                                                                                        \
    }                                                                                                                  \
  } while (0)

int test_config() {
  int failed = 0;

  // Defaults are already in range.
  {
    EvaluatorConfig cfg;
    SAI_ASSERT(clamp_config(cfg).empty());
    SAI_ASSERT(cfg.aggression_slider == 1.0);
    SAI_ASSERT(cfg.difficulty_profile.level == DifficultyLevel::Commodore);
    SAI_ASSERT(cfg.performance.max_projection_months_low_diff == 12);
    SAI_ASSERT(enabled_compatibility_flags(cfg.compatibility).empty());
  }

  // Out-of-range and non-finite knobs are clamped / defaulted, one warning each.
  {
    EvaluatorConfig cfg;
    cfg.aggression_slider = 5.0;
    cfg.difficulty_profile.eco_bias = std::numeric_limits<double>::quiet_NaN();
    cfg.difficulty_profile.mil_bias = -1.0;
    cfg.diagnostics.history_capacity = 0;
    const auto w = clamp_config(cfg);
    SAI_ASSERT(w.size() == 4);
    SAI_ASSERT(cfg.aggression_slider == kMaxAggression);
    SAI_ASSERT(cfg.difficulty_profile.eco_bias == 1.0);
    SAI_ASSERT(cfg.difficulty_profile.mil_bias == kMinBias);
    SAI_ASSERT(cfg.diagnostics.history_capacity == kMinHistoryCapacity);
  }

  // JSON loading: unknown keys ignored, wrong types defaulted, ranges clamped.
  {
    const auto root = json::parse(R"({
      "aggression_slider": 0.1,
      "difficulty_profile": {"level": "captain", "eco_bias": "high", "curiosity_enabled": false},
      "compatibility": ["disable_meta_counter", "bogus"],
      "performance": {"projection_months": 1000},
      "unknown_section": {"x": 1}
    })");
    const auto res = parse_evaluator_config(root);
    const auto& cfg = res.config;
    SAI_ASSERT(cfg.aggression_slider == kMinAggression);
    SAI_ASSERT(cfg.difficulty_profile.level == DifficultyLevel::Captain);
    SAI_ASSERT(cfg.difficulty_profile.eco_bias == 1.0);
    SAI_ASSERT(!cfg.difficulty_profile.curiosity_enabled);
    SAI_ASSERT(cfg.compatibility.disable_meta_counter);
    SAI_ASSERT(!cfg.compatibility.disable_ascension_bias);
    SAI_ASSERT(cfg.performance.projection_months == kMaxProjectionMonths);
    // eco_bias type, unknown flag, projection_months range, aggression range.
    SAI_ASSERT(res.warnings.size() == 4);
  }

  // Object form of compatibility flags.
  {
    const auto res = parse_evaluator_config(
        json::parse(R"({"compatibility": {"disable_ascension_bias": true, "disable_economy_projection": 1}})"));
    SAI_ASSERT(res.config.compatibility.disable_ascension_bias);
    SAI_ASSERT(!res.config.compatibility.disable_economy_projection);
    SAI_ASSERT(res.warnings.size() == 1);
    const auto names = enabled_compatibility_flags(res.config.compatibility);
    SAI_ASSERT(names.size() == 1);
    SAI_ASSERT(!names.empty() && names[0] == "disable_ascension_bias");
  }

  // Non-object root keeps every default.
  {
    const auto res = parse_evaluator_config(json::parse("[1, 2]"));
    SAI_ASSERT(res.warnings.size() == 1);
    SAI_ASSERT(res.config.aggression_slider == 1.0);
  }

  // Unknown difficulty name.
  {
    const auto res = parse_evaluator_config(json::parse(R"({"difficulty_profile": {"level": "legendary"}})"));
    SAI_ASSERT(res.config.difficulty_profile.level == DifficultyLevel::Commodore);
    SAI_ASSERT(res.warnings.size() == 1);
  }

  // Lower difficulties cap the projection horizon.
  {
    EvaluatorConfig cfg;
    SAI_ASSERT(projection_horizon_months(cfg) == 36);

    cfg.difficulty_profile.level = DifficultyLevel::Captain;
    SAI_ASSERT(is_low_difficulty(cfg.difficulty_profile.level));
    SAI_ASSERT(projection_horizon_months(cfg) == 12);

    cfg.performance.projection_months = 6;
    SAI_ASSERT(projection_horizon_months(cfg) == 6);

    cfg.difficulty_profile.level = DifficultyLevel::GrandAdmiral;
    cfg.performance.projection_months = 120;
    SAI_ASSERT(!is_low_difficulty(cfg.difficulty_profile.level));
    SAI_ASSERT(projection_horizon_months(cfg) == 120);
  }

  // Difficulty names.
  {
    DifficultyLevel l{};
    SAI_ASSERT(difficulty_level_from_string("Grand_Admiral", l));
    SAI_ASSERT(l == DifficultyLevel::GrandAdmiral);
    SAI_ASSERT(difficulty_level_to_string(DifficultyLevel::Ensign) == "ensign");
    SAI_ASSERT(!difficulty_level_from_string("", l));
  }

  // Serialized config loads back to the same knobs.
  {
    EvaluatorConfig cfg;
    cfg.aggression_slider = 1.5;
    cfg.difficulty_profile.level = DifficultyLevel::Civilian;
    cfg.difficulty_profile.tech_bias = 0.25;
    cfg.compatibility.disable_alloy_density_bias = true;
    cfg.diagnostics.history_capacity = 8;
    cfg.meta.confidence_threshold = 0.75;

    const auto res = parse_evaluator_config(json::parse(json::stringify(evaluator_config_to_json(cfg))));
    SAI_ASSERT(res.warnings.empty());
    SAI_ASSERT(res.config.aggression_slider == 1.5);
    SAI_ASSERT(res.config.difficulty_profile.level == DifficultyLevel::Civilian);
    SAI_ASSERT(res.config.difficulty_profile.tech_bias == 0.25);
    SAI_ASSERT(res.config.compatibility.disable_alloy_density_bias);
    SAI_ASSERT(res.config.diagnostics.history_capacity == 8);
    SAI_ASSERT(res.config.meta.confidence_threshold == 0.75);
  }

  // File loading.
  {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    if (ec || dir.empty()) dir = fs::path(".");
    const auto nonce = std::chrono::steady_clock::now().time_since_epoch().count();
    dir /= "stratai_test_config";
    dir /= std::to_string(static_cast<long long>(nonce));

    const fs::path path = dir / "evaluator.json";
    write_text_file(path.string(), R"({"aggression_slider": 1.25, "meta": {"confidence_threshold": 0.4}})");
    const auto res = load_evaluator_config_from_file(path.string());
    SAI_ASSERT(res.config.aggression_slider == 1.25);
    SAI_ASSERT(res.config.meta.confidence_threshold == 0.4);

    bool threw = false;
    try {
      (void)load_evaluator_config_from_file((dir / "missing.json").string());
    } catch (const std::runtime_error&) {
      threw = true;
    }
    SAI_ASSERT(threw);

    fs::remove_all(dir, ec);
  }

  // Log level names accepted by --log-level.
  {
    log::Level l = log::Level::Warn;
    SAI_ASSERT(log::parse_level(" DEBUG ", l));
    SAI_ASSERT(l == log::Level::Debug);
    SAI_ASSERT(log::parse_level("off", l));
    SAI_ASSERT(l == log::Level::Off);
    SAI_ASSERT(!log::parse_level("verbose", l));
    SAI_ASSERT(l == log::Level::Off);
  }

  return failed;
}
