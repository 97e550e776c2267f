#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

#include "stratai/core/config.h"
#include "stratai/core/enum_strings.h"
#include "stratai/core/evaluator.h"
#include "stratai/core/observation.h"
#include "stratai/util/diagnostics_export.h"
#include "stratai/util/digest.h"
#include "stratai/util/file_io.h"
#include "stratai/util/json.h"
#include "stratai/util/log.h"
#include "stratai/util/save_scan.h"
#include "stratai/util/strings.h"

namespace {

#ifndef STRATAI_VERSION
#define STRATAI_VERSION "unknown"
#endif

int get_int_arg(int argc, char** argv, const std::string& key, int def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return std::stoi(argv[i + 1]);
  }
  return def;
}

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

void print_usage(const char* exe) {
  std::cout << "StratAI CLI v" << STRATAI_VERSION << "\n\n";
  std::cout << "Usage: " << (exe ? exe : "stratai_cli") << " (--observation PATH | --save-text PATH) [options]\n\n";
  std::cout << "Input:\n";
  std::cout << "  --observation PATH  Observation JSON payload\n";
  std::cout << "  --save-text PATH    Plain-text save; scanned into an observation\n";
  std::cout << "Options:\n";
  std::cout << "  --config PATH       Evaluator config JSON (default: built-in defaults)\n";
  std::cout << "  --ticks N           Evaluate N ticks with one session (default: 1)\n";
  std::cout << "  --json              Print the last tick result as JSON\n";
  std::cout << "  --digest            Print a stable digest of the last tick result\n";
  std::cout << "  --dump-observation  Print the sanitized observation JSON and exit\n";
  std::cout << "  --export-history-json PATH  Write the diagnostics history as JSON\n";
  std::cout << "  --export-history-csv PATH   Write the diagnostics history as CSV\n";
  std::cout << "  --log-level L       debug|info|warn|error|off (default: warn)\n";
  std::cout << "  --quiet             Suppress non-essential output (useful for scripts)\n";
  std::cout << "  -h, --help          Show this help\n";
  std::cout << "  --version           Print version and exit\n";
}

void print_tick(const stratai::TickResult& r) {
  std::cout << "Tick " << r.tick << ": " << r.selected_action_id << " (score "
            << stratai::format_fixed(r.selected_score) << ")";
  if (r.fallback) std::cout << " [fallback]";
  if (r.anomaly) std::cout << " [anomaly]";
  std::cout << "\n";
  std::cout << "  doctrine:     " << r.doctrine_id << "\n";
  std::cout << "  fleet policy: " << r.fleet_policy_id << "\n";
  std::cout << "  projection:   " << r.projection_months << " months\n";

  std::cout << "  weights: economy=" << stratai::format_fixed(r.weights.economy)
            << " expansion=" << stratai::format_fixed(r.weights.expansion)
            << " threat=" << stratai::format_fixed(r.weights.threat)
            << " tech=" << stratai::format_fixed(r.weights.tech)
            << " exploration=" << stratai::format_fixed(r.weights.exploration)
            << " ascension=" << stratai::format_fixed(r.weights.ascension)
            << (r.meta_pass_through ? " (pass-through)" : "") << "\n";

  std::cout << "  components:\n";
  std::size_t width = 0;
  for (const auto& c : r.score_components) width = std::max(width, c.name.size());
  for (const auto& c : r.score_components) {
    std::cout << "    " << c.name << std::string(width - c.name.size() + 2, ' ')
              << stratai::format_fixed(c.value) << "\n";
  }

  std::cout << "  candidates:\n";
  for (const auto& c : r.candidates) {
    std::cout << "    " << c.id << "\t" << stratai::format_fixed(c.score)
              << (c.feasible ? "" : "\t(infeasible)") << (c.doctrine_aligned ? "\t(doctrine)" : "") << "\n";
  }

  for (const auto& a : r.anomalies) std::cout << "  anomaly: " << a << "\n";
  for (const auto& i : r.input_issues) std::cout << "  input: " << i << "\n";
  for (const auto& w : r.config_warnings) std::cout << "  config: " << w << "\n";
}

} // namespace

int main(int argc, char** argv) {
  try {
    if (has_flag(argc, argv, "--version")) {
      std::cout << STRATAI_VERSION << "\n";
      return 0;
    }
    if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
      print_usage(argv[0]);
      return 0;
    }

    const std::string log_level = get_str_arg(argc, argv, "--log-level", "");
    if (!log_level.empty()) {
      stratai::log::Level lvl{};
      if (!stratai::log::parse_level(log_level, lvl)) {
        std::cerr << "Unknown --log-level: '" << log_level << "'\n\n";
        print_usage(argv[0]);
        return 2;
      }
      stratai::log::set_level(lvl);
    }

    const std::string observation_path = get_str_arg(argc, argv, "--observation", "");
    const std::string save_text_path = get_str_arg(argc, argv, "--save-text", "");
    const std::string config_path = get_str_arg(argc, argv, "--config", "");
    const std::string export_json_path = get_str_arg(argc, argv, "--export-history-json", "");
    const std::string export_csv_path = get_str_arg(argc, argv, "--export-history-csv", "");
    const int ticks = get_int_arg(argc, argv, "--ticks", 1);

    const bool quiet = has_flag(argc, argv, "--quiet");
    const bool as_json = has_flag(argc, argv, "--json");
    const bool print_digest = has_flag(argc, argv, "--digest");

    if (observation_path.empty() == save_text_path.empty()) {
      std::cerr << "Exactly one of --observation or --save-text is required\n\n";
      print_usage(argv[0]);
      return 2;
    }
    if (ticks < 1) {
      std::cerr << "--ticks must be >= 1\n";
      return 2;
    }

    stratai::EvaluatorConfig cfg;
    if (!config_path.empty()) {
      auto loaded = stratai::load_evaluator_config_from_file(config_path);
      for (const auto& w : loaded.warnings) stratai::log::warn("config: " + w);
      cfg = loaded.config;
    }

    stratai::ObservationParseResult parsed;
    if (!observation_path.empty()) {
      parsed = stratai::parse_observation_text(stratai::read_text_file(observation_path));
    } else {
      const auto scan = stratai::scan_save_text(stratai::read_text_file(save_text_path));
      parsed = stratai::parse_observation(stratai::save_scan_to_observation_json(scan));
    }
    for (const auto& issue : parsed.issues) stratai::log::warn("observation: " + issue);

    if (has_flag(argc, argv, "--dump-observation")) {
      std::cout << stratai::json::stringify(stratai::observation_to_json(parsed.observation), 2) << "\n";
      return 0;
    }

    if (!quiet && !as_json) {
      std::cout << "Difficulty: "
                << stratai::difficulty_level_to_string(cfg.difficulty_profile.level)
                << ", aggression " << stratai::format_fixed(cfg.aggression_slider, 2) << "\n";
      const auto flags = stratai::enabled_compatibility_flags(cfg.compatibility);
      for (const auto& f : flags) std::cout << "Compatibility: " << f << "\n";
    }

    stratai::EvaluationSession session(cfg);
    stratai::TickResult last;
    for (int i = 0; i < ticks; ++i) {
      last = stratai::evaluate_tick(session, parsed.observation, cfg);
      if (!quiet && !as_json) print_tick(last);
    }

    if (as_json) {
      std::cout << stratai::json::stringify(stratai::tick_result_to_json(last), 2) << "\n";
    }
    if (print_digest) {
      std::cout << stratai::digest64_to_hex(stratai::digest_tick_result64(last)) << "\n";
    }

    const auto history = session.history().entries();
    if (!export_json_path.empty()) {
      try {
        stratai::write_text_file(export_json_path, stratai::diagnostics_to_json(history));
        if (!quiet) std::cerr << "Wrote history JSON to " << export_json_path << "\n";
      } catch (const std::exception& e) {
        std::cerr << "Failed to export history JSON: " << e.what() << "\n";
        return 1;
      }
    }
    if (!export_csv_path.empty()) {
      try {
        stratai::write_text_file(export_csv_path, stratai::diagnostics_to_csv(history));
        if (!quiet) std::cerr << "Wrote history CSV to " << export_csv_path << "\n";
      } catch (const std::exception& e) {
        std::cerr << "Failed to export history CSV: " << e.what() << "\n";
        return 1;
      }
    }

    return 0;
  } catch (const std::exception& e) {
    stratai::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
