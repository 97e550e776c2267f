#include "stratai/util/save_scan.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <initializer_list>
#include <string>
#include <utility>

#include "stratai/util/strings.h"

namespace stratai {
namespace {

bool is_word_char(char c) {
  const unsigned char u = static_cast<unsigned char>(c);
  return std::isalnum(u) || c == '_';
}

bool is_digit(char c) { return c >= '0' && c <= '9'; }

bool contains_any(const std::string& hay, std::initializer_list<const char*> needles) {
  for (const char* n : needles) {
    if (hay.find(n) != std::string::npos) return true;
  }
  return false;
}

// Sums every `<key> = <number>` where key starts at a word boundary.
// Signed/fractional numbers are only accepted when allow_fraction is set
// (counts are plain non-negative integers).
double sum_assignments(const std::string& text, const std::string& key, bool allow_fraction) {
  double total = 0.0;
  std::size_t pos = 0;
  while ((pos = text.find(key, pos)) != std::string::npos) {
    const std::size_t start = pos;
    pos += key.size();
    if (start > 0 && is_word_char(text[start - 1])) continue;

    std::size_t i = pos;
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
    if (i >= text.size() || text[i] != '=') continue;
    ++i;
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;

    const std::size_t num_start = i;
    if (allow_fraction && i < text.size() && text[i] == '-') ++i;
    const std::size_t int_start = i;
    while (i < text.size() && is_digit(text[i])) ++i;
    if (i == int_start) continue;
    if (allow_fraction && i + 1 < text.size() && text[i] == '.' && is_digit(text[i + 1])) {
      ++i;
      while (i < text.size() && is_digit(text[i])) ++i;
    }

    total += std::strtod(text.substr(num_start, i - num_start).c_str(), nullptr);
    pos = i;
  }
  return total;
}

double ratio(double num, double den) {
  if (den <= 0.0) return 0.0;
  return std::clamp(num / den, 0.0, 1.0);
}

} // namespace

SaveScanResult scan_save_text(const std::string& raw) {
  const std::string text = to_lower(raw);
  SaveScanResult r;

  r.bio_ascension = contains_any(text, {"ap_engineered_evolution", "ap_evolutionary_mastery"});
  r.machine_age_virtuality = contains_any(text, {"virtuality", "machine_age"});
  r.shattered_ring_origin = contains_any(text, {"origin_shattered_ring"});

  r.total_pops = sum_assignments(text, "num_pops", false);
  r.total_planets = sum_assignments(text, "num_planets", false);
  r.total_alloys = sum_assignments(text, "alloys", true);
  r.total_energy = sum_assignments(text, "energy", true);

  r.pop_growth_pressure = ratio(r.total_pops, std::max(1.0, r.total_planets * 40.0));
  const double pop_capacity = (r.total_pops > 0.0) ? r.total_pops / 28.0 : 1.0;
  r.planet_capacity_pressure = ratio(r.total_planets, std::max(1.0, pop_capacity));
  r.alloy_density = ratio(r.total_alloys, std::max(1.0, r.total_energy + r.total_alloys));

  // Ours vs. enemy is not separated by the scan; the enemy aggregate is a
  // fixed markup over ours.
  r.our_total_economy = std::max(1.0, r.total_energy * 0.35 + r.total_alloys * 0.65);
  r.enemy_total_economy = std::max(1.0, r.our_total_economy * 1.15);
  return r;
}

json::Value save_scan_to_observation_json(const SaveScanResult& scan) {
  json::Object o;
  o["bio_ascension"] = scan.bio_ascension;
  o["machine_age_virtuality"] = scan.machine_age_virtuality;
  o["shattered_ring_origin"] = scan.shattered_ring_origin;
  o["pop_growth_pressure"] = scan.pop_growth_pressure;
  o["planet_capacity_pressure"] = scan.planet_capacity_pressure;
  o["alloy_density"] = scan.alloy_density;
  o["our_total_economy"] = scan.our_total_economy;
  o["enemy_total_economy"] = scan.enemy_total_economy;
  return json::object(std::move(o));
}

} // namespace stratai
