#include "stratai/util/digest.h"

#include <cmath>
#include <cstdint>
#include <cstring>
#include <initializer_list>
#include <limits>
#include <sstream>
#include <string>

namespace stratai {
namespace {

constexpr std::uint64_t kFnvOffset = 1469598103934665603ull;
constexpr std::uint64_t kFnvPrime = 1099511628211ull;

// FNV-1a over a little-endian encoding of each field.
struct TickHasher {
  std::uint64_t h{kFnvOffset};

  void byte(std::uint8_t b) {
    h ^= b;
    h *= kFnvPrime;
  }

  void word(std::uint64_t v) {
    for (int shift = 0; shift < 64; shift += 8) byte(static_cast<std::uint8_t>(v >> shift));
  }

  void flag(bool b) { byte(b ? 1 : 0); }

  void text(const std::string& s) {
    word(s.size());
    for (unsigned char c : s) byte(c);
  }

  // Signed zeros hash alike; every NaN hashes as the quiet NaN.
  void number(double v) {
    if (v == 0.0) v = 0.0;
    if (std::isnan(v)) v = std::numeric_limits<double>::quiet_NaN();
    std::uint64_t bits = 0;
    std::memcpy(&bits, &v, sizeof(bits));
    word(bits);
  }

  void components(const ScoreComponents& c) {
    word(c.size());
    for (const auto& e : c) {
      text(e.name);
      number(e.value);
    }
  }

  void weights(const WeightVector& w) {
    for (double v : {w.economy, w.expansion, w.threat, w.tech, w.exploration, w.ascension}) number(v);
  }
};

} // namespace

std::uint64_t digest_tick_result64(const TickResult& r) {
  TickHasher d;
  d.text(r.selected_action_id);
  d.number(r.selected_score);
  d.flag(r.fallback);
  d.flag(r.anomaly);
  d.components(r.score_components);
  d.weights(r.weights);
  d.text(r.doctrine_id);
  d.text(r.fleet_policy_id);

  d.word(r.candidates.size());
  for (const auto& c : r.candidates) {
    d.text(c.id);
    d.number(c.score);
    d.flag(c.feasible);
  }
  return d.h;
}

std::string digest64_to_hex(std::uint64_t v) {
  std::ostringstream out;
  out << std::hex;
  out.width(16);
  out.fill('0');
  out << v;
  return out.str();
}

} // namespace stratai
