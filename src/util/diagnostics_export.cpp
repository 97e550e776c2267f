#include "stratai/util/diagnostics_export.h"

#include <string>
#include <utility>

#include "stratai/core/scoring.h"
#include "stratai/util/strings.h"

namespace stratai {
namespace {

json::Object components_to_object(const ScoreComponents& c) {
  json::Object obj;
  for (const auto& e : c) obj[e.name] = e.value;
  return obj;
}

json::Array strings_to_array(const std::vector<std::string>& v) {
  json::Array out;
  out.reserve(v.size());
  for (const auto& s : v) out.emplace_back(s);
  return out;
}

json::Object entry_to_object(const DiagnosticsEntry& e) {
  json::Object obj;
  obj["tick"] = static_cast<double>(e.tick);
  obj["selected_action_id"] = e.selected_action_id;
  obj["doctrine_id"] = e.doctrine_id;
  obj["fleet_policy_id"] = e.fleet_policy_id;
  obj["fallback"] = e.fallback;
  obj["anomaly"] = e.anomaly;
  obj["anomalies"] = strings_to_array(e.anomalies);
  obj["input_issues"] = strings_to_array(e.input_issues);
  obj["config_warnings"] = strings_to_array(e.config_warnings);
  obj["score_components"] = components_to_object(e.components);
  return obj;
}

std::string join(const std::vector<std::string>& v, const std::string& sep) {
  std::string out;
  for (std::size_t i = 0; i < v.size(); ++i) {
    if (i) out += sep;
    out += v[i];
  }
  return out;
}

} // namespace

std::string diagnostics_to_csv(const std::vector<DiagnosticsEntry>& entries) {
  const auto& bounds = component_bounds();

  std::string csv = "tick,selected_action_id,doctrine_id,fleet_policy_id,fallback,anomaly";
  for (const auto& b : bounds) {
    csv += ",";
    csv += b.name;
  }
  csv += ",anomalies,input_issues,config_warnings\n";

  csv.reserve(csv.size() + entries.size() * 160);

  for (const auto& e : entries) {
    csv += std::to_string(static_cast<unsigned long long>(e.tick));
    csv += ",";
    csv += csv_escape(e.selected_action_id);
    csv += ",";
    csv += csv_escape(e.doctrine_id);
    csv += ",";
    csv += csv_escape(e.fleet_policy_id);
    csv += ",";
    csv += e.fallback ? "1" : "0";
    csv += ",";
    csv += e.anomaly ? "1" : "0";
    for (const auto& b : bounds) {
      csv += ",";
      const double* v = e.components.find(b.name);
      if (v) csv += format_fixed(*v, 6);
    }
    csv += ",";
    csv += csv_escape(join(e.anomalies, "; "));
    csv += ",";
    csv += csv_escape(join(e.input_issues, "; "));
    csv += ",";
    csv += csv_escape(join(e.config_warnings, "; "));
    csv += "\n";
  }
  return csv;
}

std::string diagnostics_to_json(const std::vector<DiagnosticsEntry>& entries) {
  json::Array out;
  out.reserve(entries.size());
  for (const auto& e : entries) out.emplace_back(entry_to_object(e));

  std::string text = json::stringify(json::array(std::move(out)), 2);
  text += "\n";
  return text;
}

json::Value tick_result_to_json(const TickResult& r) {
  json::Object obj;
  obj["tick"] = static_cast<double>(r.tick);
  obj["selected_action_id"] = r.selected_action_id;
  obj["selected_score"] = r.selected_score;
  obj["score_components"] = components_to_object(r.score_components);

  json::Object w;
  w["economy"] = r.weights.economy;
  w["expansion"] = r.weights.expansion;
  w["threat"] = r.weights.threat;
  w["tech"] = r.weights.tech;
  w["exploration"] = r.weights.exploration;
  w["ascension"] = r.weights.ascension;
  obj["weights"] = std::move(w);
  obj["meta_pass_through"] = r.meta_pass_through;

  json::Array det;
  for (const auto& d : r.detections) {
    json::Object o;
    o["archetype"] = std::string(opponent_archetype_label(d.archetype));
    o["confidence"] = d.confidence;
    o["detected"] = d.detected;
    det.emplace_back(std::move(o));
  }
  obj["detections"] = std::move(det);

  obj["doctrine_id"] = r.doctrine_id;
  obj["fleet_policy_id"] = r.fleet_policy_id;

  json::Array cands;
  for (const auto& c : r.candidates) {
    json::Object o;
    o["id"] = c.id;
    o["base_score"] = c.base_score;
    o["score"] = c.score;
    o["feasible"] = c.feasible;
    o["doctrine_aligned"] = c.doctrine_aligned;
    o["priority"] = static_cast<double>(c.priority);
    cands.emplace_back(std::move(o));
  }
  obj["candidates"] = std::move(cands);

  obj["fallback"] = r.fallback;
  obj["anomaly"] = r.anomaly;
  obj["anomalies"] = strings_to_array(r.anomalies);
  obj["input_issues"] = strings_to_array(r.input_issues);
  obj["config_warnings"] = strings_to_array(r.config_warnings);
  obj["projection_months"] = static_cast<double>(r.projection_months);
  obj["history_size"] = static_cast<double>(r.diagnostics_snapshot.size());
  return json::object(std::move(obj));
}

} // namespace stratai
