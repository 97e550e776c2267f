#include "stratai/core/fleet_policy.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include "stratai/core/scoring.h"

namespace stratai {
namespace {

std::vector<PolicyOption> make_doctrines() {
  std::vector<PolicyOption> v;
  v.push_back({kDoctrineDefensive, PolicyKind::Doctrine, always_feasible, [](const ScoreComponents& w) {
                 return 0.8 * w.get(kThreatPressure) + 0.2 * negative_part(w.get(kProjectedEconomyGap));
               }});
  v.push_back({kDoctrineMilitarist, PolicyKind::Doctrine,
               [](const Observation& o, const EvaluatorConfig&) {
                 return o.alloy_density >= kMilitaristMinAlloyDensity;
               },
               [](const ScoreComponents& w) {
                 return 0.5 * w.get(kThreatPressure) + 0.6 * w.get(kMilitaryReadiness) +
                        0.2 * positive_part(w.get(kEconomicLead));
               }});
  v.push_back({kDoctrineEconomic, PolicyKind::Doctrine, always_feasible, [](const ScoreComponents& w) {
                 return 0.7 * w.get(kEconomicCatchUp) + 0.3 * w.get(kExpansionNeed) +
                        0.2 * negative_part(w.get(kProjectedEconomyGap));
               }});
  v.push_back({kDoctrineExpansionist, PolicyKind::Doctrine,
               [](const Observation& o, const EvaluatorConfig&) {
                 return o.planet_capacity_pressure < kMaxPlanetCapacityForExpansion;
               },
               [](const ScoreComponents& w) {
                 return 0.8 * w.get(kExpansionNeed) + 0.2 * w.get(kExplorationDrive);
               }});
  v.push_back({kDoctrineTechnologist, PolicyKind::Doctrine, always_feasible, [](const ScoreComponents& w) {
                 return 0.8 * w.get(kTechOpportunity) + 0.2 * positive_part(w.get(kEconomicLead));
               }});
  v.push_back({kDoctrineGeneticAscendancy, PolicyKind::Doctrine,
               [](const Observation& o, const EvaluatorConfig&) { return o.bio_ascension; },
               [](const ScoreComponents& w) {
                 return 0.6 * w.get(kAscensionSynergy) + 0.4 * w.get(kTechOpportunity);
               }});
  v.push_back({kDoctrineSyntheticVirtuality, PolicyKind::Doctrine,
               [](const Observation& o, const EvaluatorConfig&) { return o.machine_age_virtuality; },
               [](const ScoreComponents& w) {
                 return 0.6 * w.get(kAscensionSynergy) + 0.4 * w.get(kTechOpportunity) +
                        0.1 * w.get(kMilitaryReadiness);
               }});
  return v;
}

std::vector<PolicyOption> make_fleet_policies() {
  std::vector<PolicyOption> v;
  v.push_back({kFleetPicketScreen, PolicyKind::FleetComposition, always_feasible, [](const ScoreComponents& w) {
                 return 0.4 * w.get(kThreatPressure) + 0.4 * w.get(kEconomicCatchUp) +
                        0.2 * w.get(kExplorationDrive);
               }});
  v.push_back({kFleetBalancedLine, PolicyKind::FleetComposition,
               [](const Observation& o, const EvaluatorConfig&) {
                 return o.alloy_density >= kBalancedLineMinAlloyDensity;
               },
               [](const ScoreComponents& w) {
                 return 0.5 * w.get(kThreatPressure) + 0.5 * w.get(kMilitaryReadiness);
               }});
  v.push_back({kFleetArtilleryBattleline, PolicyKind::FleetComposition,
               [](const Observation& o, const EvaluatorConfig&) {
                 return o.alloy_density >= kArtilleryMinAlloyDensity;
               },
               [](const ScoreComponents& w) {
                 return 0.3 * w.get(kThreatPressure) + 0.7 * w.get(kMilitaryReadiness) +
                        0.2 * positive_part(w.get(kEconomicLead));
               }});
  v.push_back({kFleetBioSwarm, PolicyKind::FleetComposition,
               [](const Observation& o, const EvaluatorConfig&) { return o.bio_ascension; },
               [](const ScoreComponents& w) {
                 return 0.4 * w.get(kThreatPressure) + 0.3 * w.get(kAscensionSynergy) +
                        0.3 * w.get(kMilitaryReadiness);
               }});
  return v;
}

std::string best_feasible_id(const std::vector<PolicyRecommendation>& ranked) {
  if (!ranked.empty() && ranked.front().feasible) return ranked.front().id;
  return kNoPolicy;
}

} // namespace

const char* policy_kind_label(PolicyKind k) {
  switch (k) {
    case PolicyKind::Doctrine: return "doctrine";
    case PolicyKind::FleetComposition: return "fleet_composition";
  }
  return "doctrine";
}

const std::vector<PolicyOption>& default_doctrine_options() {
  static const std::vector<PolicyOption> kOptions = make_doctrines();
  return kOptions;
}

const std::vector<PolicyOption>& default_fleet_policy_options() {
  static const std::vector<PolicyOption> kOptions = make_fleet_policies();
  return kOptions;
}

std::vector<PolicyRecommendation> rank_policy_options(const std::vector<PolicyOption>& options,
                                                      const Observation& obs, const EvaluatorConfig& cfg,
                                                      const ScoreComponents& weighted) {
  std::vector<PolicyRecommendation> out;
  out.reserve(options.size());
  for (std::size_t i = 0; i < options.size(); ++i) {
    const PolicyOption& opt = options[i];
    PolicyRecommendation r;
    r.id = opt.id;
    r.kind = opt.kind;
    r.priority = static_cast<int>(i);
    r.feasible = !opt.feasible || opt.feasible(obs, cfg);
    const double s = opt.score ? opt.score(weighted) : 0.0;
    r.score = std::isfinite(s) ? s : 0.0;
    out.push_back(std::move(r));
  }

  std::sort(out.begin(), out.end(), [](const PolicyRecommendation& a, const PolicyRecommendation& b) {
    if (a.feasible != b.feasible) return a.feasible;
    if (a.score != b.score) return a.score > b.score;
    return a.priority < b.priority;
  });
  return out;
}

PolicyAdvice recommend_policies(const std::vector<PolicyOption>& doctrines,
                                const std::vector<PolicyOption>& fleet_policies, const Observation& obs,
                                const EvaluatorConfig& cfg, const ScoreComponents& weighted) {
  PolicyAdvice out;
  out.doctrines = rank_policy_options(doctrines, obs, cfg, weighted);
  out.fleet_policies = rank_policy_options(fleet_policies, obs, cfg, weighted);
  out.doctrine_id = best_feasible_id(out.doctrines);
  out.fleet_policy_id = best_feasible_id(out.fleet_policies);
  return out;
}

PolicyAdvice recommend_policies(const Observation& obs, const EvaluatorConfig& cfg, const ScoreComponents& weighted) {
  return recommend_policies(default_doctrine_options(), default_fleet_policy_options(), obs, cfg, weighted);
}

} // namespace stratai
