#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "stratai/core/config.h"
#include "stratai/core/observation.h"
#include "stratai/core/score_components.h"

namespace stratai {

enum class PolicyKind : std::uint8_t {
  // Strategic posture (economic, militarist, ...).
  Doctrine = 0,
  // Fleet-composition policy (what kind of hulls to favor).
  FleetComposition = 1,
};

const char* policy_kind_label(PolicyKind k);

using FeasibilityFn = std::function<bool(const Observation&, const EvaluatorConfig&)>;

// Scores a recommendation from the weighted component view.
using WeightedScoreFn = std::function<double(const ScoreComponents&)>;

// One selectable recommendation. The position of an option in its list is its
// priority: on equal scores the earlier option wins.
struct PolicyOption {
  std::string id;
  PolicyKind kind{PolicyKind::Doctrine};
  FeasibilityFn feasible;
  WeightedScoreFn score;
};

struct PolicyRecommendation {
  std::string id;
  PolicyKind kind{PolicyKind::Doctrine};
  double score{0.0};
  bool feasible{false};
  // Index in the declaring list (lower wins ties).
  int priority{0};
};

// Identifier used when no option of a kind is feasible.
inline constexpr const char* kNoPolicy = "none";

// Doctrine ids.
inline constexpr const char* kDoctrineDefensive = "defensive_posture";
inline constexpr const char* kDoctrineMilitarist = "militarist";
inline constexpr const char* kDoctrineEconomic = "economic_focus";
inline constexpr const char* kDoctrineExpansionist = "expansionist";
inline constexpr const char* kDoctrineTechnologist = "technologist";
inline constexpr const char* kDoctrineGeneticAscendancy = "genetic_ascendancy";
inline constexpr const char* kDoctrineSyntheticVirtuality = "synthetic_virtuality";

// Fleet-composition ids.
inline constexpr const char* kFleetPicketScreen = "picket_screen";
inline constexpr const char* kFleetBalancedLine = "balanced_line";
inline constexpr const char* kFleetArtilleryBattleline = "artillery_battleline";
inline constexpr const char* kFleetBioSwarm = "bio_swarm";

// Alloy stockpile needed before heavier fleet doctrines become feasible.
inline constexpr double kMilitaristMinAlloyDensity = 0.1;
inline constexpr double kBalancedLineMinAlloyDensity = 0.25;
inline constexpr double kArtilleryMinAlloyDensity = 0.5;

// Expansion is pointless once every habitable slot is used.
inline constexpr double kMaxPlanetCapacityForExpansion = 0.95;

const std::vector<PolicyOption>& default_doctrine_options();
const std::vector<PolicyOption>& default_fleet_policy_options();

// Scores every option, infeasible ones included (flagged), then ranks:
// feasible first, higher score first, lower priority index first.
std::vector<PolicyRecommendation> rank_policy_options(const std::vector<PolicyOption>& options,
                                                      const Observation& obs, const EvaluatorConfig& cfg,
                                                      const ScoreComponents& weighted);

struct PolicyAdvice {
  std::vector<PolicyRecommendation> doctrines;
  std::vector<PolicyRecommendation> fleet_policies;

  // Best feasible option of each kind, or kNoPolicy.
  std::string doctrine_id{kNoPolicy};
  std::string fleet_policy_id{kNoPolicy};
};

PolicyAdvice recommend_policies(const Observation& obs, const EvaluatorConfig& cfg, const ScoreComponents& weighted);

PolicyAdvice recommend_policies(const std::vector<PolicyOption>& doctrines,
                                const std::vector<PolicyOption>& fleet_policies, const Observation& obs,
                                const EvaluatorConfig& cfg, const ScoreComponents& weighted);

} // namespace stratai
