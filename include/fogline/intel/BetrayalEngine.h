#pragma once

#include "fogline/intel/HeartlandTracker.h"
#include "fogline/intel/IntelligenceMap.h"
#include "fogline/intel/TrustLedger.h"
#include "fogline/intel/World.h"

#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace fogline::intel {

// -----------------------------------------------------------------------------
// Betrayal engine
// -----------------------------------------------------------------------------
//
// Append-only record of betrayals plus the expected-value estimate decision
// logic uses before committing one. Committing a betrayal fans out into the
// trust ledger (victim, beneficiary, witnesses), the heartland tracker
// (heartland reveals) and the betrayer's fame.

enum class BetrayalType : core::u8 {
  IntelLeak = 0,
  HeartlandReveal = 1,
  AllianceBackstab = 2,
  FalseIntel = 3,
  ResourceTheft = 4,
};

std::string_view toString(BetrayalType t);
bool parseBetrayalType(std::string_view text, BetrayalType& out);

struct BetrayalTypeEconomics {
  double beneficiaryTrustGain{0.0};
  double victimTrustLoss{0.0};
  double witnessPenalty{0.0};
};

const BetrayalTypeEconomics& betrayalTypeEconomics(BetrayalType t);

struct BetrayalEconomics {
  double potentialGain{0.0};
  double potentialLoss{0.0};
  double netValue{0.0};
};

struct BetrayalEvent {
  core::u64 id{0};
  FactionId betrayer{};
  CharacterId betrayerCharacter{};
  FactionId victim{};
  std::optional<FactionId> beneficiary{};
  BetrayalType type{BetrayalType::IntelLeak};
  Tick tick{0};
  std::optional<RegionId> region{};
  std::optional<RegionIntel> intelShared{};
  std::vector<FactionId> witnesses{};
};

struct BetrayalRequest {
  FactionId betrayer{};
  CharacterId betrayerCharacter{};
  FactionId victim{};
  std::optional<FactionId> beneficiary{};
  BetrayalType type{BetrayalType::IntelLeak};
  Tick tick{0};
  std::optional<RegionId> region{};
  std::optional<RegionIntel> intelShared{};
  std::vector<FactionId> witnesses{};
};

struct BetrayalParams {
  double reputationPerBetrayal{0.2};
  double fameGainWeight{0.001};
  double backstabFameDelta{-5.0};
  double notorietyFameDelta{2.0};
};

class BetrayalEngine {
public:
  explicit BetrayalEngine(BetrayalParams params = {}) : params_(params) {}

  const BetrayalParams& params() const { return params_; }
  void setParams(const BetrayalParams& p) { params_ = p; }

  // Side-effect free estimate of whether a betrayal pays.
  BetrayalEconomics calculateBetrayalEconomics(const TrustLedger& trust,
                                               const CharacterInfo& actor,
                                               FactionId victim,
                                               BetrayalType type) const;

  // `heartland` may be null; heartland reveals then only affect trust.
  BetrayalEvent commitBetrayal(const WorldAccess& world,
                               TrustLedger& trust,
                               HeartlandTracker* heartland,
                               const BetrayalRequest& req);

  // Factions of living characters in `region` other than the betrayer, ascending.
  std::vector<FactionId> identifyWitnesses(const WorldAccess& world, RegionId region, CharacterId betrayerCharacter) const;

  // 0 = clean, 1 = notorious.
  double getBetrayalReputation(FactionId faction) const;

  std::vector<BetrayalEvent> getBetrayalsByFamily(FactionId faction) const;
  std::vector<BetrayalEvent> getBetrayalsAgainstFamily(FactionId faction) const;

  const std::vector<BetrayalEvent>& events() const { return events_; }

  void clear();

private:
  BetrayalParams params_{};
  core::u64 nextEventId_{1};
  std::vector<BetrayalEvent> events_;
  std::unordered_map<FactionId, double> reputation_;
};

} // namespace fogline::intel
