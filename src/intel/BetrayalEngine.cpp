#include "fogline/intel/BetrayalEngine.h"

#include "fogline/core/Log.h"

#include <algorithm>
#include <cmath>
#include <string>

namespace fogline::intel {

namespace {

struct BetrayalTypeEntry {
  BetrayalType type;
  std::string_view name;
  BetrayalTypeEconomics economics;
};

constexpr BetrayalTypeEntry kBetrayalTypes[] = {
    {BetrayalType::IntelLeak, "intel_leak", {0.3, -0.5, -0.2}},
    {BetrayalType::HeartlandReveal, "heartland_reveal", {0.5, -0.8, -0.3}},
    {BetrayalType::AllianceBackstab, "alliance_backstab", {0.0, -1.0, -0.4}},
    {BetrayalType::FalseIntel, "false_intel", {0.0, -0.6, 0.0}},
    {BetrayalType::ResourceTheft, "resource_theft", {0.0, -0.4, -0.1}},
};

const BetrayalTypeEntry& entryFor(BetrayalType t) {
  for (const auto& e : kBetrayalTypes) {
    if (e.type == t) return e;
  }
  return kBetrayalTypes[0];
}

} // namespace

std::string_view toString(BetrayalType t) { return entryFor(t).name; }

bool parseBetrayalType(std::string_view text, BetrayalType& out) {
  for (const auto& e : kBetrayalTypes) {
    if (e.name == text) {
      out = e.type;
      return true;
    }
  }
  return false;
}

const BetrayalTypeEconomics& betrayalTypeEconomics(BetrayalType t) { return entryFor(t).economics; }

BetrayalEconomics BetrayalEngine::calculateBetrayalEconomics(const TrustLedger& trust,
                                                             const CharacterInfo& actor,
                                                             FactionId victim,
                                                             BetrayalType type) const {
  const BetrayalTypeEconomics& econ = betrayalTypeEconomics(type);
  const double currentTrust = trust.getTrust(victim, actor.faction);

  BetrayalEconomics out{};
  out.potentialGain = econ.beneficiaryTrustGain + actor.fame * params_.fameGainWeight;
  out.potentialLoss = std::abs(econ.victimTrustLoss) + currentTrust;
  out.netValue = out.potentialGain - out.potentialLoss;
  return out;
}

std::vector<FactionId> BetrayalEngine::identifyWitnesses(const WorldAccess& world,
                                                         RegionId region,
                                                         CharacterId betrayerCharacter) const {
  std::vector<FactionId> out;
  for (const CharacterInfo* c : lookupCharactersInRegion(world, region)) {
    if (!c || !c->alive || c->id == betrayerCharacter) continue;
    out.push_back(c->faction);
  }
  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return out;
}

BetrayalEvent BetrayalEngine::commitBetrayal(const WorldAccess& world,
                                             TrustLedger& trust,
                                             HeartlandTracker* heartland,
                                             const BetrayalRequest& req) {
  BetrayalEvent ev{};
  ev.id = nextEventId_++;
  ev.betrayer = req.betrayer;
  ev.betrayerCharacter = req.betrayerCharacter;
  ev.victim = req.victim;
  ev.beneficiary = req.beneficiary;
  ev.type = req.type;
  ev.tick = req.tick;
  ev.region = req.region;
  ev.intelShared = req.intelShared;

  ev.witnesses = req.witnesses;
  if (req.region) {
    const auto seen = identifyWitnesses(world, *req.region, req.betrayerCharacter);
    ev.witnesses.insert(ev.witnesses.end(), seen.begin(), seen.end());
  }
  std::sort(ev.witnesses.begin(), ev.witnesses.end());
  ev.witnesses.erase(std::unique(ev.witnesses.begin(), ev.witnesses.end()), ev.witnesses.end());

  const BetrayalTypeEconomics& econ = betrayalTypeEconomics(req.type);

  trust.recordBetrayal(ev.betrayer, ev.victim, ev.tick);

  if (ev.beneficiary && econ.beneficiaryTrustGain > 0.0) {
    trust.recordCooperation(ev.betrayer, *ev.beneficiary, ev.tick);
  }

  if (!ev.witnesses.empty()) {
    trust.spreadBetrayalReputation(ev.betrayer, ev.witnesses, ev.tick);
  }

  if (ev.type == BetrayalType::HeartlandReveal && ev.beneficiary && heartland) {
    heartland->recordHeartlandDiscovery(*ev.beneficiary, ev.victim);
  }

  if (lookupCharacter(world, ev.betrayerCharacter)) {
    const double fameDelta =
        (ev.type == BetrayalType::AllianceBackstab) ? params_.backstabFameDelta : params_.notorietyFameDelta;
    applyFame(world, ev.betrayerCharacter, fameDelta);
  }

  double& rep = reputation_[ev.betrayer];
  rep += params_.reputationPerBetrayal;

  FOGLINE_LOG_INFO("betrayal: " + toString(ev.betrayer) + " committed " + std::string(toString(ev.type)) +
                   " against " + toString(ev.victim) + " (" + std::to_string(ev.witnesses.size()) + " witnesses)");

  events_.push_back(ev);
  return ev;
}

double BetrayalEngine::getBetrayalReputation(FactionId faction) const {
  auto it = reputation_.find(faction);
  if (it == reputation_.end()) return 0.0;
  return std::min(1.0, it->second);
}

std::vector<BetrayalEvent> BetrayalEngine::getBetrayalsByFamily(FactionId faction) const {
  std::vector<BetrayalEvent> out;
  for (const auto& e : events_) {
    if (e.betrayer == faction) out.push_back(e);
  }
  return out;
}

std::vector<BetrayalEvent> BetrayalEngine::getBetrayalsAgainstFamily(FactionId faction) const {
  std::vector<BetrayalEvent> out;
  for (const auto& e : events_) {
    if (e.victim == faction) out.push_back(e);
  }
  return out;
}

void BetrayalEngine::clear() {
  events_.clear();
  reputation_.clear();
  nextEventId_ = 1;
}

} // namespace fogline::intel
