#include "fogline/intel/EspionageEngine.h"

#include "fogline/core/Clamp.h"
#include "fogline/core/Log.h"

#include <algorithm>
#include <cmath>

namespace fogline::intel {

namespace {

constexpr std::string_view kActionNames[kEspionageActionTypeCount] = {
    "spy", "infiltrate", "spread_rumors", "counter_spy", "share_intel", "plant_misinformation",
};

bool contains(const std::vector<CharacterId>& v, CharacterId id) {
  return std::find(v.begin(), v.end(), id) != v.end();
}

} // namespace

std::string_view toString(EspionageActionType t) {
  const std::size_t i = (std::size_t)t;
  return (i < kEspionageActionTypeCount) ? kActionNames[i] : std::string_view("unknown");
}

bool parseEspionageActionType(std::string_view text, EspionageActionType& out) {
  for (std::size_t i = 0; i < kEspionageActionTypeCount; ++i) {
    if (kActionNames[i] == text) {
      out = (EspionageActionType)i;
      return true;
    }
  }
  return false;
}

std::string_view toString(IdentificationLevel l) {
  switch (l) {
    case IdentificationLevel::SizeClass: return "size_class";
    case IdentificationLevel::TaxonomyClass: return "taxonomy_class";
    case IdentificationLevel::Species: return "species";
    case IdentificationLevel::Family: return "family";
  }
  return "unknown";
}

std::string_view sizeClassName(double size) {
  if (size < 5.0) return "tiny";
  if (size < 20.0) return "small";
  if (size < 60.0) return "medium";
  return "large";
}

std::string_view toString(MissionState s) {
  switch (s) {
    case MissionState::ActiveUndetected: return "active";
    case MissionState::Failed: return "failed";
    case MissionState::Resolved: return "resolved";
    case MissionState::Abandoned: return "abandoned";
  }
  return "unknown";
}

std::string_view toString(ConsequenceKind k) {
  switch (k) {
    case ConsequenceKind::Detected: return "detected";
    case ConsequenceKind::TrustChange: return "trust_change";
    case ConsequenceKind::HeartlandExposed: return "heartland_exposed";
    case ConsequenceKind::MisinformationPlanted: return "misinformation_planted";
  }
  return "unknown";
}

int EspionageEngine::baseDuration(EspionageActionType type) const {
  const std::size_t i = (std::size_t)type;
  return (i < params_.baseDurations.size()) ? params_.baseDurations[i] : 1;
}

int EspionageEngine::getMissionDuration(const WorldAccess& world,
                                        EspionageActionType type,
                                        const CharacterInfo& spy) const {
  const double speed = lookupSpecies(world, spy.species).speed;
  const double speedFactor =
      core::clamp(params_.referenceSpeed / std::max(speed, 1.0), params_.speedFactorMin, params_.speedFactorMax);
  return std::max(1, (int)std::lround((double)baseDuration(type) * speedFactor));
}

bool EspionageEngine::isOnCooldown(CharacterId id, Tick tick) const {
  auto it = lastCompletion_.find(id);
  if (it == lastCompletion_.end()) return false;
  return tick - it->second < params_.cooldownTicks;
}

bool EspionageEngine::isOnMission(CharacterId id) const {
  for (const auto& m : active_) {
    if (m.completed) continue;
    if (m.agent == id || contains(m.support, id)) return true;
  }
  return false;
}

MissionId EspionageEngine::startMission(const WorldAccess& world, const StartMissionRequest& req) {
  EspionageMission m{};
  m.id = MissionId{nextMissionId_++};
  m.type = req.type;
  m.agent = req.agent;
  m.support = req.support;
  m.targetRegion = req.targetRegion;
  m.targetFaction = req.targetFaction;
  m.startTick = req.tick;

  const CharacterInfo* spy = lookupCharacter(world, req.agent);
  m.durationTicks = spy ? getMissionDuration(world, req.type, *spy) : std::max(1, baseDuration(req.type));

  FOGLINE_LOG_DEBUG("espionage: mission " + std::to_string(m.id.value) + " (" + std::string(toString(m.type)) +
                    ") started, " + std::to_string(m.durationTicks) + " ticks, " +
                    std::to_string(m.support.size()) + " support");

  const MissionId id = m.id;
  active_.push_back(std::move(m));
  return id;
}

std::vector<const CharacterInfo*> EspionageEngine::sentinelsInRegion(const WorldAccess& world,
                                                                     RegionId region,
                                                                     const CharacterInfo& spy) const {
  std::vector<const CharacterInfo*> out;
  for (const CharacterInfo* c : lookupCharactersInRegion(world, region)) {
    if (!c || c->id == spy.id || !c->alive) continue;
    if (c->role != params_.sentinelRole) continue;
    out.push_back(c);
  }
  return out;
}

int EspionageEngine::livingSupportCount(const WorldAccess& world, CharacterId agent) const {
  for (const auto& m : active_) {
    if (m.completed || m.agent != agent) continue;

    int n = 0;
    for (CharacterId id : m.support) {
      if (contains(m.casualties, id)) continue;
      const CharacterInfo* c = lookupCharacter(world, id);
      if (c && c->alive) ++n;
    }
    return n;
  }
  return 0;
}

double EspionageEngine::packStrength(const WorldAccess& world, const EspionageMission& m) const {
  double strength = 0.0;
  if (const CharacterInfo* spy = lookupCharacter(world, m.agent); spy && spy->alive) {
    strength += lookupGene(world, *spy, "strength");
  }
  for (CharacterId id : m.support) {
    if (contains(m.casualties, id)) continue;
    const CharacterInfo* c = lookupCharacter(world, id);
    if (c && c->alive) strength += lookupGene(world, *c, "strength") * params_.supportStrengthWeight;
  }
  return strength;
}

double EspionageEngine::calculateDetectionChance(const WorldAccess& world,
                                                 const CharacterInfo& spy,
                                                 RegionId /*region*/,
                                                 const std::vector<const CharacterInfo*>& sentinels) const {
  const double spySize = lookupSpecies(world, spy.species).size;

  double chance = params_.baseDetectionChance;
  chance *= core::clamp(spySize / params_.sizeReference, params_.sizeModifierMin, params_.sizeModifierMax);

  chance -= (double)livingSupportCount(world, spy.id) * params_.supportCoordinationBonus;

  if (!sentinels.empty()) {
    double contribution = 0.0;
    for (const CharacterInfo* s : sentinels) {
      if (!s) continue;
      const double sentinelSize = lookupSpecies(world, s->species).size;
      const double effectiveness = core::clamp(sentinelSize / std::max(spySize, 1.0),
                                               params_.sentinelEffectMin,
                                               params_.sentinelEffectMax);
      contribution += params_.sentinelWeight * effectiveness;
    }
    // Diminishing returns: a crowd of sentinels is not a wall of eyes.
    chance += params_.sentinelWeight * std::log(1.0 + contribution / params_.sentinelWeight);
  }

  if (const auto role = lookupRole(world, spy.id); role && role->role == params_.spyRole) {
    chance -= role->proficiency * params_.spyProficiencyWeight;
  }

  const double intelligence = lookupGene(world, spy, "intelligence");
  if (intelligence > params_.intelligenceThreshold) {
    chance -= (intelligence - params_.intelligenceThreshold) * params_.intelligenceWeight;
  }

  return core::clamp(chance, params_.detectionMin, params_.detectionMax);
}

DetectionReport EspionageEngine::generateDetectionReport(const WorldAccess& world,
                                                         const CharacterInfo& spy,
                                                         const CharacterInfo* detector) const {
  DetectionReport r{};
  if (!detector) {
    r.level = IdentificationLevel::SizeClass;
    r.description = "An intruder was detected in the region.";
    return r;
  }

  const SpeciesInfo spySpecies = lookupSpecies(world, spy.species);
  const SpeciesInfo detectorSpecies = lookupSpecies(world, detector->species);

  const double ratio = spySpecies.size / std::max(detectorSpecies.size, 1.0);
  const double penalty = std::abs(std::log2(std::max(ratio, 0.01))) * params_.sizeMismatchPenalty;
  r.effectiveObservation = std::max(0.0, lookupObservationLevel(world, detector->id) - penalty);

  if (r.effectiveObservation >= params_.familyObservation) {
    r.level = IdentificationLevel::Family;
    r.description = detector->name + " identified a " + spySpecies.commonName + " from the " +
                    toString(spy.faction) + " faction!";
  } else if (r.effectiveObservation >= params_.speciesObservation) {
    r.level = IdentificationLevel::Species;
    r.description = detector->name + " spotted a " + spySpecies.commonName + " sneaking through the territory.";
  } else if (r.effectiveObservation >= params_.taxonomyObservation) {
    r.level = IdentificationLevel::TaxonomyClass;
    r.description = detector->name + " detected a " + spySpecies.taxonomyClass + " creature moving suspiciously.";
  } else {
    r.level = IdentificationLevel::SizeClass;
    r.description = detector->name + " noticed a " + std::string(sizeClassName(spySpecies.size)) +
                    " creature in the area.";
  }
  return r;
}

std::optional<EspionageResult> EspionageEngine::handleDetection(const EspionageDeps& deps,
                                                                EspionageMission& m,
                                                                const CharacterInfo& spy,
                                                                const CharacterInfo* detector,
                                                                Tick tick) {
  // Pack absorption: the first living, uncaught support member takes the hit.
  for (CharacterId id : m.support) {
    if (contains(m.casualties, id)) continue;
    const CharacterInfo* member = lookupCharacter(deps.world, id);
    if (!member || !member->alive) continue;

    m.casualties.push_back(id);

    const double pack = packStrength(deps.world, m);
    const double detectorStrength =
        detector ? lookupGene(deps.world, *detector, "strength") : params_.defaultDetectorStrength;

    if (pack > detectorStrength * params_.packAdvantage) {
      applyVitals(deps.world, id, -params_.escapeEnergyLoss, 0.0);
    } else {
      applyVitals(deps.world, id, 0.0, -params_.captureHealthLoss);
    }

    FOGLINE_LOG_DEBUG("espionage: mission " + std::to_string(m.id.value) + " support member " + member->name +
                      " caught, agent still hidden");
    return std::nullopt;
  }

  m.detected = true;
  m.detectedBy = detector ? std::optional<CharacterId>(detector->id) : std::nullopt;
  m.completed = true;
  m.state = MissionState::Failed;
  lastCompletion_[m.agent] = tick;

  const DetectionReport report = generateDetectionReport(deps.world, spy, detector);

  EspionageResult result{};
  result.missionId = m.id;
  result.success = false;
  result.narrative = report.description;

  EspionageConsequence detected{};
  detected.kind = ConsequenceKind::Detected;
  detected.spy = spy.id;
  detected.detector = detector ? detector->id : spy.id;
  result.consequences.push_back(detected);

  if (m.targetFaction && report.level >= IdentificationLevel::Species) {
    deps.trust.recordBetrayal(spy.faction, *m.targetFaction, tick, params_.exposureTrustPenalty);

    EspionageConsequence tc{};
    tc.kind = ConsequenceKind::TrustChange;
    tc.faction = *m.targetFaction;
    tc.targetFaction = spy.faction;
    tc.delta = -params_.exposureTrustPenalty;
    result.consequences.push_back(tc);
  }

  FOGLINE_LOG_INFO("espionage: mission " + std::to_string(m.id.value) + " failed, " + spy.name + " exposed (" +
                   std::string(toString(report.level)) + ")");

  m.result = result;
  return result;
}

EspionageResult EspionageEngine::resolveMission(const EspionageDeps& deps, EspionageMission& m, Tick tick) {
  EspionageResult r{};
  r.missionId = m.id;

  const CharacterInfo* spy = lookupCharacter(deps.world, m.agent);
  if (!spy) {
    r.narrative = "Agent lost.";
    return r;
  }

  auto freshIntel = [&](double reliability) {
    RegionIntel intel{};
    intel.regionId = m.targetRegion;
    intel.discoveredAtTick = tick;
    intel.lastUpdatedTick = tick;
    intel.reliability = reliability;
    intel.source = IntelSource::Shared;
    intel.sourceCharacterId = spy->id;
    return intel;
  };

  switch (m.type) {
    case EspionageActionType::Spy: {
      RegionIntel intel = freshIntel(params_.spyReliability);
      deps.intel.writeIntel(spy->faction, intel);
      r.success = true;
      r.intelGained = std::move(intel);
      r.narrative = spy->name + " successfully gathered intelligence on the target region.";
      return r;
    }

    case EspionageActionType::Infiltrate: {
      bool exposedAny = false;
      for (FactionId owner : deps.heartland.getFamiliesWithHeartlandIn(m.targetRegion)) {
        if (owner == spy->faction) continue;
        deps.heartland.recordHeartlandDiscovery(spy->faction, owner);
        exposedAny = true;

        EspionageConsequence c{};
        c.kind = ConsequenceKind::HeartlandExposed;
        c.faction = owner;
        c.targetFaction = spy->faction;
        c.region = m.targetRegion;
        r.consequences.push_back(c);

        FOGLINE_LOG_INFO("espionage: heartland of " + toString(owner) + " exposed to " + toString(spy->faction));
      }

      RegionIntel intel = freshIntel(params_.infiltrateReliability);
      deps.intel.writeIntel(spy->faction, intel);
      r.success = true;
      r.intelGained = std::move(intel);
      r.narrative = exposedAny
                        ? spy->name + " infiltrated deep and discovered a faction's heartland territory!"
                        : spy->name + " completed an infiltration mission, gathering detailed intelligence.";
      return r;
    }

    case EspionageActionType::SpreadRumors: {
      if (m.targetFaction) {
        MisinformationPayload rumor{};
        rumor.lastUpdatedTick = tick;
        rumor.knownThreats = std::vector<std::string>{"massive_predator_presence", "resource_depleted"};
        rumor.knownPopEstimate = params_.rumorPopulationEstimate;
        rumor.reliability = params_.rumorReliability;
        deps.intel.plantMisinformation(*m.targetFaction, m.targetRegion, rumor);

        EspionageConsequence c{};
        c.kind = ConsequenceKind::MisinformationPlanted;
        c.targetFaction = *m.targetFaction;
        c.region = m.targetRegion;
        r.consequences.push_back(c);
      }
      r.success = true;
      r.narrative = spy->name + " successfully spread false information about the region.";
      return r;
    }

    case EspionageActionType::CounterSpy:
    case EspionageActionType::ShareIntel:
    case EspionageActionType::PlantMisinformation:
      break;
  }

  r.success = true;
  r.narrative = "Mission of type '" + std::string(toString(m.type)) + "' completed.";
  return r;
}

std::vector<EspionageResult> EspionageEngine::tickMissions(const EspionageDeps& deps, Tick tick) {
  std::vector<EspionageResult> results;

  for (auto& m : active_) {
    if (m.completed) continue;

    if (!m.detected) {
      const CharacterInfo* spy = lookupCharacter(deps.world, m.agent);
      if (!spy || !spy->alive) {
        m.completed = true;
        m.state = MissionState::Abandoned;
        lastCompletion_[m.agent] = tick;
        continue;
      }

      const auto sentinels = sentinelsInRegion(deps.world, m.targetRegion, *spy);
      const double chance = calculateDetectionChance(deps.world, *spy, m.targetRegion, sentinels);

      if (deps.rng.chance(chance)) {
        const CharacterInfo* detector = sentinels.empty() ? nullptr : sentinels.front();
        if (auto failed = handleDetection(deps, m, *spy, detector, tick)) {
          results.push_back(std::move(*failed));
        }
        continue;
      }
    }

    if (tick - m.startTick >= (Tick)m.durationTicks) {
      EspionageResult r = resolveMission(deps, m, tick);
      m.completed = true;
      m.state = MissionState::Resolved;
      m.result = r;
      lastCompletion_[m.agent] = tick;
      for (CharacterId id : m.support) lastCompletion_[id] = tick;
      results.push_back(std::move(r));
    }
  }

  archiveCompleted(tick);
  return results;
}

std::optional<DetectionAttempt> EspionageEngine::attemptDetection(const EspionageDeps& deps,
                                                                  const CharacterInfo& sentinel,
                                                                  RegionId region,
                                                                  Tick tick) {
  const std::vector<const CharacterInfo*> watcher{&sentinel};

  for (auto& m : active_) {
    if (m.completed || m.detected) continue;
    if (m.targetRegion != region) continue;
    if (m.agent == sentinel.id) continue;

    const CharacterInfo* spy = lookupCharacter(deps.world, m.agent);
    if (!spy || !spy->alive) continue;

    const double chance = calculateDetectionChance(deps.world, *spy, region, watcher);
    if (!deps.rng.chance(chance)) continue;

    DetectionAttempt attempt{};
    attempt.missionId = m.id;
    attempt.result = handleDetection(deps, m, *spy, &sentinel, tick);
    attempt.absorbed = !attempt.result.has_value();

    archiveCompleted(tick);
    return attempt;
  }
  return std::nullopt;
}

void EspionageEngine::archiveCompleted(Tick tick) {
  auto firstDone = std::stable_partition(active_.begin(), active_.end(),
                                         [](const EspionageMission& m) { return !m.completed; });
  for (auto it = firstDone; it != active_.end(); ++it) history_.push_back(std::move(*it));
  active_.erase(firstDone, active_.end());

  const Tick retention = params_.historyRetentionTicks;
  history_.erase(std::remove_if(history_.begin(), history_.end(),
                                [&](const EspionageMission& m) { return tick - m.startTick > retention; }),
                 history_.end());
}

const EspionageMission* EspionageEngine::findMission(MissionId id) const {
  for (const auto& m : active_) {
    if (m.id == id) return &m;
  }
  for (const auto& m : history_) {
    if (m.id == id) return &m;
  }
  return nullptr;
}

void EspionageEngine::clear() {
  active_.clear();
  history_.clear();
  lastCompletion_.clear();
  nextMissionId_ = 1;
}

} // namespace fogline::intel
