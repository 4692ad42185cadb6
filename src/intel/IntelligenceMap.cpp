#include "fogline/intel/IntelligenceMap.h"

#include "fogline/core/Clamp.h"
#include "fogline/core/Log.h"

#include <algorithm>

namespace fogline::intel {

std::string_view toString(IntelSource s) {
  switch (s) {
    case IntelSource::Exploration: return "exploration";
    case IntelSource::Shared: return "shared";
    case IntelSource::Rumor: return "rumor";
  }
  return "unknown";
}

std::string_view toString(MisinformationMode m) {
  switch (m) {
    case MisinformationMode::Overwrite: return "overwrite";
    case MisinformationMode::Blend: return "blend";
  }
  return "unknown";
}

MisinformationMode chooseMisinformationMode(const RegionIntel* existing, const IntelligenceParams& params) {
  if (!existing || existing->reliability < params.misinformationBlendThreshold) {
    return MisinformationMode::Overwrite;
  }
  return MisinformationMode::Blend;
}

FactionIntelMap& IntelligenceMap::getOrCreate(FactionId faction) {
  auto it = maps_.find(faction);
  if (it != maps_.end()) return it->second;

  FactionIntelMap m{};
  m.faction = faction;
  return maps_.emplace(faction, std::move(m)).first->second;
}

const FactionIntelMap* IntelligenceMap::find(FactionId faction) const {
  auto it = maps_.find(faction);
  return (it == maps_.end()) ? nullptr : &it->second;
}

void IntelligenceMap::recordExploration(const WorldAccess& world,
                                        CharacterId characterId,
                                        RegionId regionId,
                                        const RegionSnapshot& snapshot,
                                        Tick tick) {
  const CharacterInfo* explorer = lookupCharacter(world, characterId);
  if (!explorer) return;

  FactionIntelMap& map = getOrCreate(explorer->faction);

  RegionIntel intel{};
  intel.regionId = regionId;
  intel.discoveredAtTick = tick;
  intel.lastUpdatedTick = tick;
  intel.reliability = 1.0;
  intel.source = IntelSource::Exploration;
  intel.sourceCharacterId = characterId;

  for (const auto& r : snapshot.resources) {
    if (r.quantity > 0.0) intel.knownResources.push_back(r.type);
  }

  int pop = 0;
  for (const auto& p : snapshot.populations) {
    if (p.count > 0) intel.knownSpecies.push_back(p.species);
    pop += p.count;
  }
  intel.knownPopEstimate = pop;

  if (snapshot.temperatureC > params_.extremeHeatC) intel.knownThreats.push_back("extreme_heat");
  if (snapshot.temperatureC < params_.extremeColdC) intel.knownThreats.push_back("extreme_cold");
  if (snapshot.pollution > params_.pollutionThreat) intel.knownThreats.push_back("pollution");

  auto prev = map.knownRegions.find(regionId);
  if (prev != map.knownRegions.end()) {
    intel.discoveredAtTick = prev->second.discoveredAtTick;
    prev->second = std::move(intel);
  } else {
    map.knownRegions.emplace(regionId, std::move(intel));
  }
  map.exploredRegionIds.insert(regionId);
}

std::optional<RegionIntel> IntelligenceMap::shareIntel(FactionId from, FactionId to, RegionId regionId, Tick tick) {
  const RegionIntel* src = getRegionIntel(from, regionId);
  if (!src) return std::nullopt;

  RegionIntel shared = *src;
  shared.lastUpdatedTick = tick;
  shared.lastDecayTick.reset();
  shared.reliability = core::clamp01(src->reliability * params_.shareReliabilityFactor);
  shared.source = IntelSource::Shared;

  receiveSharedIntel(to, shared);
  return shared;
}

bool IntelligenceMap::receiveSharedIntel(FactionId to, const RegionIntel& copy) {
  FactionIntelMap& dst = getOrCreate(to);

  auto it = dst.knownRegions.find(copy.regionId);
  if (it != dst.knownRegions.end() && it->second.reliability >= copy.reliability) return false;

  RegionIntel stored = copy;
  stored.reliability = core::clamp01(stored.reliability);
  if (it != dst.knownRegions.end()) {
    it->second = std::move(stored);
  } else {
    dst.knownRegions.emplace(copy.regionId, std::move(stored));
  }
  return true;
}

MisinformationMode IntelligenceMap::plantMisinformation(FactionId target,
                                                        RegionId regionId,
                                                        const MisinformationPayload& payload) {
  FactionIntelMap& map = getOrCreate(target);
  auto it = map.knownRegions.find(regionId);
  RegionIntel* existing = (it != map.knownRegions.end()) ? &it->second : nullptr;

  const MisinformationMode mode = chooseMisinformationMode(existing, params_);

  if (mode == MisinformationMode::Blend) {
    RegionIntel& e = *existing;
    e.reliability = core::clamp01(e.reliability - params_.misinformationBlendPenalty);
    if (payload.knownThreats) {
      for (const auto& t : *payload.knownThreats) {
        if (std::find(e.knownThreats.begin(), e.knownThreats.end(), t) == e.knownThreats.end()) {
          e.knownThreats.push_back(t);
        }
      }
    }
    e.isMisinformation = true;
    if (payload.lastUpdatedTick) e.lastUpdatedTick = *payload.lastUpdatedTick;
    return mode;
  }

  RegionIntel rumor{};
  rumor.regionId = regionId;
  rumor.discoveredAtTick = payload.discoveredAtTick.value_or(existing ? existing->discoveredAtTick : 0);
  rumor.lastUpdatedTick = payload.lastUpdatedTick.value_or(0);
  rumor.reliability = core::clamp01(payload.reliability.value_or(params_.misinformationDefaultReliability));
  if (payload.knownResources) {
    rumor.knownResources = *payload.knownResources;
  } else if (existing) {
    rumor.knownResources = existing->knownResources;
  }
  if (payload.knownSpecies) {
    rumor.knownSpecies = *payload.knownSpecies;
  } else if (existing) {
    rumor.knownSpecies = existing->knownSpecies;
  }
  if (payload.knownThreats) {
    rumor.knownThreats = *payload.knownThreats;
  } else if (existing) {
    rumor.knownThreats = existing->knownThreats;
  }
  rumor.knownPopEstimate = payload.knownPopEstimate.value_or(existing ? existing->knownPopEstimate : 0);
  rumor.source = IntelSource::Rumor;
  rumor.sourceCharacterId = payload.sourceCharacterId;
  rumor.isMisinformation = true;

  if (existing) {
    *existing = std::move(rumor);
  } else {
    map.knownRegions.emplace(regionId, std::move(rumor));
  }
  return mode;
}

void IntelligenceMap::writeIntel(FactionId faction, RegionIntel intel) {
  intel.reliability = core::clamp01(intel.reliability);
  FactionIntelMap& map = getOrCreate(faction);
  const RegionId id = intel.regionId;
  map.knownRegions[id] = std::move(intel);
}

std::size_t IntelligenceMap::decayIntelReliability(FactionIntelMap& map, Tick tick) {
  std::size_t evicted = 0;
  for (auto it = map.knownRegions.begin(); it != map.knownRegions.end();) {
    RegionIntel& intel = it->second;
    const Tick since = intel.lastDecayTick.value_or(intel.lastUpdatedTick);
    const Tick dt = std::max<Tick>(0, tick - since);

    intel.reliability = core::clamp01(intel.reliability - (double)dt * params_.decayPerTick);
    intel.lastDecayTick = tick;

    if (intel.reliability <= 0.0) {
      FOGLINE_LOG_DEBUG("intel: faction " + toString(map.faction) + " forgot region " + toString(it->first));
      it = map.knownRegions.erase(it);
      ++evicted;
    } else {
      ++it;
    }
  }
  return evicted;
}

std::size_t IntelligenceMap::decayAll(Tick tick) {
  std::size_t evicted = 0;
  for (auto& [faction, map] : maps_) {
    evicted += decayIntelReliability(map, tick);
  }
  return evicted;
}

const RegionIntel* IntelligenceMap::getRegionIntel(FactionId faction, RegionId regionId) const {
  const FactionIntelMap* map = find(faction);
  if (!map) return nullptr;
  auto it = map->knownRegions.find(regionId);
  return (it == map->knownRegions.end()) ? nullptr : &it->second;
}

std::vector<RegionId> IntelligenceMap::getKnownRegions(FactionId faction) const {
  std::vector<RegionId> out;
  const FactionIntelMap* map = find(faction);
  if (!map) return out;

  out.reserve(map->knownRegions.size());
  for (const auto& [id, intel] : map->knownRegions) out.push_back(id);
  std::sort(out.begin(), out.end());
  return out;
}

bool IntelligenceMap::hasExplored(FactionId faction, RegionId regionId) const {
  const FactionIntelMap* map = find(faction);
  return map && map->exploredRegionIds.count(regionId) > 0;
}

} // namespace fogline::intel
