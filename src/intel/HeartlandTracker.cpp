#include "fogline/intel/HeartlandTracker.h"

#include "fogline/core/Clamp.h"

#include <algorithm>

namespace fogline::intel {

const HeartlandProfile* HeartlandTracker::getProfile(FactionId faction) const {
  auto it = profiles_.find(faction);
  return (it == profiles_.end()) ? nullptr : &it->second;
}

void HeartlandTracker::recalculateAll(const WorldAccess& world, Tick tick) {
  // Census: faction -> region -> living members.
  std::map<FactionId, std::map<RegionId, int>> census;
  for (const CharacterInfo* c : lookupLivingCharacters(world)) {
    if (!c || !c->alive) continue;
    census[c->faction][c->region] += 1;
  }

  for (auto& [faction, profile] : profiles_) {
    if (census.count(faction)) continue;
    profile.concentration.clear();
    profile.heartlandRegionId.reset();
    profile.heartlandStrength = 0.0;
    profile.lastRecalculatedTick = tick;
  }

  for (const auto& [faction, regions] : census) {
    int total = 0;
    for (const auto& [region, n] : regions) total += n;
    if (total <= 0) continue;

    HeartlandProfile& p = profiles_[faction];
    p.faction = faction;
    p.concentration.clear();

    // Ascending region order; strict '>' keeps the lowest id on ties.
    RegionId best{};
    double bestShare = 0.0;
    for (const auto& [region, n] : regions) {
      const double share = (double)n / (double)total;
      p.concentration[region] = share;
      if (share > bestShare) {
        bestShare = share;
        best = region;
      }
    }

    if (bestShare >= params_.heartlandShare) {
      p.heartlandRegionId = best;
      p.heartlandStrength = core::clamp01(bestShare);
    } else if (bestShare >= params_.subThresholdShare) {
      p.heartlandRegionId.reset();
      p.heartlandStrength = core::clamp01(bestShare * params_.subThresholdScale);
    } else {
      p.heartlandRegionId.reset();
      p.heartlandStrength = 0.0;
    }
    p.lastRecalculatedTick = tick;
  }
}

std::vector<FactionId> HeartlandTracker::getFamiliesWithHeartlandIn(RegionId region) const {
  std::vector<FactionId> out;
  for (const auto& [faction, p] : profiles_) {
    if (p.heartlandRegionId && *p.heartlandRegionId == region) out.push_back(faction);
  }
  return out;
}

void HeartlandTracker::recordHeartlandDiscovery(FactionId discoverer, FactionId target) {
  if (discoverer == target) return;
  auto it = profiles_.find(target);
  if (it == profiles_.end()) return;

  HeartlandProfile& p = it->second;
  if (std::find(p.discoveredBy.begin(), p.discoveredBy.end(), discoverer) != p.discoveredBy.end()) return;

  p.discoveredBy.push_back(discoverer);
  const double exposure = core::clamp01(params_.exposurePerDiscoverer * (double)p.discoveredBy.size());
  p.exposureLevel = std::max(p.exposureLevel, exposure);
}

bool HeartlandTracker::knowsHeartland(FactionId observer, FactionId target) const {
  const HeartlandProfile* p = getProfile(target);
  if (!p) return false;
  return std::find(p->discoveredBy.begin(), p->discoveredBy.end(), observer) != p->discoveredBy.end();
}

double HeartlandTracker::getExposureLevel(FactionId faction) const {
  const HeartlandProfile* p = getProfile(faction);
  return p ? p->exposureLevel : 0.0;
}

double HeartlandTracker::getHeartlandDefenseBonus(FactionId faction, RegionId region) const {
  const HeartlandProfile* p = getProfile(faction);
  if (!p || !p->heartlandRegionId || *p->heartlandRegionId != region) return 0.0;
  return params_.defenseBonusScale * p->heartlandStrength;
}

double HeartlandTracker::getHeartlandForagingBonus(FactionId faction, RegionId region) const {
  const HeartlandProfile* p = getProfile(faction);
  if (!p || !p->heartlandRegionId || *p->heartlandRegionId != region) return 0.0;
  return params_.foragingBonusScale * p->heartlandStrength;
}

double HeartlandTracker::getHeartlandHuntBonus(FactionId hunter, RegionId region) const {
  for (const auto& [faction, p] : profiles_) {
    if (faction == hunter) continue;
    if (!p.heartlandRegionId || *p.heartlandRegionId != region) continue;
    if (std::find(p.discoveredBy.begin(), p.discoveredBy.end(), hunter) != p.discoveredBy.end()) {
      return params_.huntBonus;
    }
  }
  return 0.0;
}

} // namespace fogline::intel
