#pragma once

#include "fogline/intel/Ids.h"
#include "fogline/intel/World.h"

#include <cstddef>
#include <map>
#include <optional>
#include <vector>

namespace fogline::intel {

// -----------------------------------------------------------------------------
// Heartland tracker
// -----------------------------------------------------------------------------
//
// A faction whose living members cluster in one region has a heartland there:
// it defends and forages better at home, but a rival that learns where home is
// hunts better there too.
//
// Profiles are rebuilt from a census on every recalculation. Exposure and the
// set of discoverers survive recalculation; exposure never decreases.

struct HeartlandParams {
  // Share of living members in one region that flags it as the heartland.
  double heartlandShare{0.7};

  // Below heartlandShare but at/above this, strength = share * subThresholdScale
  // and no region is flagged.
  double subThresholdShare{0.5};
  double subThresholdScale{0.7};

  double defenseBonusScale{0.10};
  double foragingBonusScale{0.05};
  double huntBonus{0.15};

  // Exposure gained per discovering faction.
  double exposurePerDiscoverer{0.2};
};

struct HeartlandProfile {
  FactionId faction{};

  // region -> fraction of living members, from the last census.
  std::map<RegionId, double> concentration{};

  std::optional<RegionId> heartlandRegionId{};
  double heartlandStrength{0.0}; // [0,1]
  double exposureLevel{0.0};     // [0,1], non-decreasing

  // Factions that know where the heartland is, in discovery order.
  std::vector<FactionId> discoveredBy{};

  Tick lastRecalculatedTick{0};
};

class HeartlandTracker {
public:
  explicit HeartlandTracker(HeartlandParams params = {}) : params_(params) {}

  const HeartlandParams& params() const { return params_; }
  void setParams(const HeartlandParams& p) { params_ = p; }

  const HeartlandProfile* getProfile(FactionId faction) const;

  void recalculateAll(const WorldAccess& world, Tick tick);

  // Factions whose current heartland is `region`, ascending.
  std::vector<FactionId> getFamiliesWithHeartlandIn(RegionId region) const;

  void recordHeartlandDiscovery(FactionId discoverer, FactionId target);
  bool knowsHeartland(FactionId observer, FactionId target) const;
  double getExposureLevel(FactionId faction) const;

  double getHeartlandDefenseBonus(FactionId faction, RegionId region) const;
  double getHeartlandForagingBonus(FactionId faction, RegionId region) const;
  double getHeartlandHuntBonus(FactionId hunter, RegionId region) const;

  std::size_t profileCount() const { return profiles_.size(); }
  void clear() { profiles_.clear(); }

private:
  HeartlandParams params_{};
  std::map<FactionId, HeartlandProfile> profiles_;
};

} // namespace fogline::intel
