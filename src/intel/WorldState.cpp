#include "fogline/intel/WorldState.h"

#include "fogline/core/Log.h"

#include <string>
#include <utility>

namespace fogline::intel {

static bool dueOn(Tick tick, int every) {
  if (every <= 1) return true;
  return (tick % (Tick)every) == 0;
}

bool validateWorldParams(const WorldStateParams& p, std::string* outError) {
  auto fail = [&](const char* msg) {
    if (outError) *outError = msg;
    return false;
  };

  if (p.intel.shareReliabilityFactor < 0.0 || p.intel.shareReliabilityFactor > 1.0) {
    return fail("intel.share_factor must be in [0,1]");
  }
  if (p.intel.decayPerTick < 0.0) return fail("intel.decay_per_tick must be >= 0");
  if (p.trust.decayPerTick < 0.0) return fail("trust.decay_per_tick must be >= 0");
  if (p.heartland.subThresholdShare > p.heartland.heartlandShare) {
    return fail("heartland.sub_share must not exceed heartland.share");
  }
  if (p.espionage.detectionMin > p.espionage.detectionMax) {
    return fail("espionage.detection_min must not exceed espionage.detection_max");
  }
  if (p.espionage.cooldownTicks < 0 || p.espionage.historyRetentionTicks < 0) {
    return fail("espionage tick windows must be >= 0");
  }
  if (p.sharing.partialRedactionGene > p.sharing.fullRedactionGene) {
    return fail("sharing.partial_redaction_gene must not exceed sharing.full_redaction_gene");
  }
  if (p.sharing.fairRatioMin > p.sharing.fairRatioMax) {
    return fail("sharing.fair_ratio_min must not exceed sharing.fair_ratio_max");
  }
  if (p.schedule.intelDecayEvery < 1 || p.schedule.trustDecayEvery < 1 || p.schedule.heartlandEvery < 1) {
    return fail("schedule periods must be >= 1");
  }
  return true;
}

WorldState::WorldState(WorldStateParams params)
    : params_(std::move(params)),
      intel_(params_.intel),
      trust_(params_.trust),
      heartland_(params_.heartland),
      espionage_(params_.espionage),
      betrayal_(params_.betrayal),
      rng_(params_.seed) {}

bool WorldState::claimTick(std::optional<Tick>& last, Tick tick, const char* what) {
  if (last && tick <= *last) {
    FOGLINE_LOG_WARN(std::string("world: ") + what + " already ran for tick " + std::to_string(*last) +
                     ", ignoring tick " + std::to_string(tick));
    return false;
  }
  last = tick;
  return true;
}

bool WorldState::decayAll(Tick tick, std::size_t* outEvicted) {
  if (!claimTick(lastIntelDecay_, tick, "intel decay")) return false;
  const std::size_t evicted = intel_.decayAll(tick);
  if (outEvicted) *outEvicted = evicted;
  return true;
}

bool WorldState::tickTrustDecay(Tick tick) {
  if (!claimTick(lastTrustDecay_, tick, "trust decay")) return false;
  trust_.tickTrustDecay(tick);
  return true;
}

bool WorldState::recalculateAll(const WorldAccess& world, Tick tick) {
  if (!claimTick(lastHeartland_, tick, "heartland recalculation")) return false;
  heartland_.recalculateAll(world, tick);
  return true;
}

bool WorldState::tickMissions(const WorldAccess& world, Tick tick, std::vector<EspionageResult>* outResults) {
  if (!claimTick(lastMissions_, tick, "mission tick")) return false;
  auto results = espionage_.tickMissions(espionageDeps(world), tick);
  if (outResults) *outResults = std::move(results);
  return true;
}

TickReport WorldState::advance(const WorldAccess& world, Tick tick) {
  TickReport report{};
  report.tick = tick;

  const TickSchedule& s = params_.schedule;
  if (dueOn(tick, s.intelDecayEvery)) report.intelDecayed = decayAll(tick, &report.intelEvicted);
  if (dueOn(tick, s.trustDecayEvery)) report.trustDecayed = tickTrustDecay(tick);
  if (dueOn(tick, s.heartlandEvery)) report.heartlandRecalculated = recalculateAll(world, tick);
  tickMissions(world, tick, &report.missionResults);

  return report;
}

void WorldState::reset(core::u64 seed) {
  intel_.clear();
  trust_.clear();
  heartland_.clear();
  espionage_.clear();
  betrayal_.clear();
  rng_.reseed(seed);
  params_.seed = seed;
  lastIntelDecay_.reset();
  lastTrustDecay_.reset();
  lastHeartland_.reset();
  lastMissions_.reset();
}

} // namespace fogline::intel
