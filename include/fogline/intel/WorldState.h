#pragma once

#include "fogline/core/Random.h"
#include "fogline/intel/BetrayalEngine.h"
#include "fogline/intel/EspionageEngine.h"
#include "fogline/intel/HeartlandTracker.h"
#include "fogline/intel/IntelSharing.h"
#include "fogline/intel/IntelligenceMap.h"
#include "fogline/intel/TrustLedger.h"
#include "fogline/intel/World.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace fogline::intel {

// -----------------------------------------------------------------------------
// World state (one simulation's intel core)
// -----------------------------------------------------------------------------
//
// Owns one instance of every registry plus the shared random source. Independent
// simulations (and tests) each hold their own WorldState; nothing is global.
//
// Per-tick entry points are guarded: each runs at most once per tick and never
// for an earlier tick than it last ran. advance() applies them in dependency
// order: intel decay, trust decay, heartland recalculation, then missions.

// Maintenance cadence in ticks (1 = every tick). A pass runs on ticks that are a
// multiple of its period. Intel decay is elapsed-time based, so its cadence only
// changes granularity; trust decay is per call, so its cadence changes the
// trust half-life.
struct TickSchedule {
  int intelDecayEvery{1};
  int trustDecayEvery{1};
  int heartlandEvery{1};
};

struct WorldStateParams {
  core::u64 seed{0};
  IntelligenceParams intel{};
  TrustParams trust{};
  HeartlandParams heartland{};
  EspionageParams espionage{};
  BetrayalParams betrayal{};
  IntelSharingParams sharing{};
  TickSchedule schedule{};
};

// Reject parameter sets the engines cannot run with.
bool validateWorldParams(const WorldStateParams& params, std::string* outError = nullptr);

struct TickReport {
  Tick tick{0};
  bool intelDecayed{false};
  bool trustDecayed{false};
  bool heartlandRecalculated{false};
  std::size_t intelEvicted{0};
  std::vector<EspionageResult> missionResults{};
};

class WorldState {
public:
  explicit WorldState(WorldStateParams params = {});

  const WorldStateParams& params() const { return params_; }

  IntelligenceMap& intel() { return intel_; }
  const IntelligenceMap& intel() const { return intel_; }
  TrustLedger& trust() { return trust_; }
  const TrustLedger& trust() const { return trust_; }
  HeartlandTracker& heartland() { return heartland_; }
  const HeartlandTracker& heartland() const { return heartland_; }
  EspionageEngine& espionage() { return espionage_; }
  const EspionageEngine& espionage() const { return espionage_; }
  BetrayalEngine& betrayal() { return betrayal_; }
  const BetrayalEngine& betrayal() const { return betrayal_; }
  core::SplitMix64& rng() { return rng_; }

  EspionageDeps espionageDeps(const WorldAccess& world) {
    return EspionageDeps{world, intel_, heartland_, trust_, rng_};
  }

  // Guarded per-tick entry points. Return false (and log) when skipped.
  bool decayAll(Tick tick, std::size_t* outEvicted = nullptr);
  bool tickTrustDecay(Tick tick);
  bool recalculateAll(const WorldAccess& world, Tick tick);
  bool tickMissions(const WorldAccess& world, Tick tick, std::vector<EspionageResult>* outResults = nullptr);

  TickReport advance(const WorldAccess& world, Tick tick);

  // Drop all registry contents and reseed; parameters are kept.
  void reset(core::u64 seed);

private:
  bool claimTick(std::optional<Tick>& last, Tick tick, const char* what);

  WorldStateParams params_{};

  IntelligenceMap intel_;
  TrustLedger trust_;
  HeartlandTracker heartland_;
  EspionageEngine espionage_;
  BetrayalEngine betrayal_;
  core::SplitMix64 rng_;

  std::optional<Tick> lastIntelDecay_{};
  std::optional<Tick> lastTrustDecay_{};
  std::optional<Tick> lastHeartland_{};
  std::optional<Tick> lastMissions_{};
};

} // namespace fogline::intel
