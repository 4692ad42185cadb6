#pragma once

#include "fogline/core/Random.h"
#include "fogline/intel/HeartlandTracker.h"
#include "fogline/intel/IntelligenceMap.h"
#include "fogline/intel/TrustLedger.h"
#include "fogline/intel/World.h"

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fogline::intel {

// -----------------------------------------------------------------------------
// Espionage engine
// -----------------------------------------------------------------------------
//
// Mission state machine:
//
//   ActiveUndetected --(support member caught)--> ActiveUndetected
//   ActiveUndetected --(lead agent caught)-----> Failed
//   ActiveUndetected --(duration elapsed)------> Resolved
//   ActiveUndetected --(lead agent died)-------> Abandoned
//
// Detection is biology driven. Big agents are conspicuous, sentinels add
// detection with diminishing returns scaled by their size relative to the agent,
// trained spies and clever agents slip through more often. Support members
// absorb detections one at a time before the lead agent can be exposed.
//
// All randomness comes from the SplitMix64 passed in EspionageDeps.

enum class EspionageActionType : core::u8 {
  Spy = 0,
  Infiltrate = 1,
  SpreadRumors = 2,
  CounterSpy = 3,
  ShareIntel = 4,
  PlantMisinformation = 5,
};

inline constexpr std::size_t kEspionageActionTypeCount = 6;

std::string_view toString(EspionageActionType t);
bool parseEspionageActionType(std::string_view text, EspionageActionType& out);

// Ordered from vaguest to most precise.
enum class IdentificationLevel : core::u8 {
  SizeClass = 0,
  TaxonomyClass = 1,
  Species = 2,
  Family = 3,
};

std::string_view toString(IdentificationLevel l);

// tiny < 5 <= small < 20 <= medium < 60 <= large
std::string_view sizeClassName(double size);

enum class MissionState : core::u8 {
  ActiveUndetected = 0,
  Failed = 1,
  Resolved = 2,
  Abandoned = 3,
};

std::string_view toString(MissionState s);

struct DetectionReport {
  bool detected{true};
  IdentificationLevel level{IdentificationLevel::SizeClass};
  double effectiveObservation{0.0};
  std::string description{};
};

enum class ConsequenceKind : core::u8 {
  Detected = 0,
  TrustChange = 1,
  HeartlandExposed = 2,
  MisinformationPlanted = 3,
};

std::string_view toString(ConsequenceKind k);

// Field use by kind:
//   Detected               spy, detector (the spy itself when nobody saw)
//   TrustChange            faction (whose trust moved), targetFaction (toward whom), delta
//   HeartlandExposed       faction (exposed), targetFaction (discoverer)
//   MisinformationPlanted  targetFaction, region
struct EspionageConsequence {
  ConsequenceKind kind{ConsequenceKind::Detected};
  CharacterId spy{};
  CharacterId detector{};
  FactionId faction{};
  FactionId targetFaction{};
  RegionId region{};
  double delta{0.0};
};

struct EspionageResult {
  MissionId missionId{};
  bool success{false};
  std::optional<RegionIntel> intelGained{};
  std::string narrative{};
  std::vector<EspionageConsequence> consequences{};
};

struct EspionageMission {
  MissionId id{};
  EspionageActionType type{EspionageActionType::Spy};
  CharacterId agent{};
  std::vector<CharacterId> support{};
  RegionId targetRegion{};
  std::optional<FactionId> targetFaction{};
  Tick startTick{0};
  int durationTicks{1};

  MissionState state{MissionState::ActiveUndetected};
  bool detected{false};
  std::optional<CharacterId> detectedBy{};
  std::vector<CharacterId> casualties{};
  bool completed{false};
  std::optional<EspionageResult> result{};
};

struct EspionageParams {
  // Base durations for a speed-50 agent, indexed by EspionageActionType.
  std::array<int, kEspionageActionTypeCount> baseDurations{{5, 15, 10, 20, 1, 8}};
  double referenceSpeed{50.0};
  double speedFactorMin{0.4};
  double speedFactorMax{2.5};

  // Detection chance model.
  double baseDetectionChance{0.05};
  double sizeReference{40.0};
  double sizeModifierMin{0.3};
  double sizeModifierMax{2.0};
  double supportCoordinationBonus{0.005};
  double sentinelWeight{0.12};
  double sentinelEffectMin{0.2};
  double sentinelEffectMax{2.0};
  double spyProficiencyWeight{0.15};
  double intelligenceThreshold{50.0};
  double intelligenceWeight{0.001};
  double detectionMin{0.01};
  double detectionMax{0.8};

  // Pack absorption.
  double supportStrengthWeight{0.7};
  double defaultDetectorStrength{30.0};
  double packAdvantage{1.5};
  double escapeEnergyLoss{0.3};
  double captureHealthLoss{0.4};

  // Identification tiers (effective observation thresholds).
  double sizeMismatchPenalty{15.0};
  double familyObservation{80.0};
  double speciesObservation{60.0};
  double taxonomyObservation{30.0};

  // Trust lost by the target toward the agent's faction on identified exposure.
  double exposureTrustPenalty{0.3};

  double spyReliability{0.8};
  double infiltrateReliability{0.9};
  double rumorReliability{0.6};
  int rumorPopulationEstimate{999};

  Tick cooldownTicks{30};
  Tick historyRetentionTicks{500};

  std::string sentinelRole{"sentinel"};
  std::string spyRole{"spy"};
};

// Everything a tick of espionage reads or mutates.
struct EspionageDeps {
  const WorldAccess& world;
  IntelligenceMap& intel;
  HeartlandTracker& heartland;
  TrustLedger& trust;
  core::SplitMix64& rng;
};

struct StartMissionRequest {
  EspionageActionType type{EspionageActionType::Spy};
  CharacterId agent{};
  std::vector<CharacterId> support{};
  RegionId targetRegion{};
  std::optional<FactionId> targetFaction{};
  Tick tick{0};
};

struct DetectionAttempt {
  MissionId missionId{};
  // True when a support member was caught instead of the agent.
  bool absorbed{false};
  // Set when the lead agent was exposed.
  std::optional<EspionageResult> result{};
};

class EspionageEngine {
public:
  explicit EspionageEngine(EspionageParams params = {}) : params_(std::move(params)) {}

  const EspionageParams& params() const { return params_; }
  void setParams(EspionageParams p) { params_ = std::move(p); }

  int baseDuration(EspionageActionType type) const;
  int getMissionDuration(const WorldAccess& world, EspionageActionType type, const CharacterInfo& spy) const;

  bool isOnCooldown(CharacterId id, Tick tick) const;
  bool isOnMission(CharacterId id) const;

  MissionId startMission(const WorldAccess& world, const StartMissionRequest& req);

  // One pass over every open mission. Returns the missions that finished with
  // a result this tick (abandoned missions have none).
  std::vector<EspionageResult> tickMissions(const EspionageDeps& deps, Tick tick);

  // Clamped to [detectionMin, detectionMax].
  double calculateDetectionChance(const WorldAccess& world,
                                  const CharacterInfo& spy,
                                  RegionId region,
                                  const std::vector<const CharacterInfo*>& sentinels) const;

  DetectionReport generateDetectionReport(const WorldAccess& world,
                                          const CharacterInfo& spy,
                                          const CharacterInfo* detector) const;

  // Sentinel-initiated sweep of the region's open missions, oldest first.
  // The first successful roll is handled like a tick detection and returned.
  std::optional<DetectionAttempt> attemptDetection(const EspionageDeps& deps,
                                                   const CharacterInfo& sentinel,
                                                   RegionId region,
                                                   Tick tick);

  const std::vector<EspionageMission>& getActiveMissions() const { return active_; }
  const std::vector<EspionageMission>& getRecentMissions() const { return history_; }
  const EspionageMission* findMission(MissionId id) const;

  void clear();

private:
  std::vector<const CharacterInfo*> sentinelsInRegion(const WorldAccess& world,
                                                      RegionId region,
                                                      const CharacterInfo& spy) const;
  int livingSupportCount(const WorldAccess& world, CharacterId agent) const;
  double packStrength(const WorldAccess& world, const EspionageMission& m) const;

  // Shared by tickMissions and attemptDetection. Returns the failure result when
  // the lead agent is exposed, nullopt when a support member absorbed it.
  std::optional<EspionageResult> handleDetection(const EspionageDeps& deps,
                                                 EspionageMission& m,
                                                 const CharacterInfo& spy,
                                                 const CharacterInfo* detector,
                                                 Tick tick);

  EspionageResult resolveMission(const EspionageDeps& deps, EspionageMission& m, Tick tick);

  void archiveCompleted(Tick tick);

  EspionageParams params_{};
  core::u64 nextMissionId_{1};
  std::vector<EspionageMission> active_;
  std::vector<EspionageMission> history_;
  std::unordered_map<CharacterId, Tick> lastCompletion_;
};

} // namespace fogline::intel
