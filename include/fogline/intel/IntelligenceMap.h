#pragma once

#include "fogline/intel/Ids.h"
#include "fogline/intel/World.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace fogline::intel {

// -----------------------------------------------------------------------------
// Intelligence map (per-faction fog of war)
// -----------------------------------------------------------------------------
//
// Each faction holds its own picture of the world: which regions it knows about,
// what it believes lives and grows there, and how much it trusts that belief
// (reliability). Knowledge is acquired by exploration, degraded by sharing and by
// time, and can be corrupted by planted misinformation.

enum class IntelSource : core::u8 {
  Exploration = 0,
  Shared = 1,
  Rumor = 2,
};

std::string_view toString(IntelSource s);

struct RegionIntel {
  RegionId regionId{};
  Tick discoveredAtTick{0};
  Tick lastUpdatedTick{0};
  std::optional<Tick> lastDecayTick{};

  // Always in [0,1]. Entries are evicted when this reaches 0.
  double reliability{1.0};

  std::vector<std::string> knownResources{};
  std::vector<SpeciesId> knownSpecies{};
  std::vector<std::string> knownThreats{};
  int knownPopEstimate{0};

  IntelSource source{IntelSource::Exploration};
  std::optional<CharacterId> sourceCharacterId{};
  bool isMisinformation{false};
};

struct FactionIntelMap {
  FactionId faction{};
  std::unordered_map<RegionId, RegionIntel> knownRegions{};
  std::unordered_set<RegionId> exploredRegionIds{};
  Tick lastFullSurveyTick{0};
};

// What an explorer observes in a region right now.
struct RegionSnapshot {
  struct Resource {
    std::string type{};
    double quantity{0.0};
  };
  struct Population {
    SpeciesId species{};
    int count{0};
  };

  std::vector<Resource> resources{};
  std::vector<Population> populations{};
  double temperatureC{20.0};
  double pollution{0.0}; // [0,1]
};

// Partial intel used to corrupt a target faction's map. Absent fields fall back
// to the prior entry (overwrite) or are left alone (blend).
struct MisinformationPayload {
  std::optional<Tick> discoveredAtTick{};
  std::optional<Tick> lastUpdatedTick{};
  std::optional<double> reliability{};
  std::optional<std::vector<std::string>> knownResources{};
  std::optional<std::vector<SpeciesId>> knownSpecies{};
  std::optional<std::vector<std::string>> knownThreats{};
  std::optional<int> knownPopEstimate{};
  std::optional<CharacterId> sourceCharacterId{};
};

enum class MisinformationMode : core::u8 {
  // Weak or missing knowledge is replaced wholesale by the rumor.
  Overwrite = 0,
  // Established knowledge loses reliability and picks up the false threats.
  Blend = 1,
};

std::string_view toString(MisinformationMode m);

struct IntelligenceParams {
  // Reliability multiplier applied to every shared copy.
  double shareReliabilityFactor{0.8};

  // Reliability lost per elapsed tick.
  double decayPerTick{0.001};

  // Existing reliability at or above this is blended rather than overwritten.
  double misinformationBlendThreshold{0.6};
  double misinformationBlendPenalty{0.2};
  double misinformationDefaultReliability{0.7};

  // Climate thresholds for threat tags recorded during exploration.
  double extremeHeatC{40.0};
  double extremeColdC{-15.0};
  double pollutionThreat{0.5};
};

MisinformationMode chooseMisinformationMode(const RegionIntel* existing, const IntelligenceParams& params);

class IntelligenceMap {
public:
  explicit IntelligenceMap(IntelligenceParams params = {}) : params_(params) {}

  const IntelligenceParams& params() const { return params_; }
  void setParams(const IntelligenceParams& p) { params_ = p; }

  FactionIntelMap& getOrCreate(FactionId faction);
  const FactionIntelMap* find(FactionId faction) const;

  // The explorer's faction learns the region at full reliability.
  // Unknown characters are ignored.
  void recordExploration(const WorldAccess& world,
                         CharacterId characterId,
                         RegionId regionId,
                         const RegionSnapshot& snapshot,
                         Tick tick);

  // Copy a faction's entry to another faction at reduced reliability. The copy is
  // only stored if it improves on what the receiver already has.
  // Returns the shared copy, or nullopt when the sender knows nothing.
  std::optional<RegionIntel> shareIntel(FactionId from, FactionId to, RegionId regionId, Tick tick);

  // Store an externally prepared shared copy under the monotonic-improvement rule.
  // Returns true when the receiver's entry was replaced.
  bool receiveSharedIntel(FactionId to, const RegionIntel& copy);

  MisinformationMode plantMisinformation(FactionId target, RegionId regionId, const MisinformationPayload& payload);

  // Unconditional write (clamped).
  void writeIntel(FactionId faction, RegionIntel intel);

  // Returns the number of entries evicted.
  std::size_t decayIntelReliability(FactionIntelMap& map, Tick tick);
  std::size_t decayAll(Tick tick);

  const RegionIntel* getRegionIntel(FactionId faction, RegionId regionId) const;

  // Ascending region id order.
  std::vector<RegionId> getKnownRegions(FactionId faction) const;

  bool hasExplored(FactionId faction, RegionId regionId) const;

  std::size_t factionCount() const { return maps_.size(); }
  void clear() { maps_.clear(); }

private:
  IntelligenceParams params_{};
  std::unordered_map<FactionId, FactionIntelMap> maps_;
};

} // namespace fogline::intel
