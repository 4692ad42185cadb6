#pragma once

#include "fogline/intel/Ids.h"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fogline::intel {

// -----------------------------------------------------------------------------
// World access contract
// -----------------------------------------------------------------------------
//
// The intel core never owns characters, species or regions. It reads them
// through this narrow set of hooks supplied by the host simulation, and writes
// back only the two vitals it is allowed to touch (energy/health after a pack
// absorption, fame after a betrayal).
//
// Every hook is optional. A missing hook answers "unknown": null character,
// empty lists, default species traits, no role.

struct CharacterInfo {
  CharacterId id{};
  FactionId faction{};
  SpeciesId species{};
  RegionId region{};
  std::string name{};
  bool alive{true};

  // Free-form role tag ("sentinel", "spy", "forager", ...).
  std::string role{};

  // Host-owned vitals, typically in [0,1].
  double energy{1.0};
  double health{1.0};
  double fame{0.0};
};

struct SpeciesInfo {
  SpeciesId id{};
  // Body size / speed on the 0..100 trait scale.
  double size{50.0};
  double speed{50.0};
  std::string commonName{"creature"};
  std::string taxonomyClass{"unknown"};
};

struct RoleAssignment {
  std::string role{};
  double proficiency{0.0}; // [0,1]
};

using FindCharacterFn = std::function<const CharacterInfo*(CharacterId)>;
using CharactersInRegionFn = std::function<std::vector<const CharacterInfo*>(RegionId)>;
using LivingCharactersFn = std::function<std::vector<const CharacterInfo*>()>;
using GeneValueFn = std::function<double(const CharacterInfo&, std::string_view gene)>;
using FindSpeciesFn = std::function<const SpeciesInfo*(SpeciesId)>;
using RoleOfFn = std::function<std::optional<RoleAssignment>(CharacterId)>;
using ObservationLevelFn = std::function<double(CharacterId)>;
using AdjustVitalsFn = std::function<void(CharacterId, double dEnergy, double dHealth)>;
using AdjustFameFn = std::function<void(CharacterId, double delta)>;

struct WorldAccess {
  FindCharacterFn findCharacter{};
  CharactersInRegionFn charactersInRegion{};
  LivingCharactersFn livingCharacters{};
  GeneValueFn geneValue{};
  FindSpeciesFn findSpecies{};
  RoleOfFn roleOf{};
  ObservationLevelFn observationLevel{};
  AdjustVitalsFn adjustVitals{};
  AdjustFameFn adjustFame{};
};

// Gene value used when a character has no entry for a named gene.
inline constexpr double kDefaultGeneValue = 50.0;

// Fail-soft readers over WorldAccess.
const CharacterInfo* lookupCharacter(const WorldAccess& world, CharacterId id);
std::vector<const CharacterInfo*> lookupCharactersInRegion(const WorldAccess& world, RegionId region);
std::vector<const CharacterInfo*> lookupLivingCharacters(const WorldAccess& world);
double lookupGene(const WorldAccess& world, const CharacterInfo& c, std::string_view gene);

// Species traits with defaults filled in for unknown species.
SpeciesInfo lookupSpecies(const WorldAccess& world, SpeciesId id);

std::optional<RoleAssignment> lookupRole(const WorldAccess& world, CharacterId id);
double lookupObservationLevel(const WorldAccess& world, CharacterId id);

// Write-backs. No-ops when the host did not provide the hook.
void applyVitals(const WorldAccess& world, CharacterId id, double dEnergy, double dHealth);
void applyFame(const WorldAccess& world, CharacterId id, double delta);

} // namespace fogline::intel
