#pragma once

#include "fogline/intel/World.h"

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>

namespace fogline::intel {

// In-memory character/species/role book that produces a WorldAccess.
//
// Used by the sandbox scenario and the tests. Characters iterate in id order so
// region and census queries are deterministic.
//
// The WorldAccess returned by access() captures `this`; keep the directory alive
// (and unmoved) for as long as the access object is in use.
class WorldDirectory {
public:
  WorldDirectory() = default;
  WorldDirectory(const WorldDirectory&) = delete;
  WorldDirectory& operator=(const WorldDirectory&) = delete;

  // Insert or replace a character.
  CharacterInfo& addCharacter(CharacterInfo c);
  bool removeCharacter(CharacterId id);

  CharacterInfo* character(CharacterId id);
  const CharacterInfo* character(CharacterId id) const;

  void addSpecies(SpeciesInfo s);
  const SpeciesInfo* species(SpeciesId id) const;

  void setGene(CharacterId id, std::string_view gene, double value);
  double gene(CharacterId id, std::string_view gene) const;

  void assignRole(CharacterId id, RoleAssignment role);
  void setObservationLevel(CharacterId id, double level);

  bool moveCharacter(CharacterId id, RegionId region);
  bool kill(CharacterId id);

  std::vector<const CharacterInfo*> inRegion(RegionId region) const;
  std::vector<const CharacterInfo*> living() const;

  std::size_t characterCount() const { return characters_.size(); }
  void clear();

  WorldAccess access();

private:
  std::map<CharacterId, CharacterInfo> characters_;
  std::unordered_map<SpeciesId, SpeciesInfo> species_;
  std::unordered_map<CharacterId, std::map<std::string, double, std::less<>>> genes_;
  std::unordered_map<CharacterId, RoleAssignment> roles_;
  std::unordered_map<CharacterId, double> observation_;
};

} // namespace fogline::intel
