#pragma once

#include "fogline/intel/Ids.h"
#include "fogline/intel/WorldDirectory.h"

#include <string>

// Shared scaffolding for the intel tests: a directory with a few named
// species and a helper to drop characters into it.
namespace fogline::intel::testing {

inline SpeciesInfo makeSpecies(const std::string& name, double size, double speed, const std::string& cls = "Mammalia") {
  SpeciesInfo s{};
  s.id = idFromText<SpeciesId>(name);
  s.size = size;
  s.speed = speed;
  s.commonName = name;
  s.taxonomyClass = cls;
  return s;
}

inline CharacterId addMember(WorldDirectory& dir,
                             const std::string& name,
                             FactionId faction,
                             SpeciesId species,
                             RegionId region,
                             const std::string& role = {}) {
  CharacterInfo c{};
  c.id = idFromText<CharacterId>(name);
  c.name = name;
  c.faction = faction;
  c.species = species;
  c.region = region;
  c.role = role;
  return dir.addCharacter(c).id;
}

inline bool near(double a, double b, double eps = 1e-9) {
  return (a > b ? a - b : b - a) <= eps;
}

} // namespace fogline::intel::testing
