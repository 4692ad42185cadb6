#include "fogline/intel/World.h"

namespace fogline::intel {

const CharacterInfo* lookupCharacter(const WorldAccess& world, CharacterId id) {
  if (!world.findCharacter || !id) return nullptr;
  return world.findCharacter(id);
}

std::vector<const CharacterInfo*> lookupCharactersInRegion(const WorldAccess& world, RegionId region) {
  if (!world.charactersInRegion) return {};
  return world.charactersInRegion(region);
}

std::vector<const CharacterInfo*> lookupLivingCharacters(const WorldAccess& world) {
  if (!world.livingCharacters) return {};
  return world.livingCharacters();
}

double lookupGene(const WorldAccess& world, const CharacterInfo& c, std::string_view gene) {
  if (!world.geneValue) return kDefaultGeneValue;
  return world.geneValue(c, gene);
}

SpeciesInfo lookupSpecies(const WorldAccess& world, SpeciesId id) {
  if (world.findSpecies) {
    if (const SpeciesInfo* s = world.findSpecies(id)) return *s;
  }
  SpeciesInfo unknown{};
  unknown.id = id;
  return unknown;
}

std::optional<RoleAssignment> lookupRole(const WorldAccess& world, CharacterId id) {
  if (!world.roleOf) return std::nullopt;
  return world.roleOf(id);
}

double lookupObservationLevel(const WorldAccess& world, CharacterId id) {
  if (!world.observationLevel) return 0.0;
  return world.observationLevel(id);
}

void applyVitals(const WorldAccess& world, CharacterId id, double dEnergy, double dHealth) {
  if (world.adjustVitals) world.adjustVitals(id, dEnergy, dHealth);
}

void applyFame(const WorldAccess& world, CharacterId id, double delta) {
  if (world.adjustFame) world.adjustFame(id, delta);
}

} // namespace fogline::intel
