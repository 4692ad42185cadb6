#include "fogline/intel/WorldDirectory.h"

#include "fogline/core/Clamp.h"

#include <algorithm>

namespace fogline::intel {

CharacterInfo& WorldDirectory::addCharacter(CharacterInfo c) {
  const CharacterId id = c.id;
  auto& slot = characters_[id];
  slot = std::move(c);
  return slot;
}

bool WorldDirectory::removeCharacter(CharacterId id) {
  genes_.erase(id);
  roles_.erase(id);
  observation_.erase(id);
  return characters_.erase(id) > 0;
}

CharacterInfo* WorldDirectory::character(CharacterId id) {
  auto it = characters_.find(id);
  return (it == characters_.end()) ? nullptr : &it->second;
}

const CharacterInfo* WorldDirectory::character(CharacterId id) const {
  auto it = characters_.find(id);
  return (it == characters_.end()) ? nullptr : &it->second;
}

void WorldDirectory::addSpecies(SpeciesInfo s) {
  const SpeciesId id = s.id;
  species_[id] = std::move(s);
}

const SpeciesInfo* WorldDirectory::species(SpeciesId id) const {
  auto it = species_.find(id);
  return (it == species_.end()) ? nullptr : &it->second;
}

void WorldDirectory::setGene(CharacterId id, std::string_view gene, double value) {
  auto& book = genes_[id];
  auto it = book.find(gene);
  if (it == book.end()) {
    book.emplace(std::string(gene), value);
  } else {
    it->second = value;
  }
}

double WorldDirectory::gene(CharacterId id, std::string_view gene) const {
  auto it = genes_.find(id);
  if (it == genes_.end()) return kDefaultGeneValue;
  auto g = it->second.find(gene);
  return (g == it->second.end()) ? kDefaultGeneValue : g->second;
}

void WorldDirectory::assignRole(CharacterId id, RoleAssignment role) {
  roles_[id] = std::move(role);
}

void WorldDirectory::setObservationLevel(CharacterId id, double level) {
  observation_[id] = core::clamp(level, 0.0, 100.0);
}

bool WorldDirectory::moveCharacter(CharacterId id, RegionId region) {
  CharacterInfo* c = character(id);
  if (!c) return false;
  c->region = region;
  return true;
}

bool WorldDirectory::kill(CharacterId id) {
  CharacterInfo* c = character(id);
  if (!c) return false;
  c->alive = false;
  return true;
}

std::vector<const CharacterInfo*> WorldDirectory::inRegion(RegionId region) const {
  std::vector<const CharacterInfo*> out;
  for (const auto& [id, c] : characters_) {
    if (c.region == region) out.push_back(&c);
  }
  return out;
}

std::vector<const CharacterInfo*> WorldDirectory::living() const {
  std::vector<const CharacterInfo*> out;
  out.reserve(characters_.size());
  for (const auto& [id, c] : characters_) {
    if (c.alive) out.push_back(&c);
  }
  return out;
}

void WorldDirectory::clear() {
  characters_.clear();
  species_.clear();
  genes_.clear();
  roles_.clear();
  observation_.clear();
}

WorldAccess WorldDirectory::access() {
  WorldAccess w{};
  w.findCharacter = [this](CharacterId id) -> const CharacterInfo* { return character(id); };
  w.charactersInRegion = [this](RegionId r) { return inRegion(r); };
  w.livingCharacters = [this]() { return living(); };
  w.geneValue = [this](const CharacterInfo& c, std::string_view g) { return gene(c.id, g); };
  w.findSpecies = [this](SpeciesId id) { return species(id); };
  w.roleOf = [this](CharacterId id) -> std::optional<RoleAssignment> {
    auto it = roles_.find(id);
    if (it == roles_.end()) return std::nullopt;
    return it->second;
  };
  w.observationLevel = [this](CharacterId id) {
    auto it = observation_.find(id);
    return (it == observation_.end()) ? 0.0 : it->second;
  };
  w.adjustVitals = [this](CharacterId id, double dEnergy, double dHealth) {
    CharacterInfo* c = character(id);
    if (!c) return;
    c->energy = std::max(0.0, c->energy + dEnergy);
    c->health = std::max(0.0, c->health + dHealth);
  };
  w.adjustFame = [this](CharacterId id, double delta) {
    CharacterInfo* c = character(id);
    if (!c) return;
    c->fame = std::max(0.0, c->fame + delta);
  };
  return w;
}

} // namespace fogline::intel
