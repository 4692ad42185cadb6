#include "fogline/intel/WorldDirectory.h"
#include "intel_test_world.h"
#include "test_harness.h"

int test_world_directory() {
  int failures = 0;

  using namespace fogline::intel;
  using namespace fogline::intel::testing;

  const FactionId wolves = idFromText<FactionId>("wolves");
  const RegionId forest = idFromText<RegionId>("dark_forest");
  const RegionId plains = idFromText<RegionId>("open_plains");

  WorldDirectory dir;
  const SpeciesInfo wolf = makeSpecies("grey wolf", 60.0, 70.0);
  dir.addSpecies(wolf);

  const CharacterId alpha = addMember(dir, "alpha", wolves, wolf.id, forest);
  const CharacterId beta = addMember(dir, "beta", wolves, wolf.id, forest);
  const CharacterId gamma = addMember(dir, "gamma", wolves, wolf.id, plains);

  WorldAccess world = dir.access();

  // Lookups through the access object.
  {
    const CharacterInfo* a = lookupCharacter(world, alpha);
    CHECK(a != nullptr);
    CHECK(a && a->name == "alpha");
    CHECK(lookupCharacter(world, idFromText<CharacterId>("nobody")) == nullptr);

    CHECK(lookupCharactersInRegion(world, forest).size() == 2);
    CHECK(lookupCharactersInRegion(world, plains).size() == 1);
    CHECK(lookupLivingCharacters(world).size() == 3);
  }

  // Genes default to 50 and can be overridden.
  {
    const CharacterInfo& a = *dir.character(alpha);
    CHECK(lookupGene(world, a, "intelligence") == kDefaultGeneValue);
    dir.setGene(alpha, "intelligence", 85.0);
    CHECK(lookupGene(world, a, "intelligence") == 85.0);
  }

  // Unknown species fall back to default traits.
  {
    CHECK(lookupSpecies(world, wolf.id).size == 60.0);
    const SpeciesInfo ghost = lookupSpecies(world, idFromText<SpeciesId>("ghost"));
    CHECK(ghost.size == 50.0);
    CHECK(ghost.commonName == "creature");
  }

  // Roles and observation levels.
  {
    dir.assignRole(beta, RoleAssignment{"sentinel", 0.9});
    const auto role = lookupRole(world, beta);
    CHECK(role.has_value());
    CHECK(role && role->role == "sentinel");
    CHECK(!lookupRole(world, gamma).has_value());

    dir.setObservationLevel(beta, 140.0);
    CHECK(lookupObservationLevel(world, beta) == 100.0);
  }

  // Write-backs clamp at zero.
  {
    applyVitals(world, gamma, -0.3, -2.0);
    CHECK(near(dir.character(gamma)->energy, 0.7));
    CHECK(dir.character(gamma)->health == 0.0);

    applyFame(world, gamma, -5.0);
    CHECK(dir.character(gamma)->fame == 0.0);
    applyFame(world, gamma, 2.0);
    CHECK(dir.character(gamma)->fame == 2.0);
  }

  // Death and movement.
  {
    CHECK(dir.kill(gamma));
    CHECK(lookupLivingCharacters(world).size() == 2);
    CHECK(dir.moveCharacter(beta, plains));
    CHECK(lookupCharactersInRegion(world, forest).size() == 1);
    CHECK(!dir.moveCharacter(idFromText<CharacterId>("nobody"), plains));
  }

  // An empty access object answers "unknown" everywhere.
  {
    WorldAccess empty{};
    CHECK(lookupCharacter(empty, alpha) == nullptr);
    CHECK(lookupLivingCharacters(empty).empty());
    CHECK(lookupSpecies(empty, wolf.id).size == 50.0);
    CHECK(!lookupRole(empty, beta).has_value());
    applyVitals(empty, alpha, -1.0, -1.0);
    CHECK(dir.character(alpha)->health == 1.0);
  }

  return failures;
}
