#include "fogline/intel/BetrayalEngine.h"
#include "intel_test_world.h"
#include "test_harness.h"

#include <algorithm>
#include <string>

int test_betrayal() {
  int failures = 0;

  using namespace fogline::intel;
  using namespace fogline::intel::testing;

  const FactionId wolves = idFromText<FactionId>("wolves");
  const FactionId foxes = idFromText<FactionId>("foxes");
  const FactionId rabbits = idFromText<FactionId>("rabbits");
  const FactionId owls = idFromText<FactionId>("owls");
  const RegionId forest = idFromText<RegionId>("dark_forest");
  const RegionId plains = idFromText<RegionId>("open_plains");

  WorldDirectory dir;
  const SpeciesInfo fox = makeSpecies("red fox", 30.0, 60.0);
  dir.addSpecies(fox);
  const CharacterId trickster = addMember(dir, "trickster", foxes, fox.id, plains);
  const CharacterId owl = addMember(dir, "owl", owls, fox.id, plains);
  addMember(dir, "rabbit", rabbits, fox.id, plains);
  for (int i = 0; i < 4; ++i) addMember(dir, "wolf" + std::to_string(i), wolves, fox.id, forest);
  dir.character(trickster)->fame = 100.0;
  WorldAccess world = dir.access();

  // Type table.
  {
    BetrayalType t{};
    CHECK(parseBetrayalType("heartland_reveal", t));
    CHECK(t == BetrayalType::HeartlandReveal);
    CHECK(!parseBetrayalType("mutiny", t));
    CHECK(toString(BetrayalType::AllianceBackstab) == "alliance_backstab");
    CHECK(betrayalTypeEconomics(BetrayalType::AllianceBackstab).victimTrustLoss == -1.0);
  }

  // Economics is pure and accounts for fame and standing trust.
  {
    BetrayalEngine engine;
    TrustLedger trust;
    const CharacterInfo& actor = *dir.character(trickster);

    BetrayalEconomics e = engine.calculateBetrayalEconomics(trust, actor, wolves, BetrayalType::IntelLeak);
    CHECK(near(e.potentialGain, 0.4));
    CHECK(near(e.potentialLoss, 0.5));
    CHECK(near(e.netValue, -0.1));

    for (int i = 0; i < 10; ++i) trust.recordCooperation(wolves, foxes, i);
    e = engine.calculateBetrayalEconomics(trust, actor, wolves, BetrayalType::HeartlandReveal);
    CHECK(near(e.potentialGain, 0.6));
    CHECK(near(e.potentialLoss, 1.0));
    CHECK(engine.events().empty());
    CHECK(trust.recordCount() == 2);
  }

  // Witnesses: everyone alive in the region except the betrayer.
  {
    BetrayalEngine engine;
    const auto seen = engine.identifyWitnesses(world, plains, trickster);
    CHECK(seen.size() == 2);
    CHECK(std::is_sorted(seen.begin(), seen.end()));
    CHECK(std::find(seen.begin(), seen.end(), foxes) == seen.end());

    dir.kill(owl);
    CHECK(engine.identifyWitnesses(world, plains, trickster).size() == 1);
    dir.character(owl)->alive = true;
  }

  // Intel leak fans out into the ledger, fame and the record.
  {
    BetrayalEngine engine;
    TrustLedger trust;

    BetrayalRequest req{};
    req.betrayer = foxes;
    req.betrayerCharacter = trickster;
    req.victim = wolves;
    req.beneficiary = rabbits;
    req.type = BetrayalType::IntelLeak;
    req.tick = 400;
    req.region = plains;
    req.witnesses = {owls};

    const BetrayalEvent ev = engine.commitBetrayal(world, trust, nullptr, req);
    CHECK(ev.id == 1);
    CHECK(ev.witnesses.size() == 2); // owls + rabbits, de-duplicated
    CHECK(near(trust.getTrust(wolves, foxes), -0.5));
    CHECK(trust.getTrustRecord(wolves, foxes)->betrayalCount == 1);
    CHECK(near(trust.getTrust(owls, foxes), -0.15));
    CHECK(near(trust.getTrust(rabbits, foxes), 0.02 - 0.15));
    CHECK(near(dir.character(trickster)->fame, 102.0));
    CHECK(near(engine.getBetrayalReputation(foxes), 0.2));
    CHECK(engine.getBetrayalReputation(wolves) == 0.0);

    CHECK(engine.getBetrayalsByFamily(foxes).size() == 1);
    CHECK(engine.getBetrayalsAgainstFamily(wolves).size() == 1);
    CHECK(engine.getBetrayalsAgainstFamily(foxes).empty());
  }

  // Backstab costs fame and gives the beneficiary nothing.
  {
    BetrayalEngine engine;
    TrustLedger trust;

    BetrayalRequest req{};
    req.betrayer = foxes;
    req.betrayerCharacter = trickster;
    req.victim = wolves;
    req.beneficiary = rabbits;
    req.type = BetrayalType::AllianceBackstab;
    req.tick = 500;

    const double fameBefore = dir.character(trickster)->fame;
    const BetrayalEvent ev = engine.commitBetrayal(world, trust, nullptr, req);
    CHECK(ev.witnesses.empty());
    CHECK(near(dir.character(trickster)->fame, fameBefore - 5.0));
    CHECK(trust.getTrustRecord(rabbits, foxes) == nullptr);
  }

  // Heartland reveal hands the beneficiary the victim's home.
  {
    BetrayalEngine engine;
    TrustLedger trust;
    HeartlandTracker hl;
    hl.recalculateAll(world, 1);
    CHECK(hl.getProfile(wolves) && hl.getProfile(wolves)->heartlandRegionId == forest);

    BetrayalRequest req{};
    req.betrayer = foxes;
    req.betrayerCharacter = trickster;
    req.victim = wolves;
    req.beneficiary = rabbits;
    req.type = BetrayalType::HeartlandReveal;
    req.tick = 10;

    engine.commitBetrayal(world, trust, &hl, req);
    CHECK(hl.knowsHeartland(rabbits, wolves));
    CHECK(near(hl.getExposureLevel(wolves), 0.2));
    CHECK(near(hl.getHeartlandHuntBonus(rabbits, forest), 0.15));
  }

  // Reputation caps at 1; events from an unknown character skip fame.
  {
    BetrayalEngine engine;
    TrustLedger trust;

    BetrayalRequest req{};
    req.betrayer = owls;
    req.betrayerCharacter = idFromText<CharacterId>("ghost");
    req.victim = rabbits;
    req.type = BetrayalType::FalseIntel;
    for (int i = 0; i < 7; ++i) {
      req.tick = i;
      engine.commitBetrayal(world, trust, nullptr, req);
    }
    CHECK(engine.getBetrayalReputation(owls) == 1.0);
    CHECK(engine.events().size() == 7);
    CHECK(engine.events().back().id == 7);
    CHECK(trust.getTrust(rabbits, owls) == -1.0);

    engine.clear();
    CHECK(engine.events().empty());
    CHECK(engine.getBetrayalReputation(owls) == 0.0);
  }

  return failures;
}
