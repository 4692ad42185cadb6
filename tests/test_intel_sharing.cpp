#include "fogline/intel/IntelSharing.h"
#include "intel_test_world.h"
#include "test_harness.h"

int test_intel_sharing() {
  int failures = 0;

  using namespace fogline::intel;
  using namespace fogline::intel::testing;

  const FactionId wolves = idFromText<FactionId>("wolves");
  const FactionId foxes = idFromText<FactionId>("foxes");
  const RegionId forest = idFromText<RegionId>("dark_forest");

  RegionIntel full{};
  full.regionId = forest;
  full.reliability = 1.0;
  full.knownResources = {"berries", "water", "fungus", "roots", "nuts"};
  full.knownSpecies = {idFromText<SpeciesId>("a"), idFromText<SpeciesId>("b"), idFromText<SpeciesId>("c"),
                       idFromText<SpeciesId>("d")};
  full.knownPopEstimate = 47;
  full.sourceCharacterId = idFromText<CharacterId>("scout");

  // Compartmentalization tiers.
  {
    const RegionIntel dull = compartmentalizeIntel(full, 30.0);
    CHECK(dull.sourceCharacterId.has_value());
    CHECK(dull.knownResources.size() == 5);

    const RegionIntel mid = compartmentalizeIntel(full, 40.0);
    CHECK(!mid.sourceCharacterId.has_value());
    CHECK(mid.knownResources.size() == 5);
    CHECK(mid.knownPopEstimate == 47);

    const RegionIntel sharp = compartmentalizeIntel(full, 70.0);
    CHECK(!sharp.sourceCharacterId.has_value());
    CHECK(sharp.knownResources.size() == 3);
    CHECK(sharp.knownSpecies.size() == 3);
    CHECK(sharp.knownPopEstimate == 50);
    CHECK(sharp.reliability == full.reliability);

    RegionIntel small = full;
    small.knownPopEstimate = 44;
    CHECK(compartmentalizeIntel(small, 90.0).knownPopEstimate == 40);
  }

  // Trade value and fairness.
  {
    CHECK(near(intelTradeValue(full), 9.0));

    RegionIntel half = full;
    half.reliability = 0.5;
    IntelTradeEvaluation e = evaluateIntelTrade(full, half, 0.0, 0.0);
    CHECK(near(e.ratio, 2.0));
    CHECK(e.fair);
    CHECK(near(e.tradeValue, 9.0));

    e = evaluateIntelTrade(full, half, 0.5, 0.0);
    CHECK(!e.fair);

    RegionIntel empty{};
    e = evaluateIntelTrade(full, empty, 0.0, 0.0);
    CHECK(e.ratio == 1.0);
    CHECK(e.fair);
  }

  // Exposure grows with positive trust only.
  {
    TrustLedger trust;
    SharingExposure x = calculateSharingExposure(trust, wolves, foxes, full);
    CHECK(x.positionRevealed);
    CHECK(x.historyRevealed);
    CHECK(near(x.exposureLevel, 0.3));

    trust.recordBetrayal(foxes, wolves, 1);
    RegionIntel hearsay = full;
    hearsay.source = IntelSource::Shared;
    x = calculateSharingExposure(trust, wolves, foxes, hearsay);
    CHECK(!x.historyRevealed);
    CHECK(near(x.exposureLevel, 0.3));
  }

  // Full exchange between a trusted pair.
  {
    WorldDirectory dir;
    const SpeciesInfo wolf = makeSpecies("grey wolf", 60.0, 70.0);
    dir.addSpecies(wolf);
    const CharacterId elder = addMember(dir, "elder", wolves, wolf.id, forest);
    dir.setGene(elder, "intelligence", 75.0);
    WorldAccess world = dir.access();

    IntelligenceMap intel;
    TrustLedger trust;
    intel.writeIntel(wolves, full);

    // Strangers refuse to hand over first-hand intel.
    IntelExchangeResult r = exchangeIntel(world, intel, trust, elder, foxes, forest, 10);
    CHECK(!r.shared);
    CHECK(r.risk == SharingRisk::UnknownEntity);
    CHECK(intel.getRegionIntel(foxes, forest) == nullptr);

    for (int i = 0; i < 16; ++i) trust.recordCooperation(wolves, foxes, i);
    r = exchangeIntel(world, intel, trust, elder, foxes, forest, 20);
    CHECK(r.shared);
    CHECK(r.stored);
    CHECK(r.risk == SharingRisk::TrustedAlly);
    CHECK(r.delivered.has_value());

    const RegionIntel* got = intel.getRegionIntel(foxes, forest);
    CHECK(got != nullptr);
    if (got) {
      CHECK(near(got->reliability, 0.8));
      CHECK(got->source == IntelSource::Shared);
      CHECK(!got->sourceCharacterId.has_value());
      CHECK(got->knownResources.size() == 3);
      CHECK(got->lastUpdatedTick == 20);
    }
    CHECK(near(trust.getTrust(wolves, foxes), 0.34));
    CHECK(near(r.exposure.exposureLevel, 0.3 + 0.34 * 0.3));
    CHECK(!r.narrative.empty());

    // Unknown sharer or region.
    r = exchangeIntel(world, intel, trust, idFromText<CharacterId>("nobody"), foxes, forest, 30);
    CHECK(!r.shared);
    r = exchangeIntel(world, intel, trust, elder, foxes, idFromText<RegionId>("elsewhere"), 30);
    CHECK(!r.shared);
  }

  // Tuned sharing parameters replace the default thresholds and weights.
  {
    IntelSharingParams tuned{};
    tuned.partialRedactionGene = 20.0;
    tuned.fullRedactionGene = 50.0;
    tuned.redactedListCap = 2;
    tuned.populationRounding = 100;
    tuned.tradeTrustWeight = 1.0;
    tuned.fairRatioMax = 1.5;
    tuned.baseExposure = 0.1;

    RegionIntel counted = full;
    counted.knownPopEstimate = 160;
    const RegionIntel view = compartmentalizeIntel(counted, 55.0, tuned);
    CHECK(!view.sourceCharacterId.has_value());
    CHECK(view.knownResources.size() == 2);
    CHECK(view.knownSpecies.size() == 2);
    CHECK(view.knownPopEstimate == 200);
    CHECK(compartmentalizeIntel(counted, 30.0, tuned).knownResources.size() == 5);

    RegionIntel half = full;
    half.reliability = 0.5;
    // Default weights: ratio 2 is fair; with trust weighted 1.0 and a 1.5 cap it is not.
    CHECK(evaluateIntelTrade(full, half, 0.0, 0.0).fair);
    const IntelTradeEvaluation e = evaluateIntelTrade(full, half, 0.5, 0.0, tuned);
    CHECK(near(e.ratio, 3.0));
    CHECK(!e.fair);

    TrustLedger trust;
    CHECK(near(calculateSharingExposure(trust, wolves, foxes, full, tuned).exposureLevel, 0.1));
  }

  return failures;
}
