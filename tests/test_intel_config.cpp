#include "fogline/intel/IntelConfig.h"
#include "test_harness.h"

#include <string>

int test_intel_config() {
  int failures = 0;

  using fogline::core::CVarRegistry;
  using namespace fogline::intel;

  // Defaults read back as the engine defaults.
  {
    CVarRegistry reg;
    installIntelCVars(reg);
    installIntelCVars(reg); // idempotent

    const WorldStateParams d{};
    const WorldStateParams p = worldParamsFromCVars(reg);
    CHECK(p.seed == d.seed);
    CHECK(p.intel.shareReliabilityFactor == d.intel.shareReliabilityFactor);
    CHECK(p.trust.decayPerTick == d.trust.decayPerTick);
    CHECK(p.heartland.heartlandShare == d.heartland.heartlandShare);
    CHECK(p.espionage.detectionMax == d.espionage.detectionMax);
    CHECK(p.espionage.cooldownTicks == d.espionage.cooldownTicks);
    CHECK(p.schedule.trustDecayEvery == d.schedule.trustDecayEvery);
    CHECK(validateWorldParams(p));

    CHECK(p.sharing.fullRedactionGene == d.sharing.fullRedactionGene);
    CHECK(p.sharing.redactedListCap == d.sharing.redactedListCap);
    CHECK(p.sharing.baseExposure == d.sharing.baseExposure);

    CHECK(reg.exists("espionage.history_ticks"));
    CHECK(reg.exists("sharing.fair_ratio_max"));
    CHECK(!reg.list("heartland.").empty());
  }

  // Overrides flow through, including ones queued before definition.
  {
    CVarRegistry reg;
    std::string err;
    CHECK(reg.applyAssignment("intel.share_factor=0.5", &err));
    CHECK(reg.applyAssignment("world.seed=77", &err));

    installIntelCVars(reg);
    CHECK(reg.setFloat("trust.cooperation_gain", 0.05, &err));
    CHECK(reg.setInt("schedule.heartland_every", 4, &err));

    const WorldStateParams p = worldParamsFromCVars(reg);
    CHECK(p.intel.shareReliabilityFactor == 0.5);
    CHECK(p.seed == 77);
    CHECK(p.trust.cooperationGain == 0.05);
    CHECK(p.schedule.heartlandEvery == 4);

    WorldState ws(p);
    CHECK(ws.intel().params().shareReliabilityFactor == 0.5);
    CHECK(ws.trust().params().cooperationGain == 0.05);
  }

  // Values that parse but make no sense are caught by validation.
  {
    CVarRegistry reg;
    installIntelCVars(reg);
    std::string err;
    CHECK(reg.setFromString("espionage.detection_min", "0.95", &err));
    CHECK(!validateWorldParams(worldParamsFromCVars(reg), &err));
    CHECK(!err.empty());

    CHECK(!reg.setFromString("schedule.trust_decay_every", "often", &err));

    CHECK(reg.setFromString("espionage.detection_min", "0.05", &err));
    CHECK(reg.setFromString("sharing.fair_ratio_min", "3.0", &err));
    CHECK(!validateWorldParams(worldParamsFromCVars(reg), &err));
    CHECK(err.find("fair_ratio") != std::string::npos);
  }

  return failures;
}
