#include "fogline/intel/IntelConfig.h"

namespace fogline::intel {

void installIntelCVars(core::CVarRegistry& r) {
  const WorldStateParams d{};

  r.defineInt("world.seed", (std::int64_t)d.seed, "Seed of the shared random source.");

  r.defineFloat("intel.share_factor", d.intel.shareReliabilityFactor,
                "Reliability multiplier applied to shared intel.");
  r.defineFloat("intel.decay_per_tick", d.intel.decayPerTick,
                "Intel reliability lost per elapsed tick.");
  r.defineFloat("intel.misinfo_threshold", d.intel.misinformationBlendThreshold,
                "Reliability at which planted misinformation blends instead of overwriting.");
  r.defineFloat("intel.misinfo_blend_penalty", d.intel.misinformationBlendPenalty,
                "Reliability removed by a blended misinformation plant.");
  r.defineFloat("intel.misinfo_default_reliability", d.intel.misinformationDefaultReliability,
                "Reliability of an overwriting rumor that does not state one.");

  r.defineFloat("trust.cooperation_gain", d.trust.cooperationGain,
                "Trust gained by both sides per cooperation.");
  r.defineFloat("trust.betrayal_penalty", d.trust.betrayalPenalty,
                "Trust the victim loses toward a betrayer.");
  r.defineFloat("trust.witness_penalty", d.trust.witnessPenalty,
                "Trust a witness loses toward a betrayer.");
  r.defineFloat("trust.decay_per_tick", d.trust.decayPerTick,
                "Trust moved toward zero per decay pass.");

  r.defineFloat("heartland.share", d.heartland.heartlandShare,
                "Member share that flags a region as heartland.");
  r.defineFloat("heartland.sub_share", d.heartland.subThresholdShare,
                "Member share that yields a sub-threshold strength.");
  r.defineFloat("heartland.sub_scale", d.heartland.subThresholdScale,
                "Strength scale for sub-threshold concentration.");

  r.defineFloat("espionage.base_detection", d.espionage.baseDetectionChance,
                "Per-tick detection chance of a size-40 agent.");
  r.defineFloat("espionage.detection_min", d.espionage.detectionMin,
                "Lower bound of the per-tick detection chance.");
  r.defineFloat("espionage.detection_max", d.espionage.detectionMax,
                "Upper bound of the per-tick detection chance.");
  r.defineFloat("espionage.exposure_penalty", d.espionage.exposureTrustPenalty,
                "Trust penalty when an identified agent is exposed.");
  r.defineInt("espionage.cooldown_ticks", d.espionage.cooldownTicks,
              "Ticks an agent rests after a mission.");
  r.defineInt("espionage.history_ticks", d.espionage.historyRetentionTicks,
              "Ticks a finished mission stays in history past its start.");

  r.defineFloat("betrayal.reputation_step", d.betrayal.reputationPerBetrayal,
                "Reputation accumulated per committed betrayal.");

  r.defineFloat("sharing.partial_redaction_gene", d.sharing.partialRedactionGene,
                "Intelligence gene at which a shared copy loses its source character.");
  r.defineFloat("sharing.full_redaction_gene", d.sharing.fullRedactionGene,
                "Intelligence gene at which lists are capped and population rounded.");
  r.defineInt("sharing.redacted_list_cap", (std::int64_t)d.sharing.redactedListCap,
              "Resources/species kept under full redaction.");
  r.defineInt("sharing.population_rounding", d.sharing.populationRounding,
              "Population estimate rounding step under full redaction.");
  r.defineFloat("sharing.trade_trust_weight", d.sharing.tradeTrustWeight,
                "Weight of trust in trade value adjustment.");
  r.defineFloat("sharing.fair_ratio_min", d.sharing.fairRatioMin,
                "Lowest offered/requested ratio considered fair.");
  r.defineFloat("sharing.fair_ratio_max", d.sharing.fairRatioMax,
                "Highest offered/requested ratio considered fair.");
  r.defineFloat("sharing.base_exposure", d.sharing.baseExposure,
                "Exposure of the sharer on every share.");
  r.defineFloat("sharing.trust_exposure_scale", d.sharing.trustExposureScale,
                "Extra exposure per unit of positive trust toward the recipient.");

  r.defineInt("schedule.intel_decay_every", d.schedule.intelDecayEvery,
              "Intel decay period in ticks.");
  r.defineInt("schedule.trust_decay_every", d.schedule.trustDecayEvery,
              "Trust decay period in ticks.");
  r.defineInt("schedule.heartland_every", d.schedule.heartlandEvery,
              "Heartland recalculation period in ticks.");
}

WorldStateParams worldParamsFromCVars(const core::CVarRegistry& r) {
  WorldStateParams p{};

  p.seed = (core::u64)r.getInt("world.seed", (std::int64_t)p.seed);

  p.intel.shareReliabilityFactor = r.getFloat("intel.share_factor", p.intel.shareReliabilityFactor);
  p.intel.decayPerTick = r.getFloat("intel.decay_per_tick", p.intel.decayPerTick);
  p.intel.misinformationBlendThreshold = r.getFloat("intel.misinfo_threshold", p.intel.misinformationBlendThreshold);
  p.intel.misinformationBlendPenalty = r.getFloat("intel.misinfo_blend_penalty", p.intel.misinformationBlendPenalty);
  p.intel.misinformationDefaultReliability =
      r.getFloat("intel.misinfo_default_reliability", p.intel.misinformationDefaultReliability);

  p.trust.cooperationGain = r.getFloat("trust.cooperation_gain", p.trust.cooperationGain);
  p.trust.betrayalPenalty = r.getFloat("trust.betrayal_penalty", p.trust.betrayalPenalty);
  p.trust.witnessPenalty = r.getFloat("trust.witness_penalty", p.trust.witnessPenalty);
  p.trust.decayPerTick = r.getFloat("trust.decay_per_tick", p.trust.decayPerTick);

  p.heartland.heartlandShare = r.getFloat("heartland.share", p.heartland.heartlandShare);
  p.heartland.subThresholdShare = r.getFloat("heartland.sub_share", p.heartland.subThresholdShare);
  p.heartland.subThresholdScale = r.getFloat("heartland.sub_scale", p.heartland.subThresholdScale);

  p.espionage.baseDetectionChance = r.getFloat("espionage.base_detection", p.espionage.baseDetectionChance);
  p.espionage.detectionMin = r.getFloat("espionage.detection_min", p.espionage.detectionMin);
  p.espionage.detectionMax = r.getFloat("espionage.detection_max", p.espionage.detectionMax);
  p.espionage.exposureTrustPenalty = r.getFloat("espionage.exposure_penalty", p.espionage.exposureTrustPenalty);
  p.espionage.cooldownTicks = (Tick)r.getInt("espionage.cooldown_ticks", p.espionage.cooldownTicks);
  p.espionage.historyRetentionTicks = (Tick)r.getInt("espionage.history_ticks", p.espionage.historyRetentionTicks);

  p.betrayal.reputationPerBetrayal = r.getFloat("betrayal.reputation_step", p.betrayal.reputationPerBetrayal);

  p.sharing.partialRedactionGene = r.getFloat("sharing.partial_redaction_gene", p.sharing.partialRedactionGene);
  p.sharing.fullRedactionGene = r.getFloat("sharing.full_redaction_gene", p.sharing.fullRedactionGene);
  {
    const std::int64_t cap = r.getInt("sharing.redacted_list_cap", (std::int64_t)p.sharing.redactedListCap);
    p.sharing.redactedListCap = (cap > 0) ? (std::size_t)cap : 0;
  }
  p.sharing.populationRounding = (int)r.getInt("sharing.population_rounding", p.sharing.populationRounding);
  p.sharing.tradeTrustWeight = r.getFloat("sharing.trade_trust_weight", p.sharing.tradeTrustWeight);
  p.sharing.fairRatioMin = r.getFloat("sharing.fair_ratio_min", p.sharing.fairRatioMin);
  p.sharing.fairRatioMax = r.getFloat("sharing.fair_ratio_max", p.sharing.fairRatioMax);
  p.sharing.baseExposure = r.getFloat("sharing.base_exposure", p.sharing.baseExposure);
  p.sharing.trustExposureScale = r.getFloat("sharing.trust_exposure_scale", p.sharing.trustExposureScale);

  p.schedule.intelDecayEvery = (int)r.getInt("schedule.intel_decay_every", p.schedule.intelDecayEvery);
  p.schedule.trustDecayEvery = (int)r.getInt("schedule.trust_decay_every", p.schedule.trustDecayEvery);
  p.schedule.heartlandEvery = (int)r.getInt("schedule.heartland_every", p.schedule.heartlandEvery);

  return p;
}

} // namespace fogline::intel
