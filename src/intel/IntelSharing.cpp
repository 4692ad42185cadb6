#include "fogline/intel/IntelSharing.h"

#include "fogline/core/Clamp.h"
#include "fogline/core/Log.h"

#include <cmath>

namespace fogline::intel {

RegionIntel compartmentalizeIntel(const RegionIntel& fullIntel,
                                  double viewerIntelligenceGene,
                                  const IntelSharingParams& params) {
  RegionIntel out = fullIntel;
  if (viewerIntelligenceGene < params.partialRedactionGene) return out;

  out.sourceCharacterId.reset();
  if (viewerIntelligenceGene < params.fullRedactionGene) return out;

  if (out.knownResources.size() > params.redactedListCap) out.knownResources.resize(params.redactedListCap);
  if (out.knownSpecies.size() > params.redactedListCap) out.knownSpecies.resize(params.redactedListCap);
  if (params.populationRounding > 1) {
    const double step = (double)params.populationRounding;
    out.knownPopEstimate = (int)std::lround((double)out.knownPopEstimate / step) * params.populationRounding;
  }
  return out;
}

double intelTradeValue(const RegionIntel& intel) {
  return intel.reliability * (double)(intel.knownResources.size() + intel.knownSpecies.size());
}

IntelTradeEvaluation evaluateIntelTrade(const RegionIntel& offered,
                                        const RegionIntel& requested,
                                        double sharerTrust,
                                        double recipientTrust,
                                        const IntelSharingParams& params) {
  const double offeredValue = intelTradeValue(offered);
  const double requestedValue = intelTradeValue(requested);

  const double adjOffered = offeredValue * (1.0 + sharerTrust * params.tradeTrustWeight);
  const double adjRequested = requestedValue * (1.0 + recipientTrust * params.tradeTrustWeight);

  IntelTradeEvaluation e{};
  e.tradeValue = offeredValue;
  e.ratio = (adjRequested > 0.0) ? (adjOffered / adjRequested) : 1.0;
  e.fair = (e.ratio >= params.fairRatioMin && e.ratio <= params.fairRatioMax);
  return e;
}

SharingExposure calculateSharingExposure(const TrustLedger& trust,
                                         FactionId sharer,
                                         FactionId recipient,
                                         const RegionIntel& intel,
                                         const IntelSharingParams& params) {
  const double t = trust.getTrust(sharer, recipient);

  SharingExposure e{};
  e.positionRevealed = true;
  e.historyRevealed = (intel.source == IntelSource::Exploration);
  e.exposureLevel = params.baseExposure + ((t > 0.0) ? t * params.trustExposureScale : 0.0);
  return e;
}

IntelExchangeResult exchangeIntel(const WorldAccess& world,
                                  IntelligenceMap& intel,
                                  TrustLedger& trust,
                                  CharacterId sharerCharacter,
                                  FactionId receiver,
                                  RegionId region,
                                  Tick tick,
                                  const IntelSharingParams& params) {
  IntelExchangeResult r{};

  const CharacterInfo* sharer = lookupCharacter(world, sharerCharacter);
  if (!sharer || !sharer->alive) {
    r.narrative = "There is no one able to share that intelligence.";
    return r;
  }

  const RegionIntel* known = intel.getRegionIntel(sharer->faction, region);
  if (!known) {
    r.narrative = "The faction has no intelligence on that region.";
    return r;
  }

  const SharingWillingness will = trust.evaluateIntelSharingWillingness(sharer->faction, receiver, known->reliability);
  r.risk = will.risk;
  if (!will.willing) {
    r.narrative = sharer->name + " withholds the intelligence (" + std::string(toString(will.risk)) + ").";
    return r;
  }

  RegionIntel copy = compartmentalizeIntel(*known, lookupGene(world, *sharer, "intelligence"), params);
  copy.reliability = core::clamp01(known->reliability * intel.params().shareReliabilityFactor);
  copy.lastUpdatedTick = tick;
  copy.lastDecayTick.reset();
  copy.source = IntelSource::Shared;

  r.stored = intel.receiveSharedIntel(receiver, copy);
  r.delivered = std::move(copy);
  r.shared = true;

  trust.recordCooperation(sharer->faction, receiver, tick);

  r.exposure = calculateSharingExposure(trust, sharer->faction, receiver, *known, params);

  r.narrative = sharer->name + " shares intelligence about the region.";
  if (r.exposure.positionRevealed) r.narrative += " The faction's presence is now known.";

  FOGLINE_LOG_DEBUG("sharing: " + toString(sharer->faction) + " -> " + toString(receiver) +
                    " region " + toString(region) + (r.stored ? " (stored)" : " (ignored, receiver knows better)"));
  return r;
}

} // namespace fogline::intel
