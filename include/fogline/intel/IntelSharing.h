#pragma once

#include "fogline/intel/IntelligenceMap.h"
#include "fogline/intel/TrustLedger.h"
#include "fogline/intel/World.h"

#include <cstddef>
#include <optional>
#include <string>

namespace fogline::intel {

// -----------------------------------------------------------------------------
// Intel sharing policy
// -----------------------------------------------------------------------------
//
// Pure functions deciding what a faction gives away when it shares: how much
// detail survives redaction, whether a trade is fair, and how much the sharer
// reveals about itself. exchangeIntel() strings them together for hosts.

struct IntelSharingParams {
  // Intelligence gene thresholds for compartmentalization.
  double partialRedactionGene{40.0};
  double fullRedactionGene{70.0};
  std::size_t redactedListCap{3};
  int populationRounding{10};

  // Trade fairness: each side's value is weighted by (1 + trust * weight).
  double tradeTrustWeight{0.2};
  double fairRatioMin{0.5};
  double fairRatioMax{2.0};

  // Exposure = base + max(0, trust) * scale.
  double baseExposure{0.3};
  double trustExposureScale{0.3};
};

// Redact by the viewer's intelligence gene (default thresholds):
//   < 40   unchanged copy
//   40-69  source character stripped
//   >= 70  source stripped, resources/species capped at 3, population rounded to 10
RegionIntel compartmentalizeIntel(const RegionIntel& fullIntel,
                                  double viewerIntelligenceGene,
                                  const IntelSharingParams& params = {});

// reliability * (|resources| + |species|)
double intelTradeValue(const RegionIntel& intel);

struct IntelTradeEvaluation {
  bool fair{false};
  double tradeValue{0.0}; // unadjusted value of the offered side
  double ratio{1.0};      // adjusted offered / adjusted requested
};

IntelTradeEvaluation evaluateIntelTrade(const RegionIntel& offered,
                                        const RegionIntel& requested,
                                        double sharerTrust,
                                        double recipientTrust,
                                        const IntelSharingParams& params = {});

struct SharingExposure {
  bool positionRevealed{true};
  bool historyRevealed{false};
  double exposureLevel{0.0};
};

SharingExposure calculateSharingExposure(const TrustLedger& trust,
                                         FactionId sharer,
                                         FactionId recipient,
                                         const RegionIntel& intel,
                                         const IntelSharingParams& params = {});

struct IntelExchangeResult {
  bool shared{false};
  SharingRisk risk{SharingRisk::InsufficientTrust};

  // What the receiver was handed, and whether it replaced their own entry.
  std::optional<RegionIntel> delivered{};
  bool stored{false};

  SharingExposure exposure{};
  std::string narrative{};
};

// A character shares its faction's intel on `region` with `receiver`.
// Refused when the character or the intel is unknown, or when the sharer's
// faction is unwilling (intel value = reliability).
IntelExchangeResult exchangeIntel(const WorldAccess& world,
                                  IntelligenceMap& intel,
                                  TrustLedger& trust,
                                  CharacterId sharerCharacter,
                                  FactionId receiver,
                                  RegionId region,
                                  Tick tick,
                                  const IntelSharingParams& params = {});

} // namespace fogline::intel
