#pragma once

#include "fogline/intel/Ids.h"

#include <cstddef>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace fogline::intel {

// -----------------------------------------------------------------------------
// Trust ledger
// -----------------------------------------------------------------------------
//
// Directed trust between factions: trust(A->B) is what A thinks of B, and is not
// in general equal to trust(B->A). Cooperation is the only symmetric update.
// Betrayals are recorded on the victim's side only.

struct TrustRecord {
  FactionId target{};
  double trustScore{0.0}; // [-1,1]
  int cooperationCount{0};
  int betrayalCount{0};
  Tick lastInteractionTick{0};
  int intelSharedCount{0};
  double intelAccuracyScore{1.0}; // rolling average in [0,1]
};

struct TrustParams {
  double cooperationGain{0.02};
  double betrayalPenalty{0.5};
  double witnessPenalty{0.15};
  double decayPerTick{0.002};

  // Willingness decision table thresholds.
  double trustedAllyThreshold{0.3};
  double lowRiskValueLimit{0.5};
  double unknownEntityValueLimit{0.3};
};

enum class SharingRisk : core::u8 {
  TrustedAlly = 0,
  LowRiskExchange = 1,
  KnownBetrayer = 2,
  UnknownEntity = 3,
  InsufficientTrust = 4,
};

std::string_view toString(SharingRisk r);

struct SharingWillingness {
  bool willing{false};
  SharingRisk risk{SharingRisk::InsufficientTrust};
};

class TrustLedger {
public:
  explicit TrustLedger(TrustParams params = {}) : params_(params) {}

  const TrustParams& params() const { return params_; }
  void setParams(const TrustParams& p) { params_ = p; }

  // 0 for unknown pairs.
  double getTrust(FactionId from, FactionId to) const;
  const TrustRecord* getTrustRecord(FactionId from, FactionId to) const;

  void recordCooperation(FactionId a, FactionId b, Tick tick);

  // victim->betrayer drops by the configured betrayal penalty.
  void recordBetrayal(FactionId betrayer, FactionId victim, Tick tick);
  // Same formal record with a caller-chosen penalty magnitude.
  void recordBetrayal(FactionId betrayer, FactionId victim, Tick tick, double penalty);

  void spreadBetrayalReputation(FactionId betrayer, const std::vector<FactionId>& witnesses, Tick tick);

  // Every score moves toward 0 by decayPerTick, never crossing it.
  void tickTrustDecay(Tick tick);

  // Ordered decision table; the first matching row wins.
  SharingWillingness evaluateIntelSharingWillingness(FactionId sharer, FactionId receiver, double intelValue) const;

  // Updates receiver->sender (`to` about `from`).
  void recordIntelAccuracy(FactionId from, FactionId to, bool accurate);

  // Factions `faction` holds a record about, ascending.
  std::vector<FactionId> getKnownFactions(FactionId faction) const;

  std::size_t recordCount() const;
  void clear() { ledger_.clear(); }

private:
  TrustRecord& getOrCreate(FactionId from, FactionId to);

  TrustParams params_{};
  std::unordered_map<FactionId, std::unordered_map<FactionId, TrustRecord>> ledger_;
};

} // namespace fogline::intel
