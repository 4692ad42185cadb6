#include "fogline/intel/TrustLedger.h"

#include "fogline/core/Clamp.h"

#include <algorithm>
#include <cmath>

namespace fogline::intel {

std::string_view toString(SharingRisk r) {
  switch (r) {
    case SharingRisk::TrustedAlly: return "trusted ally";
    case SharingRisk::LowRiskExchange: return "low-risk exchange";
    case SharingRisk::KnownBetrayer: return "known betrayer";
    case SharingRisk::UnknownEntity: return "unknown entity";
    case SharingRisk::InsufficientTrust: return "insufficient trust";
  }
  return "unknown";
}

double TrustLedger::getTrust(FactionId from, FactionId to) const {
  const TrustRecord* r = getTrustRecord(from, to);
  return r ? r->trustScore : 0.0;
}

const TrustRecord* TrustLedger::getTrustRecord(FactionId from, FactionId to) const {
  auto row = ledger_.find(from);
  if (row == ledger_.end()) return nullptr;
  auto it = row->second.find(to);
  return (it == row->second.end()) ? nullptr : &it->second;
}

TrustRecord& TrustLedger::getOrCreate(FactionId from, FactionId to) {
  auto& row = ledger_[from];
  auto it = row.find(to);
  if (it != row.end()) return it->second;

  TrustRecord r{};
  r.target = to;
  return row.emplace(to, r).first->second;
}

void TrustLedger::recordCooperation(FactionId a, FactionId b, Tick tick) {
  TrustRecord& ab = getOrCreate(a, b);
  ab.trustScore = core::clampSigned01(ab.trustScore + params_.cooperationGain);
  ab.cooperationCount++;
  ab.lastInteractionTick = tick;

  TrustRecord& ba = getOrCreate(b, a);
  ba.trustScore = core::clampSigned01(ba.trustScore + params_.cooperationGain);
  ba.cooperationCount++;
  ba.lastInteractionTick = tick;
}

void TrustLedger::recordBetrayal(FactionId betrayer, FactionId victim, Tick tick) {
  recordBetrayal(betrayer, victim, tick, params_.betrayalPenalty);
}

void TrustLedger::recordBetrayal(FactionId betrayer, FactionId victim, Tick tick, double penalty) {
  TrustRecord& r = getOrCreate(victim, betrayer);
  r.trustScore = core::clampSigned01(r.trustScore - std::abs(penalty));
  r.betrayalCount++;
  r.lastInteractionTick = tick;
}

void TrustLedger::spreadBetrayalReputation(FactionId betrayer, const std::vector<FactionId>& witnesses, Tick tick) {
  for (FactionId w : witnesses) {
    if (w == betrayer) continue;
    TrustRecord& r = getOrCreate(w, betrayer);
    r.trustScore = core::clampSigned01(r.trustScore - params_.witnessPenalty);
    r.lastInteractionTick = tick;
  }
}

void TrustLedger::tickTrustDecay(Tick /*tick*/) {
  const double step = params_.decayPerTick;
  for (auto& [from, row] : ledger_) {
    for (auto& [to, r] : row) {
      if (r.trustScore > 0.0) {
        r.trustScore = std::max(0.0, r.trustScore - step);
      } else if (r.trustScore < 0.0) {
        r.trustScore = std::min(0.0, r.trustScore + step);
      }
    }
  }
}

SharingWillingness TrustLedger::evaluateIntelSharingWillingness(FactionId sharer,
                                                                FactionId receiver,
                                                                double intelValue) const {
  const TrustRecord* record = getTrustRecord(sharer, receiver);
  const double trust = record ? record->trustScore : 0.0;

  if (trust > params_.trustedAllyThreshold) return {true, SharingRisk::TrustedAlly};
  if (trust > 0.0 && intelValue < params_.lowRiskValueLimit) return {true, SharingRisk::LowRiskExchange};
  if (record && record->betrayalCount > 0) return {false, SharingRisk::KnownBetrayer};
  if (trust == 0.0) return {intelValue < params_.unknownEntityValueLimit, SharingRisk::UnknownEntity};
  return {false, SharingRisk::InsufficientTrust};
}

void TrustLedger::recordIntelAccuracy(FactionId from, FactionId to, bool accurate) {
  TrustRecord& r = getOrCreate(to, from);
  r.intelSharedCount++;
  const double w = 1.0 / (double)r.intelSharedCount;
  r.intelAccuracyScore = core::clamp01(r.intelAccuracyScore * (1.0 - w) + (accurate ? 1.0 : 0.0) * w);
}

std::vector<FactionId> TrustLedger::getKnownFactions(FactionId faction) const {
  std::vector<FactionId> out;
  auto row = ledger_.find(faction);
  if (row == ledger_.end()) return out;

  out.reserve(row->second.size());
  for (const auto& [to, r] : row->second) out.push_back(to);
  std::sort(out.begin(), out.end());
  return out;
}

std::size_t TrustLedger::recordCount() const {
  std::size_t n = 0;
  for (const auto& [from, row] : ledger_) n += row.size();
  return n;
}

} // namespace fogline::intel
