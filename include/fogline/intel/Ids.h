#pragma once

#include "fogline/core/Hash.h"
#include "fogline/core/Types.h"

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace fogline::intel {

// -----------------------------------------------------------------------------
// Entity identifiers
// -----------------------------------------------------------------------------
//
// Every entity kind gets its own opaque id type so a region id can never be
// passed where a faction id is expected. Value 0 means "none".

template <class Tag>
struct Id {
  core::u64 value{0};

  constexpr Id() = default;
  constexpr explicit Id(core::u64 v) : value(v) {}

  constexpr bool valid() const { return value != 0; }
  constexpr explicit operator bool() const { return valid(); }

  friend constexpr bool operator==(Id a, Id b) { return a.value == b.value; }
  friend constexpr bool operator!=(Id a, Id b) { return a.value != b.value; }
  friend constexpr bool operator<(Id a, Id b) { return a.value < b.value; }
  friend constexpr bool operator>(Id a, Id b) { return a.value > b.value; }
  friend constexpr bool operator<=(Id a, Id b) { return a.value <= b.value; }
  friend constexpr bool operator>=(Id a, Id b) { return a.value >= b.value; }
};

struct FactionTag {};
struct RegionTag {};
struct CharacterTag {};
struct SpeciesTag {};
struct MissionTag {};

using FactionId = Id<FactionTag>;
using RegionId = Id<RegionTag>;
using CharacterId = Id<CharacterTag>;
using SpeciesId = Id<SpeciesTag>;
using MissionId = Id<MissionTag>;

// Simulation time, in world ticks.
using Tick = core::i64;

// Stable id from a human-readable name (tools, tests, scenarios).
template <class IdT>
inline IdT idFromText(std::string_view text) {
  return IdT{core::fnv1a64(text)};
}

// Short hex rendering for log lines.
template <class Tag>
inline std::string toString(Id<Tag> id) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out(16, '0');
  core::u64 v = id.value;
  for (int i = 15; i >= 0; --i) {
    out[(std::size_t)i] = kHex[v & 0xFu];
    v >>= 4;
  }
  return out;
}

} // namespace fogline::intel

template <class Tag>
struct std::hash<fogline::intel::Id<Tag>> {
  std::size_t operator()(fogline::intel::Id<Tag> id) const noexcept {
    return std::hash<fogline::core::u64>{}(id.value);
  }
};
