#include "fogline/core/Random.h"
#include "test_harness.h"

#include <vector>

int test_random() {
  int failures = 0;

  using fogline::core::SplitMix64;

  // Same seed, same stream.
  {
    SplitMix64 a(1337);
    SplitMix64 b(1337);
    bool same = true;
    for (int i = 0; i < 64; ++i) {
      if (a.nextU64() != b.nextU64()) same = false;
    }
    CHECK(same);

    SplitMix64 c(1338);
    CHECK(SplitMix64(1337).nextU64() != c.nextU64());
  }

  // Ranges.
  {
    SplitMix64 r(7);
    bool ok = true;
    for (int i = 0; i < 1000; ++i) {
      const double d = r.nextDouble();
      if (d < 0.0 || d >= 1.0) ok = false;
      const int k = r.range(3, 5);
      if (k < 3 || k > 5) ok = false;
      const double u = r.uniform(-2.0, 2.0);
      if (u < -2.0 || u >= 2.0) ok = false;
    }
    CHECK(ok);
  }

  // chance() edges are exact.
  {
    SplitMix64 r(99);
    int fired0 = 0;
    int fired1 = 0;
    for (int i = 0; i < 500; ++i) {
      if (r.chance(0.0)) ++fired0;
      if (r.chance(1.0)) ++fired1;
    }
    CHECK(fired0 == 0);
    CHECK(fired1 == 500);
  }

  // Weighted pick never returns a zero-weight slot.
  {
    SplitMix64 r(3);
    const std::vector<double> w{0.0, 2.0, 0.0, 1.0};
    bool ok = true;
    for (int i = 0; i < 200; ++i) {
      const auto idx = r.weightedIndex(w);
      if (!idx || (*idx != 1 && *idx != 3)) ok = false;
    }
    CHECK(ok);

    const std::vector<double> none{0.0, -1.0};
    CHECK(!r.weightedIndex(none).has_value());
  }

  // Derived seeds are stable and salt-sensitive.
  {
    using fogline::core::deriveSeed;
    CHECK(deriveSeed(42, "espionage") == deriveSeed(42, "espionage"));
    CHECK(deriveSeed(42, "espionage") != deriveSeed(42, "heartland"));
  }

  return failures;
}
