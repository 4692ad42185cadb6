#include "fogline/core/CVar.h"
#include "fogline/core/Log.h"
#include "fogline/intel/IntelConfig.h"

#include "test_harness.h"

#include <cstdio>
#include <string>
#include <variant>

namespace {

bool writeText(const std::string& path, const char* text) {
  std::FILE* f = std::fopen(path.c_str(), "wb");
  if (!f) return false;
  std::fputs(text, f);
  std::fclose(f);
  return true;
}

std::string stringValue(const fogline::core::CVarRegistry& r, const char* name) {
  const fogline::core::CVar* v = r.find(name);
  if (!v || v->type != fogline::core::CVarType::String) return "<missing>";
  return std::get<std::string>(v->value);
}

} // namespace

int test_cvars() {
  int failures = 0;

  using fogline::core::CVarRegistry;
  using namespace fogline::intel;

  // ---- Typed parsing ----
  {
    CVarRegistry r;
    CHECK(r.defineInt("espionage.cooldown_ticks", 50) != nullptr);
    CHECK(r.defineFloat("intel.share_factor", 0.8, "sharing") != nullptr);
    CHECK(r.defineString("sandbox.note", "") != nullptr);

    std::string err;
    CHECK(r.setFromString("espionage.cooldown_ticks", " 75 ", &err));
    CHECK(r.getInt("espionage.cooldown_ticks") == 75);
    CHECK(r.setFromString("intel.share_factor", "0.65", &err));
    CHECK(r.getFloat("intel.share_factor") == 0.65);
    CHECK(r.setFromString("sandbox.note", "\"two words\"", &err));
    CHECK(stringValue(r, "sandbox.note") == "two words");

    CHECK(!r.setFromString("espionage.cooldown_ticks", "7.5", &err));
    CHECK(!r.setFromString("intel.share_factor", "most", &err));
    CHECK(err.find("intel.share_factor") != std::string::npos);
    CHECK(r.getFloat("intel.share_factor") == 0.65);

    // Redefinition keeps the value; a type clash is refused.
    CHECK(r.defineFloat("intel.share_factor", 0.8) != nullptr);
    CHECK(r.getFloat("intel.share_factor") == 0.65);
    CHECK(r.defineInt("intel.share_factor", 1) == nullptr);
    CHECK(!r.setInt("intel.share_factor", 1, &err));

    CHECK(r.list("intel.").size() == 1);
    CHECK(r.list().size() == 3);
  }

  // ---- Config file: comments, quoting, pending tunables ----
  {
    const std::string path = "fogline_test_cvars_tuning.cfg";
    CHECK(writeText(path,
                    "# detection tuning\n"
                    "// alternate comment style\n"
                    "intel.share_factor = 0.5   # halve shared reliability\n"
                    "schedule.trust_decay_every 5 // once every five ticks\n"
                    "schedule.heartland_every=10\n"
                    "\n"
                    "known.url = \"http://example.com/a//b#frag\" # trailing comment\n"
                    "known.hash = \"abc # def\" // trailing comment\n"
                    "known.apos = O'Reilly # trailing comment\n"
                    "known.unquoted_url = http://example.com/a//b // trailing comment\n"
                    "later.url = \"http://example.com/#frag\" # defined after loading\n"));

    CVarRegistry r;
    CHECK(r.defineString("known.url", "") != nullptr);
    CHECK(r.defineString("known.hash", "") != nullptr);
    CHECK(r.defineString("known.apos", "") != nullptr);
    CHECK(r.defineString("known.unquoted_url", "") != nullptr);

    std::string err;
    CHECK(r.loadFile(path, &err));
    CHECK(err.empty());

    CHECK(stringValue(r, "known.url") == "http://example.com/a//b#frag");
    CHECK(stringValue(r, "known.hash") == "abc # def");
    CHECK(stringValue(r, "known.apos") == "O'Reilly");
    CHECK(stringValue(r, "known.unquoted_url") == "http://example.com/a//b");

    // Intel tunables were not defined yet; they apply on definition.
    CHECK(r.hasPending("intel.share_factor"));
    CHECK(r.hasPending("schedule.trust_decay_every"));
    installIntelCVars(r);
    CHECK(!r.hasPending("intel.share_factor"));

    const WorldStateParams p = worldParamsFromCVars(r);
    CHECK(p.intel.shareReliabilityFactor == 0.5);
    CHECK(p.schedule.trustDecayEvery == 5);
    CHECK(p.schedule.heartlandEvery == 10);
    CHECK(p.schedule.intelDecayEvery == WorldStateParams{}.schedule.intelDecayEvery);
    CHECK(validateWorldParams(p));

    CHECK(r.hasPending("later.url"));
    CHECK(r.defineString("later.url", "") != nullptr);
    CHECK(stringValue(r, "later.url") == "http://example.com/#frag");

    std::remove(path.c_str());
  }

  // ---- Bad lines are reported with their line number; the rest still apply ----
  {
    const std::string path = "fogline_test_cvars_errors.cfg";
    CHECK(writeText(path,
                    "# tuning\n"
                    "intel.share_factor = 0.25\n"
                    "schedule.heartland_every = often\n"
                    "espionage.detection_max\n"
                    "trust.decay_per_tick = 0.01\n"));

    CVarRegistry r;
    installIntelCVars(r);
    std::string err;
    CHECK(!r.loadFile(path, &err));
    CHECK(err.find(path + ":3:") != std::string::npos);
    CHECK(err.find(path + ":4:") != std::string::npos);
    CHECK(err.find(":2:") == std::string::npos);

    const WorldStateParams p = worldParamsFromCVars(r);
    CHECK(p.intel.shareReliabilityFactor == 0.25);
    CHECK(p.trust.decayPerTick == 0.01);
    CHECK(p.schedule.heartlandEvery == WorldStateParams{}.schedule.heartlandEvery);

    CHECK(!r.loadFile("fogline_test_cvars_missing.cfg", &err));
    std::remove(path.c_str());
  }

  // ---- Save + reload reproduces the tuned world ----
  {
    const std::string path = "fogline_test_cvars_roundtrip.cfg";

    CVarRegistry a;
    installIntelCVars(a);
    CHECK(a.defineString("sandbox.note", "", "Free-form run label.") != nullptr);

    std::string err;
    CHECK(a.setFromString("sandbox.note", "\"seed#7 // run\"", &err));
    CHECK(a.setFloat("intel.share_factor", 0.55, &err));
    CHECK(a.setFloat("espionage.detection_max", 0.3, &err));
    CHECK(a.setFloat("sharing.trade_trust_weight", 0.125, &err));
    CHECK(a.setInt("world.seed", 4242, &err));
    CHECK(a.applyAssignment("later.url = \"http://example.com/#frag\"", &err));
    CHECK(a.saveFile(path, &err));

    // Load before defining so every line goes through the pending path.
    CVarRegistry b;
    CHECK(b.loadFile(path, &err));
    installIntelCVars(b);
    CHECK(b.defineString("sandbox.note", "") != nullptr);
    CHECK(b.defineString("later.url", "") != nullptr);

    CHECK(stringValue(b, "sandbox.note") == "seed#7 // run");
    CHECK(stringValue(b, "later.url") == "http://example.com/#frag");

    const WorldStateParams pa = worldParamsFromCVars(a);
    const WorldStateParams pb = worldParamsFromCVars(b);
    CHECK(pb.seed == 4242);
    CHECK(pb.intel.shareReliabilityFactor == pa.intel.shareReliabilityFactor);
    CHECK(pb.espionage.detectionMax == pa.espionage.detectionMax);
    CHECK(pb.sharing.tradeTrustWeight == 0.125);
    CHECK(pb.trust.decayPerTick == pa.trust.decayPerTick);
    CHECK(pb.espionage.cooldownTicks == pa.espionage.cooldownTicks);

    std::remove(path.c_str());
  }

  // ---- Command-line assignments ----
  {
    CVarRegistry r;
    std::string err;
    CHECK(r.defineFloat("intel.share_factor", 0.8) != nullptr);

    CHECK(r.applyAssignment("intel.share_factor = 0.5", &err));
    CHECK(r.getFloat("intel.share_factor", 0.0) == 0.5);

    // Unknown names wait for their definition.
    CHECK(r.applyAssignment("later.int=9", &err));
    CHECK(r.hasPending("later.int"));
    CHECK(r.defineInt("later.int", 0) != nullptr);
    CHECK(r.getInt("later.int", 0) == 9);

    // A pending value the type cannot parse is dropped, leaving the default.
    CHECK(r.applyAssignment("later.float=fast", &err));
    CHECK(r.defineFloat("later.float", 2.0) != nullptr);
    CHECK(r.getFloat("later.float") == 2.0);
    CHECK(!r.hasPending("later.float"));

    CHECK(!r.applyAssignment("no_equals_sign", &err));
    CHECK(!err.empty());
    CHECK(!r.applyAssignment("intel.share_factor=abc", &err));
    CHECK(r.getFloat("intel.share_factor", 0.0) == 0.5);
  }

  // ---- log.level listener ----
  {
    CVarRegistry r;
    fogline::core::installDefaultCVars(r);
    const auto prev = fogline::core::getLogLevel();

    std::string err;
    CHECK(r.setFromString("log.level", "error", &err));
    CHECK(fogline::core::getLogLevel() == fogline::core::LogLevel::Error);

    int notified = 0;
    CHECK(r.addListener("log.level", [&](const fogline::core::CVar&) { ++notified; }));
    CHECK(r.applyAssignment("log.level = \"warn\"", &err));
    CHECK(fogline::core::getLogLevel() == fogline::core::LogLevel::Warn);
    CHECK(notified == 1);
    CHECK(!r.addListener("log.nothing", [](const fogline::core::CVar&) {}));

    fogline::core::setLogLevel(prev);
  }

  return failures;
}
