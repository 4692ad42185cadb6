#include "fogline/core/Args.h"
#include "fogline/core/CVar.h"
#include "fogline/core/JsonWriter.h"
#include "fogline/core/Log.h"
#include "fogline/intel/IntelConfig.h"
#include "fogline/intel/IntelSharing.h"
#include "fogline/intel/WorldDirectory.h"
#include "fogline/intel/WorldState.h"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace fogline;
using namespace fogline::intel;

namespace {

struct Narrator {
  std::ostream& out;
  bool quiet{false};

  void section(const char* title) const {
    if (quiet) return;
    out << "\n" << std::string(60, '=') << "\n  " << title << "\n" << std::string(60, '=') << "\n";
  }

  void line(const std::string& msg) const {
    if (quiet) return;
    out << "  " << msg << "\n";
  }
};

std::string num(double v, int decimals = 2) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", decimals, v);
  return buf;
}

std::string joined(const std::vector<std::string>& v) {
  std::string s;
  for (std::size_t i = 0; i < v.size(); ++i) {
    if (i) s += ", ";
    s += v[i];
  }
  return s;
}

// Figures the JSON summary reports.
struct ScenarioSummary {
  double sharedReliability{0.0};
  double decayedReliability{0.0};
  double trustAfterCooperation{0.0};
  std::string willingness{};
  double rabbitHeartlandStrength{0.0};
  double huntBonus{0.0};
  double detectionWithoutSentinel{0.0};
  double detectionWithSentinel{0.0};
  std::vector<EspionageResult> missionResults{};
  bool foxesKnowRabbitHeartland{false};
  double wolfTrustInFoxes{0.0};
  double foxReputation{0.0};
  std::size_t foxBetrayals{0};
  double foxFame{0.0};
  bool misinformationPlanted{false};
  std::size_t epilogueEvicted{0};
  Tick finalTick{0};
};

CharacterInfo makeCharacter(const std::string& name, FactionId faction, SpeciesId species, RegionId region) {
  CharacterInfo c{};
  c.id = idFromText<CharacterId>(name);
  c.name = name;
  c.faction = faction;
  c.species = species;
  c.region = region;
  return c;
}

RegionSnapshot meadowSnapshot(SpeciesId resident, int count) {
  RegionSnapshot s{};
  s.resources = {{"grass", 50.0}, {"water", 80.0}, {"berries", 30.0}};
  s.populations = {{resident, count}};
  s.temperatureC = 18.0;
  return s;
}

ScenarioSummary runScenario(WorldState& ws, WorldDirectory& dir, const Narrator& say, int epilogueTicks) {
  ScenarioSummary sum{};
  const WorldAccess world = dir.access();

  const FactionId wolves = idFromText<FactionId>("wolf-pack");
  const FactionId foxes = idFromText<FactionId>("fox-den");
  const FactionId rabbits = idFromText<FactionId>("rabbit-warren");

  const RegionId forest = idFromText<RegionId>("Dark Forest");
  const RegionId plains = idFromText<RegionId>("Open Plains");
  const RegionId mountains = idFromText<RegionId>("Iron Mountains");

  SpeciesInfo wolf{idFromText<SpeciesId>("wolf"), 60.0, 65.0, "wolf", "Mammalia"};
  SpeciesInfo fox{idFromText<SpeciesId>("fox"), 25.0, 70.0, "fox", "Mammalia"};
  SpeciesInfo rabbit{idFromText<SpeciesId>("rabbit"), 8.0, 80.0, "rabbit", "Mammalia"};
  dir.addSpecies(wolf);
  dir.addSpecies(fox);
  dir.addSpecies(rabbit);

  // ---- Act 1 ----
  say.section("ACT 1 - FOG OF WAR: Intelligence Maps");

  dir.addCharacter(makeCharacter("wolf-alpha", wolves, wolf.id, forest));
  const CharacterInfo& wolfScout = dir.addCharacter(makeCharacter("wolf-scout", wolves, wolf.id, plains));
  const CharacterInfo& foxLeader = dir.addCharacter(makeCharacter("fox-leader", foxes, fox.id, plains));
  const CharacterId wolfScoutId = wolfScout.id;
  const CharacterId foxLeaderId = foxLeader.id;

  ws.intel().recordExploration(world, wolfScoutId, plains, meadowSnapshot(rabbit.id, 3), 100);
  if (const RegionIntel* intel = ws.intel().getRegionIntel(wolves, plains)) {
    say.line("Wolf pack discovers Open Plains:");
    say.line("  resources: " + joined(intel->knownResources));
    say.line("  reliability: " + num(intel->reliability) + " (" + std::string(toString(intel->source)) + ")");
  }

  ws.intel().recordExploration(world, foxLeaderId, forest, meadowSnapshot(wolf.id, 1), 105);

  if (const auto shared = ws.intel().shareIntel(wolves, foxes, plains, 110)) {
    sum.sharedReliability = shared->reliability;
    say.line("Wolves share plains intel with foxes: reliability " + num(shared->reliability) + ", source " +
             std::string(toString(shared->source)));
  }

  ws.decayAll(600);
  if (const RegionIntel* intel = ws.intel().getRegionIntel(wolves, plains)) {
    sum.decayedReliability = intel->reliability;
    say.line("500 ticks later the wolves' plains intel sits at " + num(intel->reliability, 3));
  }

  // ---- Act 2 ----
  say.section("ACT 2 - TRUST: Cooperation & Suspicion");

  for (int i = 0; i < 20; ++i) ws.trust().recordCooperation(wolves, foxes, 100 + i);
  sum.trustAfterCooperation = ws.trust().getTrust(wolves, foxes);
  say.line("Trust after 20 cooperative encounters: " + num(sum.trustAfterCooperation));

  const SharingWillingness will = ws.trust().evaluateIntelSharingWillingness(wolves, foxes, 0.5);
  sum.willingness = std::string(toString(will.risk));
  say.line(std::string("Willing to share high-value intel? ") + (will.willing ? "YES" : "NO") + " (" +
           sum.willingness + ")");

  // ---- Act 3 ----
  say.section("ACT 3 - HEARTLAND: Territorial Concentration");

  for (int i = 0; i < 12; ++i) {
    dir.addCharacter(makeCharacter("rabbit-forest-" + std::to_string(i), rabbits, rabbit.id, forest));
  }
  for (int i = 0; i < 3; ++i) {
    dir.addCharacter(makeCharacter("rabbit-plains-" + std::to_string(i), rabbits, rabbit.id, plains));
  }

  ws.tickTrustDecay(200);
  ws.recalculateAll(world, 200);
  if (const HeartlandProfile* p = ws.heartland().getProfile(rabbits)) {
    sum.rabbitHeartlandStrength = p->heartlandStrength;
    say.line("Rabbit warren: 12 in the forest, 3 on the plains");
    say.line(std::string("  heartland: ") + (p->heartlandRegionId == forest ? "Dark Forest" : "none") +
             ", strength " + num(p->heartlandStrength));
    say.line("  defense bonus +" + num(ws.heartland().getHeartlandDefenseBonus(rabbits, forest) * 100.0, 0) +
             "%, foraging bonus +" + num(ws.heartland().getHeartlandForagingBonus(rabbits, forest) * 100.0, 0) + "%");
  }

  ws.heartland().recordHeartlandDiscovery(wolves, rabbits);
  sum.huntBonus = ws.heartland().getHeartlandHuntBonus(wolves, forest);
  say.line("Wolves discover the rabbit heartland: hunt bonus +" + num(sum.huntBonus * 100.0, 0) +
           "%, exposure " + num(ws.heartland().getExposureLevel(rabbits)));

  // ---- Act 4 ----
  say.section("ACT 4 - ESPIONAGE: Shadows Between Territories");

  CharacterInfo spyInfo = makeCharacter("fox-spy", foxes, fox.id, plains);
  spyInfo.role = "spy";
  const CharacterId foxSpy = dir.addCharacter(spyInfo).id;
  dir.assignRole(foxSpy, RoleAssignment{"spy", 0.6});
  dir.setGene(foxSpy, "intelligence", 70.0);

  StartMissionRequest spyMission{};
  spyMission.type = EspionageActionType::Spy;
  spyMission.agent = foxSpy;
  spyMission.targetRegion = forest;
  spyMission.targetFaction = wolves;
  spyMission.tick = 200;
  const MissionId m1 = ws.espionage().startMission(world, spyMission);
  if (const EspionageMission* m = ws.espionage().findMission(m1)) {
    say.line("Fox spy departs for the Dark Forest (" + std::to_string(m->durationTicks) + " ticks)");
  }

  CharacterInfo sentinelInfo = makeCharacter("wolf-sentinel", wolves, wolf.id, forest);
  sentinelInfo.role = "sentinel";
  const CharacterId wolfSentinel = dir.addCharacter(sentinelInfo).id;
  dir.setObservationLevel(wolfSentinel, 65.0);

  if (const CharacterInfo* spy = dir.character(foxSpy)) {
    const CharacterInfo* sentinel = dir.character(wolfSentinel);
    sum.detectionWithoutSentinel = ws.espionage().calculateDetectionChance(world, *spy, forest, {});
    sum.detectionWithSentinel = ws.espionage().calculateDetectionChance(world, *spy, forest, {sentinel});
    say.line("Detection chance per tick: " + num(sum.detectionWithoutSentinel * 100.0, 1) + "% alone, " +
             num(sum.detectionWithSentinel * 100.0, 1) + "% with the sentinel on watch");
  }

  for (Tick t = 201; t <= 215; ++t) {
    std::vector<EspionageResult> results;
    ws.tickMissions(world, t, &results);
    for (const auto& r : results) {
      say.line("  tick " + std::to_string(t) + ": " + (r.success ? "SUCCESS - " : "FAILED - ") + r.narrative);
      sum.missionResults.push_back(r);
    }
  }

  // ---- Act 5 ----
  say.section("ACT 5 - INFILTRATION: Deep Cover Mission");

  const CharacterId infiltrator = dir.addCharacter(makeCharacter("fox-infiltrator", foxes, fox.id, plains)).id;
  const CharacterId lookout = dir.addCharacter(makeCharacter("fox-lookout", foxes, fox.id, plains)).id;
  dir.setGene(infiltrator, "strength", 55.0);

  StartMissionRequest deepCover{};
  deepCover.type = EspionageActionType::Infiltrate;
  deepCover.agent = infiltrator;
  deepCover.support = {lookout};
  deepCover.targetRegion = forest;
  deepCover.tick = 300;
  ws.espionage().startMission(world, deepCover);
  say.line("A fox infiltrator and a lookout slip into rabbit territory...");

  for (Tick t = 301; t <= 330; ++t) {
    std::vector<EspionageResult> results;
    ws.tickMissions(world, t, &results);
    for (const auto& r : results) {
      say.line("  tick " + std::to_string(t) + ": " + r.narrative);
      sum.missionResults.push_back(r);
    }
  }
  sum.foxesKnowRabbitHeartland = ws.heartland().knowsHeartland(foxes, rabbits);
  say.line(std::string("Foxes know the rabbit heartland? ") + (sum.foxesKnowRabbitHeartland ? "YES" : "NO"));

  // ---- Act 6 ----
  say.section("ACT 6 - BETRAYAL: The Fox Turns");

  if (const CharacterInfo* leader = dir.character(foxLeaderId)) {
    const BetrayalEconomics econ =
        ws.betrayal().calculateBetrayalEconomics(ws.trust(), *leader, wolves, BetrayalType::IntelLeak);
    say.line("Leaking wolf positions: gain " + num(econ.potentialGain) + ", loss " + num(econ.potentialLoss) +
             ", net " + num(econ.netValue));
  }

  BetrayalRequest leak{};
  leak.betrayer = foxes;
  leak.betrayerCharacter = foxLeaderId;
  leak.victim = wolves;
  leak.beneficiary = rabbits;
  leak.type = BetrayalType::IntelLeak;
  leak.tick = 400;
  leak.region = plains;
  const BetrayalEvent ev = ws.betrayal().commitBetrayal(world, ws.trust(), &ws.heartland(), leak);
  say.line("Betrayal committed (" + std::string(toString(ev.type)) + ") before " +
           std::to_string(ev.witnesses.size()) + " witness factions");
  say.line("  wolf trust in foxes: " + num(ws.trust().getTrust(wolves, foxes)));

  // ---- Act 7 ----
  say.section("ACT 7 - COMPARTMENTALIZATION: Smart Intel Sharing");

  if (const RegionIntel* full = ws.intel().getRegionIntel(wolves, plains)) {
    const double levels[] = {25.0, 55.0, 85.0};
    for (double iq : levels) {
      const RegionIntel view = compartmentalizeIntel(*full, iq, ws.params().sharing);
      say.line("  intelligence " + num(iq, 0) + ": " + std::to_string(view.knownResources.size()) +
               " resources, source " + (view.sourceCharacterId ? "visible" : "hidden"));
    }
  }

  dir.setGene(foxLeaderId, "intelligence", 75.0);
  const IntelExchangeResult swap = exchangeIntel(world, ws.intel(), ws.trust(), foxLeaderId, rabbits, forest, 410,
                                                 ws.params().sharing);
  say.line("Fox leader offers forest intel to the rabbits: " + swap.narrative);

  // ---- Act 8 ----
  say.section("ACT 8 - MISINFORMATION: Planting False Intel");

  MisinformationPayload lie{};
  lie.lastUpdatedTick = 400;
  lie.knownThreats = std::vector<std::string>{"massive_predator", "avalanche"};
  lie.knownPopEstimate = 9999;
  const MisinformationMode mode = ws.intel().plantMisinformation(rabbits, mountains, lie);
  if (const RegionIntel* rumor = ws.intel().getRegionIntel(rabbits, mountains)) {
    sum.misinformationPlanted = rumor->isMisinformation;
    say.line("Rabbit map of the Iron Mountains (" + std::string(toString(mode)) + "):");
    say.line("  threats: " + joined(rumor->knownThreats) + ", population " +
             std::to_string(rumor->knownPopEstimate) + ", source " + std::string(toString(rumor->source)));
  }

  // ---- Act 9 ----
  say.section("ACT 9 - BACKSTAB: The Ultimate Betrayal");

  if (const CharacterInfo* leader = dir.character(foxLeaderId)) {
    say.line("Fox leader fame before the backstab: " + num(leader->fame, 0));
  }
  BetrayalRequest backstab{};
  backstab.betrayer = foxes;
  backstab.betrayerCharacter = foxLeaderId;
  backstab.victim = wolves;
  backstab.type = BetrayalType::AllianceBackstab;
  backstab.tick = 500;
  ws.betrayal().commitBetrayal(world, ws.trust(), &ws.heartland(), backstab);

  if (const CharacterInfo* leader = dir.character(foxLeaderId)) sum.foxFame = leader->fame;
  sum.wolfTrustInFoxes = ws.trust().getTrust(wolves, foxes);
  sum.foxReputation = ws.betrayal().getBetrayalReputation(foxes);
  sum.foxBetrayals = ws.betrayal().getBetrayalsByFamily(foxes).size();
  say.line("Fox leader fame after: " + num(sum.foxFame, 0) + ", reputation " + num(sum.foxReputation) +
           ", wolf trust in foxes " + num(sum.wolfTrustInFoxes));

  // ---- Epilogue ----
  Tick tick = 601;
  for (int i = 0; i < epilogueTicks; ++i, ++tick) {
    const TickReport report = ws.advance(world, tick);
    sum.epilogueEvicted += report.intelEvicted;
    for (const auto& r : report.missionResults) sum.missionResults.push_back(r);
  }
  sum.finalTick = tick - 1;

  say.section("SUMMARY");
  say.line("Wolves know the rabbit heartland: " + std::string(ws.heartland().knowsHeartland(wolves, rabbits) ? "yes" : "no"));
  say.line("Active missions: " + std::to_string(ws.espionage().getActiveMissions().size()));
  say.line("Fox betrayals on record: " + std::to_string(sum.foxBetrayals));
  if (epilogueTicks > 0) {
    say.line("Epilogue: " + std::to_string(epilogueTicks) + " ticks, " + std::to_string(sum.epilogueEvicted) +
             " intel entries forgotten");
  }
  say.line("Information is the true currency of survival.");

  return sum;
}

void writeSummaryJson(core::JsonWriter& j, core::u64 seed, const ScenarioSummary& s) {
  j.beginObject();
  j.key("seed"); j.value((unsigned long long)seed);
  j.key("finalTick"); j.value((long long)s.finalTick);
  j.key("sharedReliability"); j.value(s.sharedReliability);
  j.key("decayedReliability"); j.value(s.decayedReliability);
  j.key("trustAfterCooperation"); j.value(s.trustAfterCooperation);
  j.key("willingness"); j.value(s.willingness);
  j.key("rabbitHeartlandStrength"); j.value(s.rabbitHeartlandStrength);
  j.key("huntBonus"); j.value(s.huntBonus);
  j.key("detectionWithoutSentinel"); j.value(s.detectionWithoutSentinel);
  j.key("detectionWithSentinel"); j.value(s.detectionWithSentinel);
  j.key("missions");
  j.beginArray();
  for (const auto& r : s.missionResults) {
    j.beginObject();
    j.key("id"); j.value((unsigned long long)r.missionId.value);
    j.key("success"); j.value(r.success);
    j.key("narrative"); j.value(r.narrative);
    j.key("consequences");
    j.beginArray();
    for (const auto& c : r.consequences) j.value(toString(c.kind));
    j.endArray();
    j.endObject();
  }
  j.endArray();
  j.key("foxesKnowRabbitHeartland"); j.value(s.foxesKnowRabbitHeartland);
  j.key("wolfTrustInFoxes"); j.value(s.wolfTrustInFoxes);
  j.key("foxReputation"); j.value(s.foxReputation);
  j.key("foxBetrayals"); j.value((unsigned long long)s.foxBetrayals);
  j.key("foxFame"); j.value(s.foxFame);
  j.key("misinformationPlanted"); j.value(s.misinformationPlanted);
  j.key("epilogueEvicted"); j.value((unsigned long long)s.epilogueEvicted);
  j.endObject();
}

void printHelp() {
  std::cout << "fogline_sandbox\n"
            << "  --seed <u64>           Seed of the shared random source (default: world.seed)\n"
            << "  --ticks <n>            Extra ticks to advance after the scenario (default: 0)\n"
            << "  --config <path>        Load CVars from a config file\n"
            << "  --set <name=value>     Override a CVar (repeatable)\n"
            << "  --log <level>          trace|debug|info|warn|error|off\n"
            << "  --json                 Emit a JSON summary instead of the narrative\n"
            << "  --out <path>           Write output to a file ('-' means stdout)\n"
            << "  --list-cvars           Print all CVars and exit\n"
            << "  --save-config <path>   Write the effective CVars to a config file and exit\n";
}

} // namespace

int main(int argc, char** argv) {
  core::setLogLevel(core::LogLevel::Warn);

  core::Args args(argc, argv);
  if (args.hasFlag("help") || args.hasFlag("h")) {
    printHelp();
    return 0;
  }

  core::CVarRegistry& reg = core::cvars();
  core::installDefaultCVars(reg);
  installIntelCVars(reg);

  std::string error;
  std::string configPath;
  if (args.getString("config", configPath) && !reg.loadFile(configPath, &error)) {
    std::cerr << "fogline_sandbox: " << error << "\n";
    return 1;
  }
  for (const auto& assignment : args.values("set")) {
    if (!reg.applyAssignment(assignment, &error)) {
      std::cerr << "fogline_sandbox: " << error << "\n";
      return 1;
    }
  }

  std::string logLevel;
  if (args.getString("log", logLevel)) {
    core::LogLevel level = core::LogLevel::Warn;
    if (!core::parseLogLevel(logLevel, level)) {
      std::cerr << "fogline_sandbox: invalid log level '" << logLevel << "'\n";
      return 1;
    }
    core::setLogLevel(level);
  }

  if (args.hasFlag("list-cvars")) {
    for (const core::CVar* v : reg.list()) {
      std::cout << v->name << " = " << core::CVarRegistry::valueToString(*v) << "  (" << core::CVarRegistry::typeName(v->type)
                << ") " << v->help << "\n";
    }
    return 0;
  }

  std::string savePath;
  if (args.getString("save-config", savePath)) {
    if (!reg.saveFile(savePath, &error)) {
      std::cerr << "fogline_sandbox: " << error << "\n";
      return 1;
    }
    return 0;
  }

  WorldStateParams params = worldParamsFromCVars(reg);
  {
    unsigned long long s = 0;
    if (args.getU64("seed", s)) params.seed = (core::u64)s;
  }
  if (!validateWorldParams(params, &error)) {
    std::cerr << "fogline_sandbox: " << error << "\n";
    return 1;
  }

  long long ticks = 0;
  if (args.has("ticks") && (!args.getI64("ticks", ticks) || ticks < 0)) {
    std::cerr << "fogline_sandbox: --ticks expects a non-negative integer\n";
    return 1;
  }

  const bool json = args.hasFlag("json");
  std::string outPath;
  (void)args.getString("out", outPath);

  std::ofstream file;
  if (!outPath.empty() && outPath != "-") {
    file.open(outPath);
    if (!file) {
      std::cerr << "fogline_sandbox: cannot open " << outPath << " for writing\n";
      return 1;
    }
  }
  std::ostream& out = file.is_open() ? static_cast<std::ostream&>(file) : std::cout;

  WorldState ws(params);
  WorldDirectory dir;
  const Narrator say{out, json};

  FOGLINE_LOG_INFO("sandbox: seed " + std::to_string(params.seed));
  const ScenarioSummary summary = runScenario(ws, dir, say, (int)ticks);

  if (json) {
    core::JsonWriter j(out, true);
    writeSummaryJson(j, params.seed, summary);
  }
  return 0;
}
