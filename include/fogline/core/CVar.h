#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace fogline::core {

// Console variables: the named tuning knobs of a simulation run (sharing
// factors, decay rates, detection bounds, tick cadence, log level).
//
// Values are typed once at definition. Assignments that arrive before the
// variable is defined (config file, --set) are kept as pending text and parsed
// with the variable's type when it is defined.

enum class CVarType : std::uint8_t {
  Int    = 0,
  Float  = 1,
  String = 2
};

using CVarValue = std::variant<std::int64_t, double, std::string>;
using CVarListener = std::function<void(const struct CVar&)>;

struct CVar {
  std::string name;
  std::string help;
  CVarType type{CVarType::String};

  CVarValue value{};
  CVarValue defaultValue{};

  // Called after every successful change.
  std::vector<CVarListener> listeners;
};

class CVarRegistry {
public:
  CVarRegistry() = default;

  const CVar* find(std::string_view name) const;
  bool exists(std::string_view name) const { return find(name) != nullptr; }

  // Defining an existing name of the same type keeps its current value and
  // refreshes default/help; a type clash returns nullptr.
  CVar* defineInt(std::string_view name, std::int64_t defaultValue, std::string_view help = {});
  CVar* defineFloat(std::string_view name, double defaultValue, std::string_view help = {});
  CVar* defineString(std::string_view name, std::string defaultValue, std::string_view help = {});

  // Typed reads return `fallback` for unknown names or a type mismatch.
  std::int64_t getInt(std::string_view name, std::int64_t fallback = 0) const;
  double       getFloat(std::string_view name, double fallback = 0.0) const;

  bool setInt(std::string_view name, std::int64_t v, std::string* outError = nullptr);
  bool setFloat(std::string_view name, double v, std::string* outError = nullptr);

  // Parse `text` with the variable's type. Strings may be quoted.
  bool setFromString(std::string_view name, std::string_view text, std::string* outError = nullptr);

  // "name = value" or "name value". Unknown names become pending.
  bool applyAssignment(std::string_view assignment, std::string* outError = nullptr);

  bool addListener(std::string_view name, CVarListener cb, std::string* outError = nullptr);

  // Name-sorted. A non-empty prefix keeps only names starting with it.
  std::vector<const CVar*> list(std::string_view prefix = {}) const;

  bool hasPending(std::string_view name) const;

  static const char* typeName(CVarType t);
  static std::string valueToString(const CVar& v);

  // Config file: one assignment per line. '#' starts a comment outside quotes;
  // so does '//' at the start of a token. Every line is attempted; errors are
  // collected as "path:line: message" lines.
  //
  //   # detection tuning
  //   espionage.detection_max = 0.6
  //   log.level = "debug"   // quiet later
  bool loadFile(const std::string& path, std::string* outError = nullptr);

  // Writes every variable (help as a comment above it) plus pending
  // assignments, in a form loadFile() reads back unchanged.
  bool saveFile(const std::string& path, std::string* outError = nullptr) const;

private:
  CVar* defineImpl(std::string_view name, CVarType type, CVarValue def, std::string_view help);
  bool setValueImpl(std::string_view name, CVarValue v, std::string* outError);

  // Called with mutex_ held.
  void applyPendingLocked(CVar& var);

  mutable std::mutex mutex_;
  std::map<std::string, CVar, std::less<>> vars_;
  std::map<std::string, std::string, std::less<>> pending_;
};

// Process-wide registry used by the sandbox.
CVarRegistry& cvars();

// Defines log.level, wired to setLogLevel(). Safe to call repeatedly.
void installDefaultCVars(CVarRegistry& registry);
inline void installDefaultCVars() { installDefaultCVars(cvars()); }

} // namespace fogline::core
