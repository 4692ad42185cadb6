#include "fogline/core/CVar.h"

#include "fogline/core/Log.h"

#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>

namespace fogline::core {

namespace {

bool isSpace(char c) { return std::isspace((unsigned char)c) != 0; }

std::string_view trim(std::string_view s) {
  while (!s.empty() && isSpace(s.front())) s.remove_prefix(1);
  while (!s.empty() && isSpace(s.back())) s.remove_suffix(1);
  return s;
}

// A quote or '//' only counts when it opens a token: "O'Reilly" and
// "http://x" stay literal.
bool atTokenStart(std::string_view s, std::size_t i) {
  return i == 0 || isSpace(s[i - 1]) || s[i - 1] == '=';
}

std::string_view stripComment(std::string_view line) {
  char quote = 0;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quote != 0) {
      if (c == '\\' && i + 1 < line.size()) {
        ++i;
      } else if (c == quote) {
        quote = 0;
      }
      continue;
    }
    if ((c == '"' || c == '\'') && atTokenStart(line, i)) {
      quote = c;
    } else if (c == '#') {
      return trim(line.substr(0, i));
    } else if (c == '/' && i + 1 < line.size() && line[i + 1] == '/' && atTokenStart(line, i)) {
      return trim(line.substr(0, i));
    }
  }
  return trim(line);
}

// "name = value" or "name value".
bool splitAssignment(std::string_view text, std::string_view& name, std::string_view& value) {
  text = trim(text);
  std::size_t end = 0;
  while (end < text.size() && !isSpace(text[end]) && text[end] != '=') ++end;
  name = text.substr(0, end);

  std::string_view rest = trim(text.substr(end));
  if (!rest.empty() && rest.front() == '=') {
    rest = trim(rest.substr(1));
  } else if (rest.empty()) {
    return false;
  }
  value = rest;
  return !name.empty();
}

std::string unquote(std::string_view s) {
  s = trim(s);
  if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
    s = s.substr(1, s.size() - 2);
  } else {
    return std::string(s);
  }

  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] != '\\' || i + 1 == s.size()) {
      out.push_back(s[i]);
      continue;
    }
    const char n = s[++i];
    switch (n) {
      case 'n': out.push_back('\n'); break;
      case 't': out.push_back('\t'); break;
      default: out.push_back(n); break;
    }
  }
  return out;
}

std::string quote(std::string_view s) {
  bool plain = !s.empty();
  for (char c : s) {
    if (isSpace(c) || c == '#' || c == '/' || c == '=' || c == '"' || c == '\'' || c == '\\') {
      plain = false;
      break;
    }
  }
  if (plain) return std::string(s);

  std::string out = "\"";
  for (char c : s) {
    if (c == '"' || c == '\\') {
      out.push_back('\\');
      out.push_back(c);
    } else if (c == '\n') {
      out += "\\n";
    } else if (c == '\t') {
      out += "\\t";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('"');
  return out;
}

bool parseAs(CVarType type, std::string_view text, CVarValue& out, std::string* outError) {
  const std::string_view t = trim(text);
  switch (type) {
    case CVarType::Int: {
      std::int64_t v = 0;
      const auto res = std::from_chars(t.data(), t.data() + t.size(), v);
      if (t.empty() || res.ec != std::errc{} || res.ptr != t.data() + t.size()) break;
      out = v;
      return true;
    }
    case CVarType::Float: {
      double v = 0.0;
      const auto res = std::from_chars(t.data(), t.data() + t.size(), v);
      if (t.empty() || res.ec != std::errc{} || res.ptr != t.data() + t.size()) break;
      out = v;
      return true;
    }
    case CVarType::String:
      out = unquote(t);
      return true;
  }
  if (outError) *outError = std::string("Invalid ") + CVarRegistry::typeName(type) + ": '" + std::string(t) + "'";
  return false;
}

} // namespace

const CVar* CVarRegistry::find(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  return (it != vars_.end()) ? &it->second : nullptr;
}

CVar* CVarRegistry::defineImpl(std::string_view name, CVarType type, CVarValue def, std::string_view help) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = vars_.find(name);
  if (it == vars_.end()) {
    CVar v;
    v.name = std::string(name);
    v.type = type;
    v.value = def;
    it = vars_.emplace(v.name, std::move(v)).first;
  } else if (it->second.type != type) {
    return nullptr;
  }

  CVar& var = it->second;
  var.defaultValue = std::move(def);
  if (!help.empty()) var.help = std::string(help);
  applyPendingLocked(var);
  return &var;
}

CVar* CVarRegistry::defineInt(std::string_view name, std::int64_t defaultValue, std::string_view help) {
  return defineImpl(name, CVarType::Int, CVarValue{defaultValue}, help);
}

CVar* CVarRegistry::defineFloat(std::string_view name, double defaultValue, std::string_view help) {
  return defineImpl(name, CVarType::Float, CVarValue{defaultValue}, help);
}

CVar* CVarRegistry::defineString(std::string_view name, std::string defaultValue, std::string_view help) {
  return defineImpl(name, CVarType::String, CVarValue{std::move(defaultValue)}, help);
}

std::int64_t CVarRegistry::getInt(std::string_view name, std::int64_t fallback) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  if (it == vars_.end()) return fallback;
  const auto* v = std::get_if<std::int64_t>(&it->second.value);
  return v ? *v : fallback;
}

double CVarRegistry::getFloat(std::string_view name, double fallback) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  if (it == vars_.end()) return fallback;
  const auto* v = std::get_if<double>(&it->second.value);
  return v ? *v : fallback;
}

bool CVarRegistry::setValueImpl(std::string_view name, CVarValue v, std::string* outError) {
  std::vector<CVarListener> listeners;
  CVar snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = vars_.find(name);
    if (it == vars_.end()) {
      if (outError) *outError = "Unknown cvar: " + std::string(name);
      return false;
    }
    if (v.index() != (std::size_t)it->second.type) {
      if (outError) *outError = "Type mismatch for cvar: " + it->second.name;
      return false;
    }
    it->second.value = std::move(v);
    listeners = it->second.listeners;
    snapshot.name = it->second.name;
    snapshot.type = it->second.type;
    snapshot.value = it->second.value;
  }

  // Listeners run unlocked so they may read the registry.
  for (const auto& cb : listeners) {
    if (cb) cb(snapshot);
  }
  return true;
}

bool CVarRegistry::setInt(std::string_view name, std::int64_t v, std::string* outError) {
  return setValueImpl(name, CVarValue{v}, outError);
}

bool CVarRegistry::setFloat(std::string_view name, double v, std::string* outError) {
  return setValueImpl(name, CVarValue{v}, outError);
}

bool CVarRegistry::setFromString(std::string_view name, std::string_view text, std::string* outError) {
  CVarType type = CVarType::String;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = vars_.find(name);
    if (it == vars_.end()) {
      if (outError) *outError = "Unknown cvar: " + std::string(name);
      return false;
    }
    type = it->second.type;
  }

  CVarValue parsed;
  if (!parseAs(type, text, parsed, outError)) {
    if (outError) *outError = std::string(name) + ": " + *outError;
    return false;
  }
  return setValueImpl(name, std::move(parsed), outError);
}

bool CVarRegistry::applyAssignment(std::string_view assignment, std::string* outError) {
  std::string_view name;
  std::string_view value;
  if (!splitAssignment(assignment, name, value)) {
    if (outError) *outError = "Expected name=value, got: " + std::string(assignment);
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (vars_.find(name) == vars_.end()) {
      pending_[std::string(name)] = std::string(value);
      return true;
    }
  }
  return setFromString(name, value, outError);
}

bool CVarRegistry::addListener(std::string_view name, CVarListener cb, std::string* outError) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = vars_.find(name);
  if (it == vars_.end()) {
    if (outError) *outError = "Unknown cvar: " + std::string(name);
    return false;
  }
  it->second.listeners.push_back(std::move(cb));
  return true;
}

std::vector<const CVar*> CVarRegistry::list(std::string_view prefix) const {
  std::vector<const CVar*> out;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& kv : vars_) {
    if (std::string_view(kv.first).substr(0, prefix.size()) != prefix) continue;
    out.push_back(&kv.second);
  }
  return out;
}

bool CVarRegistry::hasPending(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.find(name) != pending_.end();
}

const char* CVarRegistry::typeName(CVarType t) {
  switch (t) {
    case CVarType::Int: return "int";
    case CVarType::Float: return "float";
    case CVarType::String: return "string";
  }
  return "?";
}

std::string CVarRegistry::valueToString(const CVar& v) {
  if (const auto* i = std::get_if<std::int64_t>(&v.value)) return std::to_string(*i);
  if (const auto* f = std::get_if<double>(&v.value)) {
    // Shortest text that parses back to the same double.
    char buf[32];
    const auto res = std::to_chars(buf, buf + sizeof(buf), *f);
    return std::string(buf, res.ptr);
  }
  return std::get<std::string>(v.value);
}

void CVarRegistry::applyPendingLocked(CVar& var) {
  const auto it = pending_.find(var.name);
  if (it == pending_.end()) return;

  const std::string text = it->second;
  pending_.erase(it);

  CVarValue parsed;
  std::string err;
  if (!parseAs(var.type, text, parsed, &err)) {
    FOGLINE_LOG_WARN("cvar " + var.name + ": dropping pending assignment (" + err + ")");
    return;
  }
  var.value = std::move(parsed);
}

bool CVarRegistry::loadFile(const std::string& path, std::string* outError) {
  std::ifstream in(path);
  if (!in) {
    if (outError) *outError = "Failed to open cvar file: " + path;
    return false;
  }

  std::ostringstream errs;
  std::string line;
  int lineNo = 0;
  while (std::getline(in, line)) {
    ++lineNo;
    const std::string_view body = stripComment(line);
    if (body.empty()) continue;

    std::string err;
    if (!applyAssignment(body, &err)) errs << path << ":" << lineNo << ": " << err << "\n";
  }

  const std::string all = errs.str();
  if (!all.empty() && outError) *outError = all;
  return all.empty();
}

bool CVarRegistry::saveFile(const std::string& path, std::string* outError) const {
  std::ofstream out(path);
  if (!out) {
    if (outError) *outError = "Failed to write cvar file: " + path;
    return false;
  }

  out << "# fogline cvars\n";

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& kv : vars_) {
    const CVar& v = kv.second;
    out << "\n";
    if (!v.help.empty()) out << "# " << v.help << "\n";
    out << v.name << " = " << (v.type == CVarType::String ? quote(std::get<std::string>(v.value)) : valueToString(v))
        << "\n";
  }

  // Pending text is already in file syntax.
  if (!pending_.empty()) {
    out << "\n# not defined by this build\n";
    for (const auto& kv : pending_) out << kv.first << " = " << kv.second << "\n";
  }

  if (!out) {
    if (outError) *outError = "Failed to write cvar file: " + path;
    return false;
  }
  return true;
}

CVarRegistry& cvars() {
  static CVarRegistry g;
  return g;
}

void installDefaultCVars(CVarRegistry& registry) {
  if (registry.exists("log.level")) return;

  std::string initial(toString(getLogLevel()));
  for (char& c : initial) c = (char)std::tolower((unsigned char)c);

  if (!registry.defineString("log.level", initial, "Global log level: trace|debug|info|warn|error|off")) return;

  registry.addListener("log.level", [](const CVar& cv) {
    LogLevel level = LogLevel::Info;
    if (!parseLogLevel(std::get<std::string>(cv.value), level)) {
      FOGLINE_LOG_WARN("cvar log.level: expected trace|debug|info|warn|error|off");
      return;
    }
    setLogLevel(level);
  });
}

} // namespace fogline::core
