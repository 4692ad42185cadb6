#include "fogline/core/JsonWriter.h"

#include <cmath>
#include <cstdio>

namespace fogline::core {

void JsonWriter::newlineIndent() {
  if (!pretty_) return;
  out_ << '\n';
  for (std::size_t i = 0; i < stack_.size(); ++i) out_ << "  ";
}

void JsonWriter::beforeValue() {
  if (afterKey_) {
    afterKey_ = false;
    return;
  }
  if (stack_.empty()) return;

  Frame& f = stack_.back();
  if (f.count > 0) out_ << ',';
  ++f.count;
  newlineIndent();
}

void JsonWriter::writeEscaped(std::string_view s) {
  out_ << '"';
  for (char c : s) {
    switch (c) {
      case '"': out_ << "\\\""; break;
      case '\\': out_ << "\\\\"; break;
      case '\n': out_ << "\\n"; break;
      case '\r': out_ << "\\r"; break;
      case '\t': out_ << "\\t"; break;
      default:
        if ((unsigned char)c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", (unsigned)(unsigned char)c);
          out_ << buf;
        } else {
          out_ << c;
        }
        break;
    }
  }
  out_ << '"';
}

void JsonWriter::beginObject() {
  beforeValue();
  out_ << '{';
  stack_.push_back(Frame{true, 0});
}

void JsonWriter::endObject() {
  const bool hadItems = !stack_.empty() && stack_.back().count > 0;
  if (!stack_.empty()) stack_.pop_back();
  if (hadItems) newlineIndent();
  out_ << '}';
  if (stack_.empty() && pretty_) out_ << '\n';
}

void JsonWriter::beginArray() {
  beforeValue();
  out_ << '[';
  stack_.push_back(Frame{false, 0});
}

void JsonWriter::endArray() {
  const bool hadItems = !stack_.empty() && stack_.back().count > 0;
  if (!stack_.empty()) stack_.pop_back();
  if (hadItems) newlineIndent();
  out_ << ']';
  if (stack_.empty() && pretty_) out_ << '\n';
}

void JsonWriter::key(std::string_view k) {
  beforeValue();
  writeEscaped(k);
  out_ << (pretty_ ? ": " : ":");
  afterKey_ = true;
}

void JsonWriter::value(std::string_view s) {
  beforeValue();
  writeEscaped(s);
}

void JsonWriter::value(bool b) {
  beforeValue();
  out_ << (b ? "true" : "false");
}

void JsonWriter::value(int v) {
  beforeValue();
  out_ << v;
}

void JsonWriter::value(long long v) {
  beforeValue();
  out_ << v;
}

void JsonWriter::value(unsigned long long v) {
  beforeValue();
  out_ << v;
}

void JsonWriter::value(double v) {
  beforeValue();
  // JSON has no NaN/Inf.
  if (!std::isfinite(v)) {
    out_ << "null";
    return;
  }
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.10g", v);
  out_ << buf;
}

void JsonWriter::nullValue() {
  beforeValue();
  out_ << "null";
}

} // namespace fogline::core
