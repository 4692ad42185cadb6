#pragma once

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace fogline::core {

// Minimal streaming JSON writer for headless tool output.
//
// Usage:
//   JsonWriter j(std::cout, true);
//   j.beginObject();
//   j.key("seed"); j.value(1337ull);
//   j.endObject();
//
// Commas and indentation are handled by the writer; callers only need to
// balance begin/end calls and pair every key() with one value.
class JsonWriter {
public:
  explicit JsonWriter(std::ostream& out, bool pretty = true) : out_(out), pretty_(pretty) {}

  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  void key(std::string_view k);

  void value(std::string_view s);
  void value(const char* s) { value(std::string_view(s ? s : "")); }
  void value(bool b);
  void value(int v);
  void value(long long v);
  void value(unsigned long long v);
  void value(double v);
  void nullValue();

private:
  struct Frame {
    bool isObject{false};
    int count{0};
  };

  void beforeValue();
  void newlineIndent();
  void writeEscaped(std::string_view s);

  std::ostream& out_;
  bool pretty_{true};
  bool afterKey_{false};
  std::vector<Frame> stack_;
};

} // namespace fogline::core
