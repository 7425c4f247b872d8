#pragma once

#include <fmt/ostream.h>
#include <json/json.h>

#include <memory>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>

#if (FMT_VERSION >= 90000)

template <>
struct fmt::formatter<Json::Value> : ostream_formatter {};

#endif

namespace waywidgets::util {

class JsonParser {
 public:
  // `hexEscapes` accepts the "\x" escapes found in hand-written config files. Leave it off for
  // documents produced by other programs, where "\\x" is literal text.
  explicit JsonParser(bool hexEscapes = true) : m_hexEscapes(hexEscapes) {
    m_readerBuilder["allowComments"] = true;
  }

  Json::Value parse(const std::string& jsonStr) {
    Json::Value root;

    // replace all occurrences of "\x" with "\u00", because JSON doesn't allow "\x" escape sequences
    std::istringstream jsonStream(m_hexEscapes ? replaceHexadecimalEscape(jsonStr) : jsonStr);
    std::string errs;
    if (!Json::parseFromStream(m_readerBuilder, jsonStream, &root, &errs)) {
      throw std::runtime_error("Error parsing JSON: " + errs);
    }
    return root;
  }

 private:
  Json::CharReaderBuilder m_readerBuilder;
  bool m_hexEscapes;

  static std::string replaceHexadecimalEscape(const std::string& str) {
    static std::regex re("\\\\x");
    return std::regex_replace(str, re, "\\u00");
  }
};

// Single-line writer; non-ASCII text is kept as raw UTF-8 so bar glyphs stay readable
class JsonWriter {
 public:
  JsonWriter() {
    m_writerBuilder["indentation"] = "";
    m_writerBuilder["emitUTF8"] = true;
  }

  std::string write(const Json::Value& value) const {
    return Json::writeString(m_writerBuilder, value);
  }

  std::string quote(const std::string& str) const { return write(Json::Value(str)); }

 private:
  Json::StreamWriterBuilder m_writerBuilder;
};

}  // namespace waywidgets::util
