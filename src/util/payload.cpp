#include "util/payload.hpp"

#include <fmt/format.h>

#include "util/json.hpp"

namespace waywidgets::util {

std::string Payload::serialize() const {
  JsonWriter writer;
  // Json::Value would sort the keys, the bar expects text, tooltip, alt
  auto str =
      fmt::format(R"({{"text": {}, "tooltip": {})", writer.quote(text), writer.quote(tooltip));
  if (alt) {
    str += fmt::format(R"(, "alt": {})", writer.quote(*alt));
  }
  str += '}';
  return str;
}

}  // namespace waywidgets::util
