#pragma once

#include <optional>
#include <string>

namespace waywidgets::util {

// One status-bar update, as read by a waybar custom module with "return-type": "json"
struct Payload {
  std::string text;
  std::string tooltip;
  std::optional<std::string> alt;

  // {"text": "...", "tooltip": "..."[, "alt": "..."]} on a single line
  std::string serialize() const;

  friend bool operator==(const Payload& lhs, const Payload& rhs) {
    return lhs.text == rhs.text && lhs.tooltip == rhs.tooltip && lhs.alt == rhs.alt;
  }
};

}  // namespace waywidgets::util
