#pragma once

#include <string>

namespace waywidgets {

class IWidget {
 public:
  virtual ~IWidget() = default;
  // Runs one invocation for the action given on the command line (may be empty)
  virtual auto doAction(const std::string& name) -> void = 0;
};

}  // namespace waywidgets
