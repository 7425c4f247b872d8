#pragma once

#include <json/json.h>

#include <ostream>
#include <string>

#include "AWidget.hpp"
#include "config.hpp"

namespace waywidgets {

class Factory {
 public:
  Factory(const Config& config, std::ostream& out);
  AWidget* makeWidget(const std::string& name) const;

 private:
  const Config& config_;
  std::ostream& out_;
};

}  // namespace waywidgets
