#pragma once

#include <json/json.h>

#include <ostream>
#include <string>
#include <vector>

#include "interfaces/IWidget.hpp"
#include "util/payload.hpp"

namespace waywidgets {

class AWidget : public IWidget {
 public:
  ~AWidget() override = default;

  const std::string& name() const { return name_; }

 protected:
  // Don't need to make an object directly
  // Derived classes are able to use it
  AWidget(const Json::Value& config, const std::string& name, std::ostream& out);

  // Writes one line for the bar and flushes it
  void emit(const util::Payload& payload);
  void emit(const std::string& line);

  std::vector<std::string> getCommand(const std::string& key,
                                      const std::vector<std::string>& fallback) const;
  std::string getString(const std::string& key, const std::string& fallback) const;
  int getInt(const std::string& key, int fallback) const;

  const std::string name_;
  const Json::Value config_;
  std::ostream& out_;
};

}  // namespace waywidgets
