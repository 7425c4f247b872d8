#include "AWidget.hpp"

#include <spdlog/spdlog.h>

namespace waywidgets {

AWidget::AWidget(const Json::Value& config, const std::string& name, std::ostream& out)
    : name_(name), config_(config), out_(out) {}

void AWidget::emit(const util::Payload& payload) { emit(payload.serialize()); }

void AWidget::emit(const std::string& line) { out_ << line << std::endl; }

std::vector<std::string> AWidget::getCommand(const std::string& key,
                                             const std::vector<std::string>& fallback) const {
  const auto& value = config_[key];
  if (value.isNull()) {
    return fallback;
  }
  std::vector<std::string> cmd;
  if (value.isArray() && !value.empty()) {
    for (const auto& arg : value) {
      if (!arg.isString()) {
        cmd.clear();
        break;
      }
      cmd.push_back(arg.asString());
    }
  }
  if (cmd.empty()) {
    spdlog::warn("{}: \"{}\" must be a non-empty array of strings, using the default", name_,
                 key);
    return fallback;
  }
  return cmd;
}

std::string AWidget::getString(const std::string& key, const std::string& fallback) const {
  if (config_[key].isString()) {
    return config_[key].asString();
  }
  if (!config_[key].isNull()) {
    spdlog::warn("{}: \"{}\" must be a string, using the default", name_, key);
  }
  return fallback;
}

int AWidget::getInt(const std::string& key, int fallback) const {
  if (config_[key].isInt()) {
    return config_[key].asInt();
  }
  if (!config_[key].isNull()) {
    spdlog::warn("{}: \"{}\" must be an integer, using the default", name_, key);
  }
  return fallback;
}

}  // namespace waywidgets
