#include "factory.hpp"

#include <fmt/format.h>

#include <stdexcept>

#include "modules/notification_history.hpp"
#include "modules/power_profile.hpp"

waywidgets::Factory::Factory(const Config& config, std::ostream& out)
    : config_(config), out_(out) {}

waywidgets::AWidget* waywidgets::Factory::makeWidget(const std::string& name) const {
  try {
    if (name == "power-profile") {
      return new waywidgets::modules::PowerProfile(config_.getWidgetConfig(name), out_);
    }
    if (name == "notification-history") {
      return new waywidgets::modules::NotificationHistory(config_.getWidgetConfig(name), out_);
    }
  } catch (const std::exception& e) {
    auto err = fmt::format("Disabling widget \"{}\", {}", name, e.what());
    throw std::runtime_error(err);
  }
  throw std::runtime_error("Unknown widget: " + name);
}
