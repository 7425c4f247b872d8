#pragma once

#include <spdlog/logger.h>

#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "AWidget.hpp"
#include "util/desktop_backend.hpp"
#include "util/history_backend.hpp"

namespace waywidgets::modules {

class NotificationHistory : public AWidget {
 public:
  static constexpr const char* NO_DETAILS = "No additional details available";

  // Talks to makoctl, wofi and notify-send as configured
  NotificationHistory(const Json::Value&, std::ostream&);
  NotificationHistory(const Json::Value&, std::ostream&, std::shared_ptr<util::HistoryBackend>,
                      std::shared_ptr<util::Picker>, std::shared_ptr<util::Notifier>,
                      std::shared_ptr<spdlog::logger> trace);

  // count, tooltip or show; other actions print nothing
  auto doAction(const std::string& name) -> void override;

  // "<app_icon>\t<summary>\n" for every record
  static std::string pickerInput(const std::vector<util::NotificationRecord>& records);
  // Summary part of a picked "<app_icon>\t<summary>" line
  static std::string selectedSummary(const std::string& selection);

 private:
  void count();
  void tooltip();
  void show();
  void notifyEmpty();

  std::shared_ptr<util::HistoryBackend> history_;
  std::shared_ptr<util::Picker> picker_;
  std::shared_ptr<util::Notifier> notifier_;
  // Always-on dump of what show() fetched and offered to the picker
  std::shared_ptr<spdlog::logger> trace_;
  const int tooltip_limit_;
};

}  // namespace waywidgets::modules
