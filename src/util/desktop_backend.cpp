#include "util/desktop_backend.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <utility>

#include "util/command.hpp"

namespace waywidgets::util {

NotifySend::NotifySend(std::vector<std::string> cmd) : cmd_(std::move(cmd)) {}

std::vector<std::string> NotifySend::buildArgs(const Notification& notification) const {
  auto args = cmd_;
  if (!notification.urgency.empty()) {
    args.emplace_back("-u");
    args.push_back(notification.urgency);
  }
  if (!notification.sync_key.empty()) {
    args.emplace_back("-h");
    args.push_back(fmt::format("string:{}:{}", SYNC_HINT, notification.sync_key));
  }
  args.push_back(notification.title);
  if (!notification.body.empty()) {
    args.push_back(notification.body);
  }
  return args;
}

bool NotifySend::notify(const Notification& notification) {
  auto args = buildArgs(notification);
  spdlog::debug("Notifying: {}", fmt::join(args, " "));
  auto res = command::execNoRead(args);
  if (res.exit_code != 0) {
    spdlog::error("'{}' failed with code {}", fmt::join(cmd_, " "), res.exit_code);
    return false;
  }
  return true;
}

DmenuPicker::DmenuPicker(std::vector<std::string> cmd) : cmd_(std::move(cmd)) {}

std::string DmenuPicker::pick(const std::string& lines) {
  auto res = command::exec(cmd_, lines);
  // dmenu pickers exit non-zero when dismissed
  if (res.exit_code != 0) {
    spdlog::debug("Picker exited with code {}", res.exit_code);
    return "";
  }
  return res.out;
}

}  // namespace waywidgets::util
