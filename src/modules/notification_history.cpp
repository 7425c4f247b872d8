#include "modules/notification_history.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

#include "util/command.hpp"
#include "util/string.hpp"

namespace waywidgets::modules {

namespace {

const std::vector<std::string> defaultPicker = {
    "wofi",     "--dmenu", "--prompt",       "Notification History", "--width", "600",
    "--height", "400",     "--allow-images", "--cache-file",         "/dev/null"};

std::shared_ptr<spdlog::logger> makeTraceLogger() {
  auto logger = std::make_shared<spdlog::logger>(
      "notification-history", std::make_shared<spdlog::sinks::stderr_color_sink_st>());
  // Not registered, so --log-level leaves it alone
  logger->set_level(spdlog::level::trace);
  return logger;
}

}  // namespace

NotificationHistory::NotificationHistory(const Json::Value& config, std::ostream& out)
    : NotificationHistory(config, out, nullptr, nullptr, nullptr, makeTraceLogger()) {
  history_ = std::make_shared<util::MakoBackend>(
      getCommand("history-command", {"makoctl", "history"}),
      getCommand("probe-command", {"makoctl", "history"}));
  picker_ = std::make_shared<util::DmenuPicker>(getCommand("picker-command", defaultPicker));
  notifier_ = std::make_shared<util::NotifySend>(getCommand("notify-command", {"notify-send"}));
}

NotificationHistory::NotificationHistory(const Json::Value& config, std::ostream& out,
                                         std::shared_ptr<util::HistoryBackend> history,
                                         std::shared_ptr<util::Picker> picker,
                                         std::shared_ptr<util::Notifier> notifier,
                                         std::shared_ptr<spdlog::logger> trace)
    : AWidget(config, "notification-history", out),
      history_(std::move(history)),
      picker_(std::move(picker)),
      notifier_(std::move(notifier)),
      trace_(std::move(trace)),
      tooltip_limit_(std::max(getInt("tooltip-limit", 5), 0)) {}

auto NotificationHistory::doAction(const std::string& name) -> void {
  if (name == "count") {
    count();
  } else if (name == "tooltip") {
    tooltip();
  } else if (name == "show") {
    show();
  } else {
    spdlog::debug("{}: ignoring unknown action '{}'", name_, name);
  }
}

void NotificationHistory::count() {
  const util::Payload empty{"", "No notification history", "none"};
  if (!history_->available()) {
    emit(empty);
    return;
  }

  std::optional<Json::ArrayIndex> length;
  if (auto raw = history_->fetch()) {
    length = util::historyLength(*raw);
  }
  if (!length || *length == 0) {
    emit(empty);
    return;
  }
  emit(util::Payload{std::to_string(*length),
                     fmt::format("{} notifications in history", *length), "notification"});
}

void NotificationHistory::tooltip() {
  std::vector<std::string> summaries;
  if (auto raw = history_->fetch()) {
    if (auto records = util::parseHistory(*raw)) {
      for (const auto& record : *records) {
        if (summaries.size() >= static_cast<size_t>(tooltip_limit_)) break;
        summaries.push_back(record.summary);
      }
    }
  }
  // A literal backslash-n, the bar turns it into a line break inside the tooltip
  emit(fmt::format("{}", fmt::join(summaries, "\\n")));
}

void NotificationHistory::show() {
  if (!history_->available()) {
    notifyEmpty();
    return;
  }

  auto raw = history_->fetch();
  trace_->info("History: {}", raw.value_or(""));

  std::vector<util::NotificationRecord> records;
  if (raw) {
    if (auto parsed = util::parseHistory(*raw)) {
      records = std::move(*parsed);
    }
  }
  if (records.empty()) {
    notifyEmpty();
    return;
  }

  auto input = pickerInput(records);
  trace_->info("Picker input: {}", input);

  auto selection = picker_->pick(input);
  if (selection.empty()) {
    spdlog::debug("{}: nothing picked", name_);
    return;
  }

  auto summary = selectedSummary(selection);
  auto it = std::find_if(records.begin(), records.end(),
                         [&summary](const auto& record) { return record.summary == summary; });
  if (it == records.end()) {
    spdlog::warn("{}: no notification with summary '{}'", name_, summary);
  }
  std::string body =
      it != records.end() && !it->body.empty() ? it->body : std::string(NO_DETAILS);
  notifier_->notify({"History Notification", body, "", ""});
}

void NotificationHistory::notifyEmpty() {
  notifier_->notify({"No History", "Your notification history is empty", "", ""});
}

std::string NotificationHistory::pickerInput(
    const std::vector<util::NotificationRecord>& records) {
  std::string input;
  for (const auto& record : records) {
    input += fmt::format("{}\t{}\n", record.app_icon, record.summary);
  }
  return input;
}

std::string NotificationHistory::selectedSummary(const std::string& selection) {
  return util::stripThrough(util::command::chomp(selection), '\t');
}

}  // namespace waywidgets::modules
