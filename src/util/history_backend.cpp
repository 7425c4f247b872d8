#include "util/history_backend.hpp"

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <utility>

#include "util/command.hpp"
#include "util/json.hpp"

namespace waywidgets::util {

namespace {

// `data[0]` of the history document, a null value when the document doesn't have one
Json::Value historyRecords(const std::string& raw) {
  Json::Value root;
  try {
    root = JsonParser(false).parse(raw);
  } catch (const std::runtime_error& e) {
    spdlog::warn("Unable to parse notification history: {}", e.what());
    return Json::Value::nullSingleton();
  }
  if (!root.isObject() || !root["data"].isArray() || root["data"].empty() ||
      !root["data"][0].isArray()) {
    spdlog::warn("Unexpected notification history layout");
    return Json::Value::nullSingleton();
  }
  return root["data"][0];
}

std::string fieldData(const Json::Value& record, const char* key) {
  const auto& field = record[key];
  if (field.isObject() && field["data"].isString()) {
    return field["data"].asString();
  }
  return "";
}

}  // namespace

MakoBackend::MakoBackend(std::vector<std::string> history_cmd, std::vector<std::string> probe_cmd)
    : history_cmd_(std::move(history_cmd)), probe_cmd_(std::move(probe_cmd)) {}

bool MakoBackend::available() {
  auto res = command::execNoRead(probe_cmd_);
  if (res.exit_code != 0) {
    spdlog::debug("History probe '{}' exited with {}", fmt::join(probe_cmd_, " "), res.exit_code);
    return false;
  }
  return true;
}

std::optional<std::string> MakoBackend::fetch() {
  auto res = command::exec(history_cmd_);
  if (res.exit_code != 0) {
    spdlog::warn("History query '{}' failed with code {}", fmt::join(history_cmd_, " "),
                 res.exit_code);
    return std::nullopt;
  }
  return res.out;
}

std::optional<Json::ArrayIndex> historyLength(const std::string& raw) {
  auto records = historyRecords(raw);
  if (records.isNull()) {
    return std::nullopt;
  }
  return records.size();
}

std::optional<std::vector<NotificationRecord>> parseHistory(const std::string& raw) {
  auto records = historyRecords(raw);
  if (records.isNull()) {
    return std::nullopt;
  }
  std::vector<NotificationRecord> result;
  result.reserve(records.size());
  for (const auto& record : records) {
    if (!record.isObject()) {
      continue;
    }
    result.push_back({fieldData(record, "summary"), fieldData(record, "body"),
                      fieldData(record, "app-icon")});
  }
  return result;
}

}  // namespace waywidgets::util
