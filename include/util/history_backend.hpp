#pragma once

#include <json/json.h>

#include <optional>
#include <string>
#include <vector>

namespace waywidgets::util {

struct NotificationRecord {
  std::string summary;
  std::string body;
  std::string app_icon;
};

class HistoryBackend {
 public:
  virtual ~HistoryBackend() = default;

  // Whether the daemon answers history requests at all
  virtual bool available() = 0;
  // Raw history document, std::nullopt when the daemon couldn't be queried
  virtual std::optional<std::string> fetch() = 0;
};

// mako history through makoctl. The document is a D-Bus dump:
// {"type": "aa{sv}", "data": [[{"summary": {"type": "s", "data": "..."}, ...}, ...]]}
class MakoBackend : public HistoryBackend {
 public:
  MakoBackend(std::vector<std::string> history_cmd, std::vector<std::string> probe_cmd);

  bool available() override;
  std::optional<std::string> fetch() override;

 private:
  const std::vector<std::string> history_cmd_;
  const std::vector<std::string> probe_cmd_;
};

// Number of records in `data[0]`; std::nullopt for malformed documents
std::optional<Json::ArrayIndex> historyLength(const std::string& raw);

// Records of `data[0]` in daemon order; std::nullopt for malformed documents
std::optional<std::vector<NotificationRecord>> parseHistory(const std::string& raw);

}  // namespace waywidgets::util
