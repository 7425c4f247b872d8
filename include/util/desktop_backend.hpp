#pragma once

#include <string>
#include <vector>

namespace waywidgets::util {

struct Notification {
  std::string title;
  std::string body;
  // low, normal or critical; empty leaves it to the notification daemon
  std::string urgency;
  // x-canonical-private-synchronous key, notifications sharing it replace each other
  std::string sync_key;
};

class Notifier {
 public:
  virtual ~Notifier() = default;
  virtual bool notify(const Notification& notification) = 0;
};

// Sends notifications through notify-send
class NotifySend : public Notifier {
 public:
  static constexpr const char* SYNC_HINT = "x-canonical-private-synchronous";

  explicit NotifySend(std::vector<std::string> cmd);

  bool notify(const Notification& notification) override;

  std::vector<std::string> buildArgs(const Notification& notification) const;

 private:
  const std::vector<std::string> cmd_;
};

class Picker {
 public:
  virtual ~Picker() = default;
  // Shows `lines` and returns the chosen line, empty when nothing was picked
  virtual std::string pick(const std::string& lines) = 0;
};

// dmenu-style picker (wofi --dmenu, rofi -dmenu, fuzzel --dmenu...) reading choices on stdin
class DmenuPicker : public Picker {
 public:
  explicit DmenuPicker(std::vector<std::string> cmd);

  std::string pick(const std::string& lines) override;

 private:
  const std::vector<std::string> cmd_;
};

}  // namespace waywidgets::util
