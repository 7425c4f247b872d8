#pragma once

#include <fmt/format.h>

#include <memory>
#include <ostream>
#include <string>

#include "AWidget.hpp"
#include "util/desktop_backend.hpp"
#include "util/kill_signal.hpp"
#include "util/profile_backend.hpp"

namespace waywidgets::modules {

class PowerProfile : public AWidget {
 public:
  // Talks to asusctl, notify-send and the bar as configured
  PowerProfile(const Json::Value&, std::ostream&);
  PowerProfile(const Json::Value&, std::ostream&, std::shared_ptr<util::ProfileBackend>,
               std::shared_ptr<util::Notifier>, std::shared_ptr<util::HostSignaller>);

  // "next" advances the profile after printing the current one; anything else only prints
  auto doAction(const std::string& name) -> void override;

  util::Payload status(util::Profile profile) const;

 private:
  void next();
  std::string getIcon(util::Profile profile) const;

  std::shared_ptr<util::ProfileBackend> backend_;
  std::shared_ptr<util::Notifier> notifier_;
  std::shared_ptr<util::HostSignaller> signaller_;
  // Notification hints for the profile change popup
  const std::string urgency_;
  const std::string sync_key_;
};

}  // namespace waywidgets::modules
