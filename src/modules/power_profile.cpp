#include "modules/power_profile.hpp"

#include <spdlog/spdlog.h>

#include <map>
#include <utility>

namespace waywidgets::modules {

namespace {

const std::map<util::Profile, std::string> defaultIcons = {
    {util::Profile::BALANCED, "\uf24e"},
    {util::Profile::PERFORMANCE, "\uf0e7"},
    {util::Profile::QUIET, "\uf06c"},
};

}  // namespace

PowerProfile::PowerProfile(const Json::Value& config, std::ostream& out)
    : PowerProfile(config, out, nullptr, nullptr, nullptr) {
  backend_ = std::make_shared<util::AsusctlBackend>(
      getCommand("query-command", {"asusctl", "profile", "-p"}),
      getCommand("next-command", {"asusctl", "profile", "-n"}));
  notifier_ = std::make_shared<util::NotifySend>(getCommand("notify-command", {"notify-send"}));
  signaller_ = std::make_shared<util::ProcessSignaller>(getString("host-process", "waybar"),
                                                        getInt("signal", 8));
}

PowerProfile::PowerProfile(const Json::Value& config, std::ostream& out,
                           std::shared_ptr<util::ProfileBackend> backend,
                           std::shared_ptr<util::Notifier> notifier,
                           std::shared_ptr<util::HostSignaller> signaller)
    : AWidget(config, "power-profile", out),
      backend_(std::move(backend)),
      notifier_(std::move(notifier)),
      signaller_(std::move(signaller)),
      urgency_(getString("urgency", "low")),
      sync_key_(getString("sync-key", "sys-notify")) {}

auto PowerProfile::doAction(const std::string& name) -> void {
  auto profile = util::parseProfile(backend_->activeProfile());
  emit(status(profile));

  if (name == "next") {
    next();
  }
}

util::Payload PowerProfile::status(util::Profile profile) const {
  if (profile == util::Profile::UNKNOWN) {
    return {"", ""};
  }
  return {getIcon(profile), util::profileName(profile)};
}

std::string PowerProfile::getIcon(util::Profile profile) const {
  const auto& format_icons = config_["format-icons"];
  auto name = util::profileName(profile);
  if (format_icons.isObject() && format_icons[name].isString()) {
    return format_icons[name].asString();
  }
  auto it = defaultIcons.find(profile);
  return it != defaultIcons.end() ? it->second : "";
}

void PowerProfile::next() {
  if (!backend_->next()) {
    spdlog::warn("Power profile was not changed");
  }
  signaller_->refresh();

  // Name as reported, so an unrecognized profile still shows up in the popup
  auto current = backend_->activeProfile();
  notifier_->notify({fmt::format("{} Power Profile", current), "", urgency_, sync_key_});
}

}  // namespace waywidgets::modules
