#include "util/profile_backend.hpp"

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <utility>

#include "util/command.hpp"
#include "util/enum.hpp"
#include "util/string.hpp"

namespace waywidgets::util {

Profile parseProfile(const std::string& name) {
  try {
    return EnumParser<Profile>().parseStringToEnum(name, profileNames);
  } catch (const std::invalid_argument& e) {
    spdlog::debug("Unrecognized power profile '{}'", name);
    return Profile::UNKNOWN;
  }
}

std::string profileName(Profile profile) {
  return EnumParser<Profile>().enumToString(profile, profileNames);
}

AsusctlBackend::AsusctlBackend(std::vector<std::string> query_cmd,
                               std::vector<std::string> next_cmd)
    : query_cmd_(std::move(query_cmd)), next_cmd_(std::move(next_cmd)) {}

std::string AsusctlBackend::activeProfile() {
  auto res = command::exec(query_cmd_);
  if (res.exit_code != 0) {
    spdlog::warn("Profile query '{}' failed with code {}", fmt::join(query_cmd_, " "),
                 res.exit_code);
  }
  // The output is parsed even on failure, asusctl may still have announced the profile
  return parseActiveProfile(res.out);
}

bool AsusctlBackend::next() {
  auto res = command::execNoRead(next_cmd_);
  if (res.exit_code != 0) {
    spdlog::error("Switching to the next profile with '{}' failed with code {}",
                  fmt::join(next_cmd_, " "), res.exit_code);
    return false;
  }
  return true;
}

std::string AsusctlBackend::parseActiveProfile(const std::string& output) {
  for (const auto& line : split(output, "\n")) {
    auto pos = line.find(ACTIVE_PREFIX);
    if (pos != std::string::npos) {
      return trim(line.substr(pos + std::char_traits<char>::length(ACTIVE_PREFIX)));
    }
  }
  return "";
}

}  // namespace waywidgets::util
