#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace waywidgets::util {

enum class Profile : std::uint8_t {
  BALANCED,
  PERFORMANCE,
  QUIET,
  UNKNOWN,
};

const std::map<std::string, Profile> profileNames = {
    {"Balanced", Profile::BALANCED},
    {"Performance", Profile::PERFORMANCE},
    {"Quiet", Profile::QUIET},
};

// Anything outside profileNames is UNKNOWN
Profile parseProfile(const std::string& name);
std::string profileName(Profile profile);

class ProfileBackend {
 public:
  virtual ~ProfileBackend() = default;

  // Name of the active profile as reported by the daemon, empty when it can't be read
  virtual std::string activeProfile() = 0;
  // Advance the daemon to its next profile. Returns false when the daemon refused.
  virtual bool next() = 0;
};

// asusctl-backed profiles: `asusctl profile -p` prints "Active profile is <Name>"
class AsusctlBackend : public ProfileBackend {
 public:
  static constexpr const char* ACTIVE_PREFIX = "Active profile is ";

  AsusctlBackend(std::vector<std::string> query_cmd, std::vector<std::string> next_cmd);

  std::string activeProfile() override;
  bool next() override;

  // Profile name announced in the query output, empty when no line announces one
  static std::string parseActiveProfile(const std::string& output);

 private:
  const std::vector<std::string> query_cmd_;
  const std::vector<std::string> next_cmd_;
};

}  // namespace waywidgets::util
