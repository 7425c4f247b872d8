#pragma once

#include <json/json.h>

#include <optional>
#include <string>
#include <vector>

#ifndef SYSCONFDIR
#define SYSCONFDIR "/etc"
#endif

namespace waywidgets {

class Config {
 public:
  static const std::vector<std::string> CONFIG_DIRS;
  static const char *CONFIG_PATH_ENV;

  /* Try to find any of provided names in the supported set of config directories */
  static std::optional<std::string> findConfigPath(
      const std::vector<std::string> &names, const std::vector<std::string> &dirs = CONFIG_DIRS);

  static std::vector<std::string> tryExpandPath(const std::string &base,
                                                const std::string &filename);

  Config() = default;

  /* Loads the given file, or the first config found in CONFIG_DIRS when empty.
   * Finding nothing leaves an empty config; widgets then run on their defaults. */
  void load(const std::string &config);

  Json::Value &getConfig() { return config_; }

  /* Section of one widget, e.g. "power-profile"; an empty object when absent */
  Json::Value getWidgetConfig(const std::string &name) const;

 private:
  void setupConfig(Json::Value &dst, const std::string &config_file, int depth);
  void resolveConfigIncludes(Json::Value &config, int depth);
  void mergeConfig(Json::Value &a_config_, Json::Value &b_config_);

  std::string config_file_;

  Json::Value config_;
};
}  // namespace waywidgets
