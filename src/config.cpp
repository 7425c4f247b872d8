#include "config.hpp"

#include <spdlog/spdlog.h>
#include <unistd.h>
#include <wordexp.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>

#include "util/json.hpp"

namespace fs = std::filesystem;

namespace waywidgets {

namespace {

constexpr int MAX_INCLUDE_DEPTH = 100;

std::string readFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Can't open config file " + path);
  }
  return {std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
}

std::vector<std::string> includePaths(const Json::Value &include) {
  std::vector<std::string> paths;
  if (include.isString()) {
    paths.push_back(include.asString());
  } else if (include.isArray()) {
    for (const auto &path : include) {
      if (path.isString()) {
        paths.push_back(path.asString());
      } else {
        spdlog::warn("Ignoring include {}, it must be a path", path);
      }
    }
  }
  return paths;
}

}  // namespace

const std::vector<std::string> Config::CONFIG_DIRS = {
    "$XDG_CONFIG_HOME/waywidgets/",
    "$HOME/.config/waywidgets/",
    "/etc/xdg/waywidgets/",
    SYSCONFDIR "/xdg/waywidgets/",
};

const char *Config::CONFIG_PATH_ENV = "WAYWIDGETS_CONFIG_DIR";

std::vector<std::string> Config::tryExpandPath(const std::string &base,
                                               const std::string &filename) {
  auto pattern = filename.empty() ? fs::path(base) : fs::path(base) / filename;
  spdlog::debug("Try expanding: {}", pattern.string());

  std::vector<std::string> existing;
  wordexp_t words;
  // WRDE_NOCMD: a config path never runs a command substitution
  if (wordexp(pattern.c_str(), &words, WRDE_NOCMD) != 0) {
    return existing;
  }
  for (size_t i = 0; i < words.we_wordc; i++) {
    if (access(words.we_wordv[i], F_OK) == 0) {
      spdlog::debug("Found config file: {}", words.we_wordv[i]);
      existing.emplace_back(words.we_wordv[i]);
    }
  }
  wordfree(&words);
  return existing;
}

std::optional<std::string> Config::findConfigPath(const std::vector<std::string> &names,
                                                  const std::vector<std::string> &dirs) {
  std::vector<std::string> search = dirs;
  if (const char *env_dir = std::getenv(CONFIG_PATH_ENV)) {
    search.insert(search.begin(), env_dir);
  }
  for (const auto &dir : search) {
    for (const auto &name : names) {
      auto found = tryExpandPath(dir, name);
      if (!found.empty()) {
        return found.front();
      }
    }
  }
  return std::nullopt;
}

void Config::setupConfig(Json::Value &dst, const std::string &config_file, int depth) {
  if (depth > MAX_INCLUDE_DEPTH) {
    throw std::runtime_error("Aborting due to likely recursive include in config files");
  }
  auto parsed = util::JsonParser().parse(readFile(config_file));
  if (!parsed.isObject()) {
    throw std::runtime_error("Config file " + config_file + " must hold a JSON object");
  }
  resolveConfigIncludes(parsed, depth);
  mergeConfig(dst, parsed);
}

void Config::resolveConfigIncludes(Json::Value &config, int depth) {
  for (const auto &include : includePaths(config.get("include", Json::Value::nullSingleton()))) {
    spdlog::info("Including resource file: {}", include);
    for (const auto &match : tryExpandPath(include, "")) {
      setupConfig(config, match, depth + 1);
    }
  }
}

// Values already in `dst` win; objects present on both sides are merged key by key
void Config::mergeConfig(Json::Value &dst, Json::Value &src) {
  if (dst.isNull()) {
    dst = src;
    return;
  }
  if (!dst.isObject() || !src.isObject()) {
    spdlog::error("Cannot merge config, conflicting or invalid JSON types");
    return;
  }
  for (const auto &key : src.getMemberNames()) {
    if (!dst.isMember(key)) {
      dst[key] = src[key];
    } else if (dst[key].isObject() && src[key].isObject()) {
      mergeConfig(dst[key], src[key]);
    } else {
      // an explicit null counts as set too
      spdlog::trace("Option {} is already set; ignoring value {}", key, src[key]);
    }
  }
}

void Config::load(const std::string &config) {
  config_ = Json::Value(Json::objectValue);
  auto file = config.empty() ? findConfigPath({"config.jsonc", "config"}) : config;
  if (!file) {
    spdlog::info("No configuration file found, using defaults");
    return;
  }
  config_file_ = *file;
  spdlog::info("Using configuration file {}", config_file_);
  Json::Value loaded;
  setupConfig(loaded, config_file_, 0);
  config_ = loaded;
}

Json::Value Config::getWidgetConfig(const std::string &name) const {
  const auto &section = config_.isObject() ? config_[name] : Json::Value::nullSingleton();
  if (section.isObject()) {
    return section;
  }
  if (!section.isNull()) {
    spdlog::warn("Ignoring \"{}\" config, it must be an object", name);
  }
  return Json::Value(Json::objectValue);
}

}  // namespace waywidgets
