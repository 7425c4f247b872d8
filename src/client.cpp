#include "client.hpp"

#include <clara.hpp>
#include <spdlog/spdlog.h>

#include <memory>

#include "factory.hpp"

#ifndef VERSION
#define VERSION "unknown"
#endif

waywidgets::Client *waywidgets::Client::inst() {
  static auto *c = new Client();
  return c;
}

void waywidgets::Client::loadConfig(const std::string &config_opt) {
  try {
    config.load(config_opt);
  } catch (const std::exception &e) {
    spdlog::error("Unable to load config, using defaults: {}", e.what());
    config.getConfig() = Json::Value(Json::objectValue);
  }
}

int waywidgets::Client::main(int argc, char *argv[], const std::string &widget,
                             std::ostream &out) {
  bool show_help = false;
  bool show_version = false;
  std::string config_opt;
  std::string log_level;
  std::string action;
  auto cli = clara::detail::Help(show_help) |
             clara::detail::Opt(show_version)["-v"]["--version"]("Show version") |
             clara::detail::Opt(config_opt, "config")["-c"]["--config"]("Config path") |
             clara::detail::Opt(
                 log_level,
                 "trace|debug|info|warning|error|critical|off")["-l"]["--log-level"]("Log level") |
             clara::detail::Arg(action, widget == "power-profile" ? "next" : "count|tooltip|show")(
                 "Action");
  auto res = cli.parse(clara::detail::Args(argc, argv));
  if (!res) {
    spdlog::error("Error in command line: {}", res.errorMessage());
    // The power profile status is printed for any argument but "next"
    if (widget != "power-profile") {
      return 0;
    }
    show_help = false;
    show_version = false;
    action.clear();
  }
  if (show_help) {
    out << cli << '\n';
    return 0;
  }
  if (show_version) {
    out << "waywidgets-" << widget << " v" << VERSION << '\n';
    return 0;
  }
  if (!log_level.empty()) {
    spdlog::set_level(spdlog::level::from_str(log_level));
  }

  loadConfig(config_opt);

  Factory factory(config, out);
  try {
    std::unique_ptr<AWidget> instance(factory.makeWidget(widget));
    instance->doAction(action);
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
  }
  return 0;
}
