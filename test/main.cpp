#define CATCH_CONFIG_RUNNER
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#if __has_include(<catch2/catch_all.hpp>)
#include <catch2/catch_all.hpp>
#include <catch2/reporters/catch_reporter_tap.hpp>
#else
#include <catch2/catch.hpp>
#include <catch2/catch_reporter_tap.hpp>
#endif
#include <cstdlib>
#include <memory>

// The reporter owns stdout, logs go to stderr.
// WAYWIDGETS_TEST_LOG_LEVEL raises or lowers the log level of a test run.
int main(int argc, char* argv[]) {
  Catch::Session session;

  session.applyCommandLine(argc, argv);
  if (const char* level = std::getenv("WAYWIDGETS_TEST_LOG_LEVEL")) {
    spdlog::set_level(spdlog::level::from_str(level));
  }
  const auto logger = spdlog::default_logger();
#if CATCH_VERSION_MAJOR >= 3
  for (const auto& spec : session.config().getReporterSpecs()) {
    const auto& reporter_name = spec.name();
#else
  {
    const auto& reporter_name = session.config().getReporterName();
#endif
    logger->sinks().assign({std::make_shared<spdlog::sinks::stderr_sink_st>()});
    if (reporter_name == "tap") {
      // TAP consumers treat lines starting with '#' as diagnostics
      spdlog::set_pattern("# [%l] %v");
    } else if (reporter_name == "compact") {
      logger->sinks().clear();
    }
  }

  return session.run();
}
