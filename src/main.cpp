#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#ifdef HAVE_LIBSYSTEMD
#include <spdlog/sinks/systemd_sink.h>
#include <sys/stat.h>
#include <unistd.h>

#include <charconv>
#include <cstdlib>
#include <cstring>
#include <system_error>
#endif

#include "client.hpp"

#ifndef WAYWIDGETS_WIDGET
#error "WAYWIDGETS_WIDGET must name the widget this executable runs"
#endif

// stdout belongs to the bar
static void logToStderr() {
  auto logger = spdlog::stderr_color_mt("waywidgets");
  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::warn);
}

static void logToJournalIfRunAsService() {
#ifdef HAVE_LIBSYSTEMD
  /* Implementation of automatic protocol upgrading (from stderr to journal)
  ** as described in https://systemd.io/JOURNAL_NATIVE_PROTOCOL */
  char const* journal_stream = std::getenv("JOURNAL_STREAM");

  if (journal_stream != nullptr) {
    dev_t device;
    ino_t inode;
    size_t len = std::strlen(journal_stream);

    auto result = std::from_chars(journal_stream, journal_stream + len, device);
    if (result.ec == std::errc{})
      result = std::from_chars(result.ptr + 1, journal_stream + len, inode);
    if (result.ec != std::errc{}) {
      spdlog::warn("malformed JOURNAL_STREAM (\"{}\"): {}, logging to console", journal_stream,
                   std::make_error_condition(result.ec).message());
      return;
    }

    struct stat f_stderr;

    if (fstat(STDERR_FILENO, &f_stderr) != 0) {
      spdlog::warn("unable to check stderr device and inode numbers: {}", strerror(errno));
    } else if (device == f_stderr.st_dev && inode == f_stderr.st_ino) {
      auto journald = spdlog::systemd_logger_st("native_journal", "waywidgets", false);
      journald->set_level(spdlog::level::warn);
      spdlog::set_default_logger(journald);
    }
  }
#endif
}

int main(int argc, char* argv[]) {
  logToStderr();
  logToJournalIfRunAsService();

  try {
    return waywidgets::Client::inst()->main(argc, argv, WAYWIDGETS_WIDGET);
  } catch (const std::exception& e) {
    spdlog::error("{}", e.what());
    return 0;
  }
}
