#include "util/kill_signal.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fstream>
#include <utility>

#include "util/string.hpp"

namespace fs = std::filesystem;

namespace waywidgets::util {

ProcessSignaller::ProcessSignaller(std::string process_name, int signal_offset,
                                   fs::path proc_root)
    : process_name_(std::move(process_name)),
      signal_offset_(signal_offset),
      proc_root_(std::move(proc_root)) {}

int ProcessSignaller::signalNumber() const { return SIGRTMIN + signal_offset_; }

std::vector<pid_t> ProcessSignaller::findProcesses() const {
  std::vector<pid_t> pids;
  std::error_code ec;
  for (const auto& entry : fs::directory_iterator(proc_root_, ec)) {
    const auto name = entry.path().filename().string();
    if (name.empty() || name.find_first_not_of("0123456789") != std::string::npos) {
      continue;
    }
    std::ifstream comm(entry.path() / "comm");
    std::string line;
    if (comm.is_open() && std::getline(comm, line) && trim(line) == process_name_) {
      pids.push_back(static_cast<pid_t>(std::stol(name)));
    }
  }
  if (ec) {
    spdlog::warn("Unable to list {}: {}", proc_root_.string(), ec.message());
  }
  return pids;
}

int ProcessSignaller::refresh() {
  if (signal_offset_ < 1 || signal_offset_ > SIGRTMAX - SIGRTMIN) {
    spdlog::error("Signal offset {} is outside of the realtime range 1..{}", signal_offset_,
                  SIGRTMAX - SIGRTMIN);
    return 0;
  }
  int signalled = 0;
  for (auto pid : findProcesses()) {
    if (kill(pid, signalNumber()) != 0) {
      spdlog::warn("Unable to signal {} ({}): {}", process_name_, pid, strerror(errno));
      continue;
    }
    spdlog::debug("Sent SIGRTMIN+{} to {} ({})", signal_offset_, process_name_, pid);
    ++signalled;
  }
  if (signalled == 0) {
    spdlog::info("No running {} to refresh", process_name_);
  }
  return signalled;
}

}  // namespace waywidgets::util
