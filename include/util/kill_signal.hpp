#pragma once

#include <sys/types.h>

#include <filesystem>
#include <string>
#include <vector>

namespace waywidgets::util {

// Asks the bar to re-run its widgets. waybar maps SIGRTMIN+N to every custom
// module configured with "signal": N.
class HostSignaller {
 public:
  virtual ~HostSignaller() = default;
  // Returns the number of processes signalled
  virtual int refresh() = 0;
};

class ProcessSignaller : public HostSignaller {
 public:
  ProcessSignaller(std::string process_name, int signal_offset,
                   std::filesystem::path proc_root = "/proc");

  int refresh() override;

  // Pids under proc_root whose comm equals process_name
  std::vector<pid_t> findProcesses() const;
  int signalNumber() const;

 private:
  const std::string process_name_;
  const int signal_offset_;
  const std::filesystem::path proc_root_;
};

}  // namespace waywidgets::util
