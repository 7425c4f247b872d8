#pragma once

#include <fcntl.h>
#include <poll.h>
#include <spdlog/spdlog.h>
#include <sys/wait.h>
#include <unistd.h>

#ifdef __linux__
#include <sys/prctl.h>
#endif
#ifdef __FreeBSD__
#include <sys/procctl.h>
#endif

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

namespace waywidgets::util::command {

struct res {
  int exit_code;
  std::string out;
};

struct child {
  pid_t pid = -1;
  // write end of the child's stdin, -1 when stdin is inherited
  int in = -1;
  // read end of the child's stdout
  int out = -1;
};

inline std::string chomp(std::string output) {
  // Remove last newline
  if (!output.empty() && output[output.length() - 1] == '\n') {
    output.erase(output.length() - 1);
  }
  return output;
}

inline int close(child& c) {
  int stat = -1;
  pid_t ret;

  if (c.in != -1) {
    ::close(c.in);
    c.in = -1;
  }
  if (c.out != -1) {
    ::close(c.out);
    c.out = -1;
  }
  do {
    ret = waitpid(c.pid, &stat, 0);

    if (ret == -1) {
      if (errno == EINTR) continue;
      spdlog::debug("waitpid failed: {}", strerror(errno));
      return -1;
    }
    if (WIFEXITED(stat)) {
      spdlog::debug("Cmd exited with code {}", WEXITSTATUS(stat));
    } else if (WIFSIGNALED(stat)) {
      spdlog::debug("Cmd killed by {}", WTERMSIG(stat));
    }
  } while (!WIFEXITED(stat) && !WIFSIGNALED(stat));
  c.pid = -1;
  return stat;
}

inline bool open(const std::vector<std::string>& argv, child& c, bool pipe_stdin = false) {
  if (argv.empty() || argv.front().empty()) return false;

  int out_fd[2];
  int in_fd[2] = {-1, -1};
  if (pipe(out_fd) != 0) {
    spdlog::error("Unable to pipe fd");
    return false;
  }
  if (pipe_stdin && pipe(in_fd) != 0) {
    spdlog::error("Unable to pipe fd");
    ::close(out_fd[0]);
    ::close(out_fd[1]);
    return false;
  }

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    args.push_back(const_cast<char*>(arg.c_str()));
  }
  args.push_back(nullptr);

  pid_t child_pid = fork();

  if (child_pid < 0) {
    spdlog::error("Unable to exec cmd {}, error {}", argv.front(), strerror(errno));
    ::close(out_fd[0]);
    ::close(out_fd[1]);
    if (pipe_stdin) {
      ::close(in_fd[0]);
      ::close(in_fd[1]);
    }
    return false;
  }

  if (!child_pid) {
    sigset_t mask;
    sigfillset(&mask);
    // Reset sigmask
    pthread_sigmask(SIG_UNBLOCK, &mask, nullptr);
    std::signal(SIGPIPE, SIG_DFL);
    // Kill child if the widget exits
    int deathsig = SIGTERM;
#ifdef __linux__
    prctl(PR_SET_PDEATHSIG, deathsig);
#endif
#ifdef __FreeBSD__
    procctl(P_PID, 0, PROC_PDEATHSIG_CTL, reinterpret_cast<void*>(&deathsig));
#endif
    ::close(out_fd[0]);
    dup2(out_fd[1], STDOUT_FILENO);
    ::close(out_fd[1]);
    if (pipe_stdin) {
      ::close(in_fd[1]);
      dup2(in_fd[0], STDIN_FILENO);
      ::close(in_fd[0]);
    }
    execvp(args[0], args.data());
    _exit(127);
  }

  ::close(out_fd[1]);
  c.pid = child_pid;
  c.out = out_fd[0];
  if (pipe_stdin) {
    ::close(in_fd[0]);
    c.in = in_fd[1];
    fcntl(c.in, F_SETFL, fcntl(c.in, F_GETFL) | O_NONBLOCK);
  }
  return true;
}

// Feeds `input` to the child's stdin while draining its stdout, so neither side
// can fill its pipe and block the other.
inline std::string transfer(child& c, std::string_view input) {
  std::string output;
  std::array<char, 4096> buffer = {0};
  size_t written = 0;

  if (c.in != -1 && input.empty()) {
    ::close(c.in);
    c.in = -1;
  }
  while (c.out != -1) {
    std::array<pollfd, 2> fds = {{{c.out, POLLIN, 0}, {c.in, POLLOUT, 0}}};
    nfds_t nfds = c.in != -1 ? 2 : 1;
    if (poll(fds.data(), nfds, -1) < 0) {
      if (errno == EINTR) continue;
      spdlog::error("poll on cmd pipes failed: {}", strerror(errno));
      break;
    }

    if (c.in != -1 && fds[1].revents != 0) {
      auto amt = write(c.in, input.data() + written, input.size() - written);
      if (amt > 0) {
        written += amt;
      } else if (amt < 0 && errno != EINTR && errno != EAGAIN) {
        spdlog::debug("Cmd stopped reading its input: {}", strerror(errno));
        written = input.size();
      }
      if (written == input.size()) {
        ::close(c.in);
        c.in = -1;
      }
    }

    if (fds[0].revents != 0) {
      auto amt = ::read(c.out, buffer.data(), buffer.size());
      if (amt > 0) {
        output.append(buffer.data(), amt);
      } else if (amt == 0 || errno != EINTR) {
        ::close(c.out);
        c.out = -1;
      }
    }
  }
  return output;
}

inline int exitCode(int stat) { return stat != -1 && WIFEXITED(stat) ? WEXITSTATUS(stat) : -1; }

inline struct res exec(const std::vector<std::string>& argv) {
  child c;
  if (!command::open(argv, c)) return {-1, ""};
  auto output = command::transfer(c, "");
  auto stat = command::close(c);
  return {exitCode(stat), chomp(output)};
}

inline struct res exec(const std::vector<std::string>& argv, std::string_view input) {
  // A child that exits without reading all of its input must not kill us
  auto* previous = std::signal(SIGPIPE, SIG_IGN);

  child c;
  if (!command::open(argv, c, true)) {
    std::signal(SIGPIPE, previous);
    return {-1, ""};
  }
  auto output = command::transfer(c, input);
  auto stat = command::close(c);
  std::signal(SIGPIPE, previous);
  return {exitCode(stat), chomp(output)};
}

inline struct res execNoRead(const std::vector<std::string>& argv) {
  auto res = command::exec(argv);
  return {res.exit_code, ""};
}

}  // namespace waywidgets::util::command
