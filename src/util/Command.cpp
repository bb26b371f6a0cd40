#include "util/Command.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <thread>

namespace reclaim::util {

static constexpr size_t kMaxOutput = 64 * 1024;
static constexpr auto kReapWindow = std::chrono::seconds(1);

static int decode_status(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

// Terminate the whole group, give it a moment, then force it. Only ever
// applied to our own helper shell, never to cleanup targets.
static int terminate_group(pid_t pid) {
  int status = 0;
  ::kill(-pid, SIGTERM);
  auto deadline = std::chrono::steady_clock::now() + kReapWindow;
  while (std::chrono::steady_clock::now() < deadline) {
    pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == pid || (r < 0 && errno != EINTR)) return status;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  ::kill(-pid, SIGKILL);
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
  return status;
}

CommandResult run_command(const std::string& cmdline, std::chrono::milliseconds timeout) {
  CommandResult res;
  int out_pipe[2];
  if (::pipe2(out_pipe, O_CLOEXEC) != 0) return res;

  pid_t pid = ::fork();
  if (pid < 0) {
    ::close(out_pipe[0]); ::close(out_pipe[1]);
    return res;
  }
  if (pid == 0) {
    // Child: own process group so a timeout can take down the whole pipeline
    ::setpgid(0, 0);
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) { ::dup2(devnull, STDIN_FILENO); ::close(devnull); }
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(out_pipe[1], STDERR_FILENO);
    ::execl("/bin/sh", "sh", "-c", cmdline.c_str(), static_cast<char*>(nullptr));
    ::_exit(127);
  }
  ::setpgid(pid, pid); // closes the race with the child's own setpgid
  ::close(out_pipe[1]);
  res.started = true;

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  int fd = out_pipe[0];
  char buf[4096];
  bool eof = false;
  int status = 0;
  bool reaped = false;
  while (true) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      status = terminate_group(pid);
      reaped = true;
      res.timed_out = true;
      break;
    }
    if (eof) {
      pid_t r = ::waitpid(pid, &status, WNOHANG);
      if (r == pid) { reaped = true; break; }
      if (r < 0 && errno != EINTR) break;
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      continue;
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
    struct pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
    int rv = ::poll(&pfd, 1, static_cast<int>(std::min<long long>(remaining, 250)));
    if (rv < 0) {
      if (errno == EINTR) continue; // signal delivered to us, keep waiting
      eof = true;
      continue;
    }
    if (rv == 0) continue;
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
      size_t room = kMaxOutput - std::min(kMaxOutput, res.output.size());
      res.output.append(buf, std::min(room, static_cast<size_t>(n)));
    } else if (n == 0 || errno != EINTR) {
      eof = true;
    }
  }
  ::close(fd);
  if (!reaped) {
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
  }
  if (!res.timed_out) res.exit_code = decode_status(status);
  return res;
}

std::string command_program(const std::string& cmdline) {
  std::istringstream ss(cmdline);
  std::string word;
  auto clean = [](std::string w) {
    while (!w.empty() && (w.back() == ';' || w.back() == '&' || w.back() == '|')) w.pop_back();
    return w;
  };
  if (!(ss >> word)) return {};
  if (word == "sudo") {
    while (ss >> word) {
      if (word.empty() || word[0] != '-') return clean(word);
    }
    return {};
  }
  return clean(word);
}

bool program_on_path(const std::string& program) {
  if (program.empty()) return false;
  if (program.find('/') != std::string::npos) return ::access(program.c_str(), X_OK) == 0;
  const char* path = std::getenv("PATH");
  std::string dirs = (path && *path) ? path : "/usr/local/bin:/usr/bin:/bin";
  size_t start = 0;
  while (start <= dirs.size()) {
    size_t end = dirs.find(':', start);
    if (end == std::string::npos) end = dirs.size();
    std::string dir = dirs.substr(start, end - start);
    if (dir.empty()) dir = ".";
    std::string cand = dir + "/" + program;
    if (::access(cand.c_str(), X_OK) == 0) return true;
    start = end + 1;
  }
  return false;
}

} // namespace reclaim::util
