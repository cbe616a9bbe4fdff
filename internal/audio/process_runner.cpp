#include "process_runner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace soundscribe::audio {

namespace {

using SteadyClock = std::chrono::steady_clock;

class Pipe {
 public:
  Pipe() {
    if (pipe2(fds_, O_CLOEXEC) != 0) {
      throw std::system_error(errno, std::generic_category(), "pipe2");
    }
  }

  ~Pipe() {
    CloseRead();
    CloseWrite();
  }

  Pipe(const Pipe&)            = delete;
  Pipe& operator=(const Pipe&) = delete;

  int ReadEnd() const {
    return fds_[0];
  }

  int WriteEnd() const {
    return fds_[1];
  }

  void CloseRead() {
    if (fds_[0] >= 0) {
      ::close(fds_[0]);
      fds_[0] = -1;
    }
  }

  void CloseWrite() {
    if (fds_[1] >= 0) {
      ::close(fds_[1]);
      fds_[1] = -1;
    }
  }

 private:
  int fds_[2] = {-1, -1};
};

void AppendCapped(std::string& sink, const char* data, std::size_t n, std::size_t cap) {
  sink.append(data, n);
  if (sink.size() > cap) {
    sink.erase(0, sink.size() - cap);
  }
}

int DecodeStatus(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

// Returns false on EOF or a hard read error.
bool DrainFd(int fd, std::string& sink, std::size_t cap) {
  char buf[4096];
  for (;;) {
    const ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
      AppendCapped(sink, buf, static_cast<std::size_t>(n), cap);
      continue;
    }
    if (n == 0) return false;
    if (errno == EINTR) continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
    return false;
  }
}

} // namespace

ProcessResult RunProcess(const std::vector<std::string>& argv, std::chrono::milliseconds timeout, std::size_t max_capture_bytes) {
  if (argv.empty()) {
    throw std::invalid_argument("RunProcess: empty argv");
  }

  // Built before fork: the child may only make async-signal-safe calls.
  std::vector<char*> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto& arg : argv) c_argv.push_back(const_cast<char*>(arg.c_str()));
  c_argv.push_back(nullptr);

  Pipe out_pipe;
  Pipe err_pipe;

  const pid_t pid = ::fork();
  if (pid < 0) {
    throw std::system_error(errno, std::generic_category(), "fork");
  }

  if (pid == 0) {
    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
    ::dup2(out_pipe.WriteEnd(), STDOUT_FILENO);
    ::dup2(err_pipe.WriteEnd(), STDERR_FILENO);
    ::execvp(c_argv[0], c_argv.data());

    const char* reason = std::strerror(errno);
    const char  prefix[] = "exec failed: ";
    (void)!::write(STDERR_FILENO, prefix, sizeof(prefix) - 1);
    (void)!::write(STDERR_FILENO, reason, std::strlen(reason));
    ::_exit(127);
  }

  out_pipe.CloseWrite();
  err_pipe.CloseWrite();
  ::fcntl(out_pipe.ReadEnd(), F_SETFL, O_NONBLOCK);
  ::fcntl(err_pipe.ReadEnd(), F_SETFL, O_NONBLOCK);

  ProcessResult result;
  const auto    deadline = SteadyClock::now() + timeout;
  bool          out_open = true;
  bool          err_open = true;

  while ((out_open || err_open) && !result.timed_out) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now());
    if (remaining.count() <= 0) {
      result.timed_out = true;
      break;
    }

    pollfd fds[2];
    nfds_t nfds = 0;
    if (out_open) fds[nfds++] = {out_pipe.ReadEnd(), POLLIN, 0};
    if (err_open) fds[nfds++] = {err_pipe.ReadEnd(), POLLIN, 0};

    const int rc = ::poll(fds, nfds, static_cast<int>(std::min<int64_t>(remaining.count(), 250)));
    if (rc < 0) {
      if (errno == EINTR) continue;
      ::kill(pid, SIGKILL);
      ::waitpid(pid, nullptr, 0);
      throw std::system_error(errno, std::generic_category(), "poll");
    }

    for (nfds_t i = 0; i < nfds; ++i) {
      if (fds[i].revents == 0) continue;
      if (fds[i].fd == out_pipe.ReadEnd()) {
        out_open = DrainFd(fds[i].fd, result.stdout_data, max_capture_bytes);
      } else {
        err_open = DrainFd(fds[i].fd, result.stderr_data, max_capture_bytes);
      }
    }
  }

  // Both pipes closed; the child is exiting or has detached its output.
  int status = 0;
  while (!result.timed_out) {
    const pid_t rc = ::waitpid(pid, &status, WNOHANG);
    if (rc == pid) {
      result.exit_code = DecodeStatus(status);
      return result;
    }
    if (rc < 0 && errno != EINTR) {
      throw std::system_error(errno, std::generic_category(), "waitpid");
    }
    if (SteadyClock::now() >= deadline) {
      result.timed_out = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  ::kill(pid, SIGKILL);
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
  result.exit_code = -1;
  return result;
}

} // namespace soundscribe::audio
