#include "pipeaudit/process/subprocess_runner.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <vector>

namespace pipeaudit::process {

namespace {

// Keep at most this many bytes per stream; older output is dropped first.
constexpr std::size_t kMaxCaptureBytes = 1024 * 1024;

using RunResult = core::Result<SubprocessResult, std::string>;

// Owns one pipe end and closes it on scope exit.
class Fd {
 public:
  Fd() = default;
  explicit Fd(int fd) : fd_(fd) {}
  ~Fd() { reset(); }

  Fd(const Fd&) = delete;
  Fd& operator=(const Fd&) = delete;
  Fd(Fd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  Fd& operator=(Fd&& other) noexcept {
    if (this != &other) {
      reset();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  [[nodiscard]] int get() const { return fd_; }
  [[nodiscard]] bool is_open() const { return fd_ >= 0; }

  void reset() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

 private:
  int fd_{-1};
};

bool make_pipe(Fd& read_end, Fd& write_end) {
  std::array<int, 2> fds{-1, -1};
  if (::pipe2(fds.data(), O_CLOEXEC) != 0) {
    return false;
  }
  read_end = Fd(fds[0]);
  write_end = Fd(fds[1]);
  return true;
}

void append_capped(std::string& buffer, const char* data, std::size_t size) {
  buffer.append(data, size);
  if (buffer.size() > kMaxCaptureBytes) {
    buffer.erase(0, buffer.size() - kMaxCaptureBytes);
  }
}

// build_argv points into request; it must outlive the exec.
std::vector<char*> build_argv(const SubprocessRequest& request) {
  std::vector<char*> argv;
  argv.reserve(request.args.size() + 2);
  argv.push_back(const_cast<char*>(request.program.c_str()));  // NOLINT
  for (const auto& arg : request.args) {
    argv.push_back(const_cast<char*>(arg.c_str()));  // NOLINT
  }
  argv.push_back(nullptr);
  return argv;
}

// Runs in the forked child and never returns. Only async-signal-safe calls: the
// parent may have been multithreaded, so nothing here may allocate or lock.
[[noreturn]] void exec_child(char* const* argv, const char* working_directory, int out_fd,
                             int err_fd, int status_fd) {
  if (working_directory != nullptr && ::chdir(working_directory) != 0) {
    const int code = errno;
    (void)::write(status_fd, &code, sizeof(code));
    ::_exit(127);
  }

  ::dup2(out_fd, STDOUT_FILENO);
  ::dup2(err_fd, STDERR_FILENO);

  ::execvp(argv[0], argv);

  const int code = errno;
  (void)::write(status_fd, &code, sizeof(code));
  ::_exit(127);
}

int wait_for_exit(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return -1;
    }
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

}  // namespace

RunResult PosixSubprocessRunner::run(const SubprocessRequest& request) {
  if (request.program.empty()) {
    return RunResult::err("no program given");
  }

  Fd out_read, out_write, err_read, err_write, status_read, status_write;
  if (!make_pipe(out_read, out_write) || !make_pipe(err_read, err_write) ||
      !make_pipe(status_read, status_write)) {
    return RunResult::err(std::string("pipe failed: ") + std::strerror(errno));
  }

  const std::vector<char*> argv = build_argv(request);
  const char* working_directory =
      request.working_directory.has_value() ? request.working_directory->c_str() : nullptr;

  const pid_t pid = ::fork();
  if (pid < 0) {
    return RunResult::err(std::string("fork failed: ") + std::strerror(errno));
  }
  if (pid == 0) {
    exec_child(argv.data(), working_directory, out_write.get(), err_write.get(),
               status_write.get());
  }

  out_write.reset();
  err_write.reset();
  status_write.reset();

  // The status pipe is close-on-exec: EOF means exec succeeded, data is the child's errno.
  int exec_errno = 0;
  ssize_t n = 0;
  do {
    n = ::read(status_read.get(), &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
    wait_for_exit(pid);
    return RunResult::err("failed to start '" + request.program +
                          "': " + std::strerror(exec_errno));
  }

  SubprocessResult result;
  const auto deadline = std::chrono::steady_clock::now() + request.timeout;
  std::array<char, 4096> buffer{};

  while (out_read.is_open() || err_read.is_open()) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      ::kill(pid, SIGKILL);
      result.timed_out = true;
      break;
    }

    std::array<pollfd, 2> fds{};
    fds[0] = pollfd{out_read.get(), POLLIN, 0};
    fds[1] = pollfd{err_read.get(), POLLIN, 0};

    const int ready = ::poll(fds.data(), fds.size(), static_cast<int>(remaining.count()));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      const int code = errno;
      ::kill(pid, SIGKILL);
      wait_for_exit(pid);
      return RunResult::err(std::string("poll failed: ") + std::strerror(code));
    }

    Fd* streams[2] = {&out_read, &err_read};
    std::string* sinks[2] = {&result.stdout_text, &result.stderr_text};
    for (std::size_t i = 0; i < fds.size(); ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0) {
        continue;
      }
      const ssize_t got = ::read(fds[i].fd, buffer.data(), buffer.size());
      if (got > 0) {
        append_capped(*sinks[i], buffer.data(), static_cast<std::size_t>(got));
      } else if (got == 0 || errno != EINTR) {
        streams[i]->reset();
      }
    }
  }

  result.exit_code = wait_for_exit(pid);
  return RunResult::ok(std::move(result));
}

}  // namespace pipeaudit::process
