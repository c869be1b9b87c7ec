// format_check/driver/formatter_invoker.cpp - Formatter process implementation
//
#include "format_check/driver/formatter_invoker.hpp"

#include <fcntl.h>
#include <fmt/core.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

extern char ** environ;

namespace format_check
{

namespace
{

/// Owns a file descriptor and closes it on scope exit
class FdGuard
{
public:
  explicit FdGuard(int fd = -1) noexcept : fd_(fd) {}
  ~FdGuard() { reset(); }

  FdGuard(const FdGuard &) = delete;
  FdGuard & operator=(const FdGuard &) = delete;

  [[nodiscard]] int get() const noexcept { return fd_; }

  void reset(int fd = -1) noexcept
  {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

private:
  int fd_;
};

/// Owns a posix_spawn_file_actions_t
class SpawnActions
{
public:
  SpawnActions()
  {
    if (const int rc = posix_spawn_file_actions_init(&actions_); rc != 0) {
      throw std::runtime_error(
        fmt::format("Failed to initialize spawn actions: {}", std::strerror(rc)));
    }
  }
  ~SpawnActions() { posix_spawn_file_actions_destroy(&actions_); }

  SpawnActions(const SpawnActions &) = delete;
  SpawnActions & operator=(const SpawnActions &) = delete;

  [[nodiscard]] posix_spawn_file_actions_t * get() noexcept { return &actions_; }

private:
  posix_spawn_file_actions_t actions_;
};

std::string read_to_end(int fd)
{
  std::string out;
  char buf[4096];
  for (;;) {
    const ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR) continue;
      throw std::runtime_error(
        fmt::format("Failed to read formatter output: {}", std::strerror(errno)));
    }
    if (n == 0) {
      break;
    }
    out.append(buf, static_cast<size_t>(n));
  }
  return out;
}

int wait_for_exit(pid_t pid)
{
  int status = 0;
  for (;;) {
    if (::waitpid(pid, &status, 0) >= 0) {
      return status;
    }
    if (errno != EINTR) {
      throw std::runtime_error(
        fmt::format("Failed to wait for formatter process: {}", std::strerror(errno)));
    }
  }
}

}  // namespace

ClangFormatProcess::ClangFormatProcess(std::string executable) : executable_(std::move(executable))
{
}

FormatterOutput ClangFormatProcess::run(const std::vector<std::string> & args, OutputMode mode)
{
  std::vector<char *> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(const_cast<char *>(executable_.c_str()));
  for (const auto & a : args) {
    argv.push_back(const_cast<char *>(a.c_str()));
  }
  argv.push_back(nullptr);

  SpawnActions actions;
  FdGuard read_end;
  FdGuard write_end;

  if (mode == OutputMode::Capture) {
    int pipefd[2] = {-1, -1};
    if (::pipe2(pipefd, O_CLOEXEC) != 0) {
      throw std::runtime_error(
        fmt::format("Failed to create pipe for formatter: {}", std::strerror(errno)));
    }
    read_end.reset(pipefd[0]);
    write_end.reset(pipefd[1]);

    int rc = posix_spawn_file_actions_addopen(actions.get(), STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    if (rc == 0) {
      rc = posix_spawn_file_actions_adddup2(actions.get(), write_end.get(), STDOUT_FILENO);
    }
    if (rc != 0) {
      throw std::runtime_error(
        fmt::format("Failed to set up formatter streams: {}", std::strerror(rc)));
    }
  }

  pid_t pid = -1;
  const int sp =
    posix_spawnp(&pid, executable_.c_str(), actions.get(), nullptr, argv.data(), environ);
  write_end.reset();

  if (sp != 0) {
    throw std::runtime_error(
      fmt::format("Failed to launch '{}': {}", executable_, std::strerror(sp)));
  }

  FormatterOutput output;
  if (mode == OutputMode::Capture) {
    try {
      output.stdout_text = read_to_end(read_end.get());
    } catch (...) {
      read_end.reset();
      (void)wait_for_exit(pid);
      throw;
    }
    read_end.reset();
  }

  const int status = wait_for_exit(pid);
  if (WIFSIGNALED(status)) {
    throw std::runtime_error(
      fmt::format("'{}' was terminated by signal {}", executable_, WTERMSIG(status)));
  }
  if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
    throw std::runtime_error(
      fmt::format("'{}' exited with status {}", executable_, WEXITSTATUS(status)));
  }

  return output;
}

}  // namespace format_check
