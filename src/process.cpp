#include "process.hpp"
#include "log.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <spawn.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string_view>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace omb {

namespace {

std::shared_ptr<spdlog::logger> process_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("process");
  }();
  return logger;
}

constexpr std::size_t kMaxErrorOutput = 4096;

/// Closes both ends of a pipe that are still open.
struct Pipe {
  int fds[2]{-1, -1};
  Pipe() {
    if (::pipe(fds) != 0) {
      throw std::runtime_error(std::string("pipe() failed: ") +
                               std::strerror(errno));
    }
  }
  ~Pipe() {
    close_read();
    close_write();
  }
  void close_read() {
    if (fds[0] >= 0) {
      ::close(fds[0]);
      fds[0] = -1;
    }
  }
  void close_write() {
    if (fds[1] >= 0) {
      ::close(fds[1]);
      fds[1] = -1;
    }
  }
  Pipe(const Pipe &) = delete;
  Pipe &operator=(const Pipe &) = delete;
};

struct FileActions {
  posix_spawn_file_actions_t actions;
  FileActions() { posix_spawn_file_actions_init(&actions); }
  ~FileActions() { posix_spawn_file_actions_destroy(&actions); }
  FileActions(const FileActions &) = delete;
  FileActions &operator=(const FileActions &) = delete;
};

} // namespace

ProcessResult SpawnProcessRunner::run(const std::vector<std::string> &argv,
                                      const std::vector<std::string> &env) {
  if (argv.empty()) {
    throw std::invalid_argument("empty command line");
  }
  std::vector<char *> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto &s : argv)
    cargv.push_back(const_cast<char *>(s.c_str()));
  cargv.push_back(nullptr);

  // Entries in env replace inherited variables of the same name.
  auto overridden = [&env](const char *entry) {
    std::string_view inherited(entry);
    auto eq = inherited.find('=');
    if (eq == std::string_view::npos)
      return false;
    auto name = inherited.substr(0, eq + 1);
    for (const auto &s : env) {
      if (s.compare(0, name.size(), name) == 0)
        return true;
    }
    return false;
  };
  std::vector<char *> cenv;
  for (char **e = environ; e != nullptr && *e != nullptr; ++e) {
    if (!overridden(*e))
      cenv.push_back(*e);
  }
  for (const auto &s : env)
    cenv.push_back(const_cast<char *>(s.c_str()));
  cenv.push_back(nullptr);

  Pipe err_pipe;
  FileActions fa;
  posix_spawn_file_actions_addopen(&fa.actions, STDIN_FILENO, "/dev/null",
                                   O_RDONLY, 0);
  posix_spawn_file_actions_addopen(&fa.actions, STDOUT_FILENO, "/dev/null",
                                   O_WRONLY, 0);
  posix_spawn_file_actions_adddup2(&fa.actions, err_pipe.fds[1],
                                   STDERR_FILENO);
  posix_spawn_file_actions_addclose(&fa.actions, err_pipe.fds[0]);
  posix_spawn_file_actions_addclose(&fa.actions, err_pipe.fds[1]);

  pid_t pid = 0;
  int rc = posix_spawnp(&pid, cargv[0], &fa.actions, nullptr, cargv.data(),
                        cenv.data());
  if (rc != 0) {
    process_log()->warn("posix_spawnp('{}') failed: {} ({})", argv[0],
                        std::strerror(rc), rc);
    throw std::runtime_error("Failed to start " + argv[0] + ": " +
                             std::strerror(rc));
  }
  process_log()->debug("Started {} (pid {})", argv[0], pid);
  err_pipe.close_write();

  ProcessResult result;
  char buffer[1024];
  while (true) {
    ssize_t n = ::read(err_pipe.fds[0], buffer, sizeof(buffer));
    if (n > 0) {
      result.error_output.append(buffer, static_cast<std::size_t>(n));
      if (result.error_output.size() > kMaxErrorOutput) {
        result.error_output.erase(
            0, result.error_output.size() - kMaxErrorOutput);
      }
    } else if (n == 0 || errno != EINTR) {
      break;
    }
  }

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw std::runtime_error("waitpid failed for " + argv[0] + ": " +
                               std::strerror(errno));
    }
  }
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  }
  while (!result.error_output.empty() &&
         (result.error_output.back() == '\n' ||
          result.error_output.back() == '\r')) {
    result.error_output.pop_back();
  }
  process_log()->debug("{} exited with code {}", argv[0], result.exit_code);
  return result;
}

} // namespace omb
