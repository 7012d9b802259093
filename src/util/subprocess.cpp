// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/subprocess.hpp"

#include "util/logging.hpp"
#include "util/string_parsing.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace netsnmp {
namespace util {

namespace {

// Owns a pipe; closes whatever ends are still open on destruction
struct Pipe {
  int fds[2]{-1, -1};

  bool open_pipe() { return pipe2(fds, O_CLOEXEC) == 0; }
  void close_read() {
    if (fds[0] >= 0) {
      close(fds[0]);
      fds[0] = -1;
    }
  }
  void close_write() {
    if (fds[1] >= 0) {
      close(fds[1]);
      fds[1] = -1;
    }
  }
  ~Pipe() {
    close_read();
    close_write();
  }
};

void Drain(int fd, std::string& sink, bool& open) {
  std::array<char, 4096> buf;
  ssize_t n = read(fd, buf.data(), buf.size());
  if (n > 0) {
    if (sink.size() < MAX_CAPTURE_BYTES) {
      sink.append(buf.data(), std::min(static_cast<size_t>(n), MAX_CAPTURE_BYTES - sink.size()));
    }
    return;
  }
  if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
    open = false;
  }
}

}  // namespace

CommandResult RunCommand(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
  CommandResult result;
  if (argv.empty()) {
    return result;
  }

  Pipe out_pipe;
  Pipe err_pipe;
  if (!out_pipe.open_pipe() || !err_pipe.open_pipe()) {
    LOG_ERROR("RunCommand: pipe failed: {}", std::strerror(errno));
    return result;
  }

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
  posix_spawn_file_actions_adddup2(&actions, out_pipe.fds[1], STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&actions, err_pipe.fds[1], STDERR_FILENO);

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    args.push_back(const_cast<char*>(arg.c_str()));
  }
  args.push_back(nullptr);

  pid_t pid = -1;
  int rc = posix_spawnp(&pid, args[0], &actions, nullptr, args.data(), environ);
  posix_spawn_file_actions_destroy(&actions);
  out_pipe.close_write();
  err_pipe.close_write();

  if (rc != 0) {
    result.err = std::strerror(rc);
    return result;
  }
  result.spawned = true;

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  bool out_open = true;
  bool err_open = true;

  while (out_open || err_open) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      kill(pid, SIGKILL);
      result.timed_out = true;
      break;
    }

    std::array<pollfd, 2> pfds{};
    nfds_t count = 0;
    if (out_open)
      pfds[count++] = {out_pipe.fds[0], POLLIN, 0};
    if (err_open)
      pfds[count++] = {err_pipe.fds[0], POLLIN, 0};

    int ready = poll(pfds.data(), count, static_cast<int>(remaining.count()));
    if (ready < 0) {
      if (errno == EINTR)
        continue;
      LOG_ERROR("RunCommand: poll failed: {}", std::strerror(errno));
      kill(pid, SIGKILL);
      result.timed_out = true;
      break;
    }

    for (nfds_t i = 0; i < count; ++i) {
      if (pfds[i].revents == 0)
        continue;
      if (pfds[i].fd == out_pipe.fds[0]) {
        Drain(pfds[i].fd, result.out, out_open);
      } else {
        Drain(pfds[i].fd, result.err, err_open);
      }
    }
  }

  int status = 0;
  while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
  if (!result.timed_out) {
    if (WIFEXITED(status)) {
      result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
      result.exit_code = 128 + WTERMSIG(status);
    }
  }
  return result;
}

bool IsCommandAvailable(const std::string& program) {
  if (program.find('/') != std::string::npos) {
    return access(program.c_str(), X_OK) == 0;
  }
  const char* path = std::getenv("PATH");
  if (!path) {
    return false;
  }
  for (const auto& dir : Split(path, ':')) {
    if (dir.empty())
      continue;
    auto candidate = std::filesystem::path(dir) / program;
    if (access(candidate.c_str(), X_OK) == 0) {
      return true;
    }
  }
  return false;
}

}  // namespace util
}  // namespace netsnmp
