#include "tool/process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spdlog/spdlog.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <thread>

namespace codeloop {

namespace {

void close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

void set_nonblocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

int decode_status(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

// SIGTERM first, SIGKILL if the group is still alive
int terminate_group(pid_t pid) {
  kill(-pid, SIGTERM);
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  int status = 0;
  if (waitpid(pid, &status, WNOHANG) == pid) {
    return decode_status(status);
  }
  kill(-pid, SIGKILL);
  waitpid(pid, &status, 0);
  return decode_status(status);
}

// Returns false once the descriptor reached EOF or failed
bool drain(int fd, std::string &sink) {
  std::array<char, 4096> buffer;
  while (true) {
    ssize_t n = read(fd, buffer.data(), buffer.size());
    if (n > 0) {
      sink.append(buffer.data(), static_cast<size_t>(n));
      continue;
    }
    if (n == 0) return false;
    if (errno == EINTR) continue;
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

}  // namespace

ProcessOutput run_process(const ProcessOptions &options) {
  ProcessOutput result;
  if (options.argv.empty()) {
    result.error = "empty command";
    return result;
  }

  // Writing to a child that exited must not kill us
  static std::once_flag sigpipe_once;
  std::call_once(sigpipe_once, [] { ::signal(SIGPIPE, SIG_IGN); });

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};

  auto close_all = [&] {
    for (int *p : {in_pipe, out_pipe, err_pipe}) {
      close_fd(p[0]);
      close_fd(p[1]);
    }
  };

  if (pipe(in_pipe) == -1 || pipe(out_pipe) == -1 || (!options.merge_stderr && pipe(err_pipe) == -1)) {
    result.error = "Failed to create pipe: " + std::string(strerror(errno));
    close_all();
    return result;
  }

  // Built before fork; the child only execs
  std::vector<char *> argv;
  argv.reserve(options.argv.size() + 1);
  for (const auto &arg : options.argv) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);
  std::string workdir = options.workdir.string();

  pid_t pid = fork();
  if (pid == -1) {
    result.error = "Failed to fork process: " + std::string(strerror(errno));
    close_all();
    return result;
  }

  if (pid == 0) {
    // ---- Child process ----
    setpgid(0, 0);
    dup2(in_pipe[0], STDIN_FILENO);
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(options.merge_stderr ? out_pipe[1] : err_pipe[1], STDERR_FILENO);
    for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) {
      if (fd > STDERR_FILENO) ::close(fd);
    }

    if (!workdir.empty() && chdir(workdir.c_str()) != 0) {
      _exit(127);
    }

    execvp(argv[0], argv.data());
    _exit(127);  // exec failed
  }

  // ---- Parent process ----
  setpgid(pid, pid);
  close_fd(in_pipe[0]);
  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);

  int &in_fd = in_pipe[1];
  int &out_fd = out_pipe[0];
  int &err_fd = err_pipe[0];

  set_nonblocking(out_fd);
  if (err_fd >= 0) set_nonblocking(err_fd);
  if (options.stdin_data.empty()) {
    close_fd(in_fd);
  } else {
    set_nonblocking(in_fd);
  }

  auto deadline = std::chrono::steady_clock::now() + options.timeout;
  auto aborted = [&options] {
    return options.abort_signal && options.abort_signal->load();
  };

  size_t written = 0;
  bool reaped = false;
  int status = 0;

  while (out_fd >= 0 || err_fd >= 0) {
    if (aborted()) {
      result.cancelled = true;
      break;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      result.timed_out = true;
      break;
    }

    std::array<pollfd, 3> fds{};
    nfds_t count = 0;
    if (out_fd >= 0) fds[count++] = {out_fd, POLLIN, 0};
    if (err_fd >= 0) fds[count++] = {err_fd, POLLIN, 0};
    if (in_fd >= 0) fds[count++] = {in_fd, POLLOUT, 0};

    int rc = poll(fds.data(), count, 50);
    if (rc < 0) {
      if (errno == EINTR) continue;
      spdlog::warn("[Process] poll failed: {}", strerror(errno));
      break;
    }

    for (nfds_t i = 0; i < count; ++i) {
      if (fds[i].revents == 0) continue;
      int fd = fds[i].fd;
      if (fd == out_fd) {
        if (!drain(out_fd, result.out)) close_fd(out_fd);
      } else if (fd == err_fd) {
        if (!drain(err_fd, result.err)) close_fd(err_fd);
      } else if (fd == in_fd) {
        if (fds[i].revents & (POLLERR | POLLHUP)) {
          close_fd(in_fd);
          continue;
        }
        ssize_t n = write(in_fd, options.stdin_data.data() + written, options.stdin_data.size() - written);
        if (n > 0) {
          written += static_cast<size_t>(n);
          if (written >= options.stdin_data.size()) close_fd(in_fd);
        } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
          close_fd(in_fd);
        }
      }
    }
  }

  // Output closed; the child may still be running
  while (!result.cancelled && !result.timed_out) {
    pid_t ret = waitpid(pid, &status, WNOHANG);
    if (ret == pid) {
      reaped = true;
      result.exit_code = decode_status(status);
      break;
    }
    if (ret == -1) {
      reaped = true;
      break;
    }
    if (aborted()) {
      result.cancelled = true;
    } else if (std::chrono::steady_clock::now() >= deadline) {
      result.timed_out = true;
    } else {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }

  if (!reaped) {
    result.exit_code = terminate_group(pid);
    if (result.timed_out) {
      result.exit_code = 124;  // Same as GNU timeout
    }
  }

  close_all();
  return result;
}

}  // namespace codeloop
