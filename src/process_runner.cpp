/**
 * @file process_runner.cpp
 * @brief fork/execvp based ProcessRunner
 */

#include "obs_cutter/process_runner.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

#include "obs_cutter/logging.hpp"

namespace obs_cutter {

namespace {

constexpr size_t READ_CHUNK_SIZE = 4096;

/**
 * @class FileDescriptor
 * @brief RAII owner of a POSIX descriptor. Move-only.
 */
class FileDescriptor {
public:
  FileDescriptor() = default;
  explicit FileDescriptor(int fd) : fd_(fd) {}
  ~FileDescriptor() { reset(); }

  FileDescriptor(const FileDescriptor &) = delete;
  FileDescriptor &operator=(const FileDescriptor &) = delete;

  FileDescriptor(FileDescriptor &&other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
  }
  FileDescriptor &operator=(FileDescriptor &&other) noexcept {
    if (this != &other) {
      reset();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  int get() const { return fd_; }
  bool is_open() const { return fd_ >= 0; }

  void reset() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

private:
  int fd_ = -1;
};

/// Pipe whose ends are both close-on-exec in the parent
bool make_pipe(FileDescriptor &read_end, FileDescriptor &write_end,
               std::string &error) {
  int fds[2];
  if (::pipe(fds) != 0) {
    error = fmt::format("pipe failed: {}", std::strerror(errno));
    return false;
  }
  read_end = FileDescriptor(fds[0]);
  write_end = FileDescriptor(fds[1]);
  ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
  ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
  return true;
}

int wait_for_child(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR)
      return -1;
  }
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return -1;
}

/**
 * @class ChildReaper
 * @brief Closes the read ends, then reaps the child, on every exit path
 *        (including a throwing stderr callback).
 * @note Pipes close first so a child blocked on a full pipe sees EPIPE.
 */
class ChildReaper {
public:
  ChildReaper(pid_t pid, FileDescriptor &out_read, FileDescriptor &err_read)
      : pid_(pid), out_read_(out_read), err_read_(err_read) {}
  ~ChildReaper() {
    if (pid_ > 0)
      reap();
  }

  ChildReaper(const ChildReaper &) = delete;
  ChildReaper &operator=(const ChildReaper &) = delete;

  int reap() {
    out_read_.reset();
    err_read_.reset();
    int code = wait_for_child(pid_);
    pid_ = -1;
    return code;
  }

private:
  pid_t pid_;
  FileDescriptor &out_read_;
  FileDescriptor &err_read_;
};

/// Read once from fd; returns false when the stream reached EOF or failed
bool read_some(int fd, std::string *sink, const ChunkCallback *callback) {
  char buffer[READ_CHUNK_SIZE];
  ssize_t n;
  do {
    n = ::read(fd, buffer, sizeof(buffer));
  } while (n < 0 && errno == EINTR);

  if (n <= 0)
    return false;

  if (sink)
    sink->append(buffer, static_cast<size_t>(n));
  if (callback && *callback)
    (*callback)(buffer, static_cast<size_t>(n));
  return true;
}

} // anonymous namespace

ProcessOutput PosixProcessRunner::run(const std::vector<std::string> &argv) {
  return execute(argv, true, nullptr);
}

ProcessOutput PosixProcessRunner::stream(const std::vector<std::string> &argv,
                                         const ChunkCallback &on_stderr) {
  return execute(argv, false, &on_stderr);
}

ProcessOutput PosixProcessRunner::execute(const std::vector<std::string> &argv,
                                          bool capture_stdout,
                                          const ChunkCallback *on_stderr) {
  ProcessOutput out;

  if (argv.empty()) {
    out.spawn_error = "empty command line";
    return out;
  }

  FileDescriptor out_read, out_write, err_read, err_write, status_read,
      status_write;
  if ((capture_stdout && !make_pipe(out_read, out_write, out.spawn_error)) ||
      !make_pipe(err_read, err_write, out.spawn_error) ||
      !make_pipe(status_read, status_write, out.spawn_error)) {
    return out;
  }

  FileDescriptor dev_null(::open("/dev/null", O_RDWR | O_CLOEXEC));
  if (!dev_null.is_open()) {
    out.spawn_error = fmt::format("open /dev/null failed: {}",
                                  std::strerror(errno));
    return out;
  }

  /// Build argv before fork: only async-signal-safe calls in the child
  std::vector<char *> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto &arg : argv)
    c_argv.push_back(const_cast<char *>(arg.c_str()));
  c_argv.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) {
    out.spawn_error = fmt::format("fork failed: {}", std::strerror(errno));
    return out;
  }

  if (pid == 0) {
    // **---- CHILD ----**
    /// Own process group: a terminal Ctrl+C reaches us, not the encoder
    ::setpgid(0, 0);
    int stdout_target = capture_stdout ? out_write.get() : dev_null.get();
    if (::dup2(dev_null.get(), STDIN_FILENO) < 0 ||
        ::dup2(stdout_target, STDOUT_FILENO) < 0 ||
        ::dup2(err_write.get(), STDERR_FILENO) < 0) {
      int err = errno;
      (void)!::write(status_write.get(), &err, sizeof(err));
      ::_exit(127);
    }
    ::execvp(c_argv[0], c_argv.data());
    int err = errno;
    (void)!::write(status_write.get(), &err, sizeof(err));
    ::_exit(127);
  }

  // **---- PARENT ----**

  out_write.reset();
  err_write.reset();
  status_write.reset();
  dev_null.reset();

  /// Status pipe closes on successful exec; otherwise it carries errno
  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(status_read.get(), &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  status_read.reset();

  if (n > 0) {
    out.spawn_error = fmt::format("failed to start {}: {}", argv[0],
                                  std::strerror(child_errno));
    out.exit_code = wait_for_child(pid);
    return out;
  }
  out.started = true;
  ChildReaper reaper(pid, out_read, err_read);

  /// Drain stdout / stderr until both reach EOF
  while (out_read.is_open() || err_read.is_open()) {
    struct pollfd fds[2];
    nfds_t count = 0;
    int err_slot = -1;
    int out_slot = -1;
    if (err_read.is_open()) {
      err_slot = static_cast<int>(count);
      fds[count++] = {err_read.get(), POLLIN, 0};
    }
    if (out_read.is_open()) {
      out_slot = static_cast<int>(count);
      fds[count++] = {out_read.get(), POLLIN, 0};
    }

    int ready = ::poll(fds, count, -1);
    if (ready < 0) {
      if (errno == EINTR)
        continue;
      LOG_WARN("poll on {} output failed: {}", argv[0], std::strerror(errno));
      break;
    }

    if (err_slot >= 0 && fds[err_slot].revents != 0) {
      if (!read_some(err_read.get(), on_stderr ? nullptr : &out.stderr_text,
                     on_stderr))
        err_read.reset();
    }
    if (out_slot >= 0 && fds[out_slot].revents != 0) {
      if (!read_some(out_read.get(), &out.stdout_text, nullptr))
        out_read.reset();
    }
  }

  out.exit_code = reaper.reap();
  return out;
}

} // namespace obs_cutter
