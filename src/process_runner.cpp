#include "process_runner.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

class Pipe {
public:
  Pipe() = default;
  ~Pipe() { close_both(); }
  Pipe(const Pipe&) = delete;
  Pipe& operator=(const Pipe&) = delete;

  bool open() { return ::pipe2(fds_.data(), O_CLOEXEC) == 0; }
  int read_end() const { return fds_[0]; }
  int write_end() const { return fds_[1]; }
  void close_read() { close_fd(fds_[0]); }
  void close_write() { close_fd(fds_[1]); }
  void close_both() { close_read(); close_write(); }

private:
  static void close_fd(int& fd) {
    if(fd >= 0) {
      ::close(fd);
      fd = -1;
    }
  }
  std::array<int, 2> fds_{-1, -1};
};

std::string errno_text(const char* what) {
  return std::string(what) + ": " + std::strerror(errno);
}

// Null-terminated view over argv; built before fork so the child never allocates.
std::vector<char*> make_exec_argv(const std::vector<std::string>& argv) {
  std::vector<char*> raw;
  raw.reserve(argv.size() + 1);
  for(const auto& arg : argv) raw.push_back(const_cast<char*>(arg.c_str()));
  raw.push_back(nullptr);
  return raw;
}

// Only async-signal-safe calls between fork and exec.
[[noreturn]] void exec_child(char* const* argv,
                             int stdin_fd, int stdout_fd, int stderr_fd) {
  if(stdin_fd >= 0) ::dup2(stdin_fd, STDIN_FILENO);
  if(stdout_fd >= 0) ::dup2(stdout_fd, STDOUT_FILENO);
  if(stderr_fd >= 0) ::dup2(stderr_fd, STDERR_FILENO);
  ::execvp(argv[0], argv);
  ::_exit(127);
}

void write_all(int fd, const std::string& data) {
  std::size_t offset = 0;
  while(offset < data.size()) {
    ssize_t n = ::write(fd, data.data() + offset, data.size() - offset);
    if(n < 0) {
      if(errno == EINTR) continue;
      return; // child closed stdin early; its exit status reports the problem
    }
    offset += static_cast<std::size_t>(n);
  }
}

void drain(int out_fd, int err_fd, std::string& out, std::string& err) {
  std::array<char, 4096> buffer{};
  std::array<pollfd, 2> fds{{{out_fd, POLLIN, 0}, {err_fd, POLLIN, 0}}};
  int open_count = 2;
  while(open_count > 0) {
    int ready = ::poll(fds.data(), fds.size(), -1);
    if(ready < 0) {
      if(errno == EINTR) continue;
      return;
    }
    for(std::size_t i = 0; i < fds.size(); ++i) {
      if(fds[i].fd < 0 || fds[i].revents == 0) continue;
      ssize_t n = ::read(fds[i].fd, buffer.data(), buffer.size());
      if(n > 0) {
        (i == 0 ? out : err).append(buffer.data(), static_cast<std::size_t>(n));
      } else if(n == 0 || errno != EINTR) {
        fds[i].fd = -1;
        --open_count;
      }
    }
  }
}

} // namespace

ProcessResult run_process(const std::vector<std::string>& argv, const ProcessOptions& options) {
  ProcessResult result;
  if(argv.empty() || argv.front().empty()) {
    result.error = "empty command";
    return result;
  }

  Pipe in_pipe, out_pipe, err_pipe;
  if(options.stdin_data && !in_pipe.open()) {
    result.error = errno_text("pipe");
    return result;
  }
  if(options.capture_output && (!out_pipe.open() || !err_pipe.open())) {
    result.error = errno_text("pipe");
    return result;
  }
  int null_fd = -1;
  if(!options.capture_output || !options.stdin_data) {
    null_fd = ::open("/dev/null", O_RDWR | O_CLOEXEC);
  }

  auto exec_argv = make_exec_argv(argv);
  pid_t pid = ::fork();
  if(pid < 0) {
    result.error = errno_text("fork");
    if(null_fd >= 0) ::close(null_fd);
    return result;
  }
  if(pid == 0) {
    exec_child(exec_argv.data(),
               options.stdin_data ? in_pipe.read_end() : null_fd,
               options.capture_output ? out_pipe.write_end() : null_fd,
               options.capture_output ? err_pipe.write_end() : null_fd);
  }

  if(null_fd >= 0) ::close(null_fd);
  result.started = true;
  in_pipe.close_read();
  out_pipe.close_write();
  err_pipe.close_write();

  if(options.stdin_data) {
    write_all(in_pipe.write_end(), *options.stdin_data);
    in_pipe.close_write();
  }

  if(options.capture_output) {
    drain(out_pipe.read_end(), err_pipe.read_end(), result.stdout_text, result.stderr_text);
  }

  int status = 0;
  while(::waitpid(pid, &status, 0) < 0) {
    if(errno != EINTR) {
      result.error = errno_text("waitpid");
      return result;
    }
  }
  if(WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
    if(result.exit_code == 127) {
      result.error = "could not execute " + argv.front();
    }
  } else if(WIFSIGNALED(status)) {
    result.error = "terminated by signal " + std::to_string(WTERMSIG(status));
  }
  return result;
}

std::vector<std::string> split_command(const std::string& command_line) {
  std::vector<std::string> parts;
  std::istringstream in(command_line);
  std::string token;
  while(in >> token) parts.push_back(token);
  return parts;
}
