#pragma once

#include <optional>
#include <string>
#include <vector>

struct ProcessResult {
  bool started = false;      // false when fork/exec itself failed
  int exit_code = -1;        // -1 when killed by a signal
  std::string stdout_text;
  std::string stderr_text;
  std::string error;         // why the child could not run, if it did not

  bool succeeded() const { return started && exit_code == 0; }
};

struct ProcessOptions {
  std::optional<std::string> stdin_data;
  // When false the child's stdout/stderr go to /dev/null. Commands that
  // daemonise (xclip, wl-copy) keep inherited pipes open forever.
  bool capture_output = true;
};

// Runs argv[0] (an absolute or PATH-relative program) and blocks until it
// exits. There is no timeout. SIGPIPE must be ignored by the caller if the
// child may exit before reading stdin_data.
ProcessResult run_process(const std::vector<std::string>& argv,
                          const ProcessOptions& options = ProcessOptions());

std::vector<std::string> split_command(const std::string& command_line);
