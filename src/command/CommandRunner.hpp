// src/command/CommandRunner.hpp

// ---- CommandRunner Usage ---- //

// All host and guest state is reached by running the host's own tooling
// (wsl.exe, netsh.exe, powershell.exe). CommandRunner is the one seam where
// that happens, so everything above it can be tested with a mock.

// Example:
// ShellCommandRunner runner;
// CommandResult r = runner.run({"netsh.exe", "interface", "portproxy",
//                               "show", "v4tov4"});
// if (r.exit_code != 0) { ... }

// run() never throws on a non-zero exit, callers decide what a failure means.
// runChecked() throws CommandError on a non-zero exit.
// Both throw CommandError if the process could not be started at all.

// Arguments are passed as a vector and quoted for /bin/sh, so values such as
// a firewall rule name with spaces arrive as one argument.

#pragma once

#include <string>
#include <vector>

struct CommandResult {
  int exit_code;
  std::string output; // stdout and stderr, carriage returns stripped
};

class CommandRunner {
public:
  virtual ~CommandRunner() = default;

  virtual CommandResult run(const std::vector<std::string> &argv) = 0;

  CommandResult runChecked(const std::vector<std::string> &argv);

  // human-readable form of argv, used in logs and error messages
  static std::string describe(const std::vector<std::string> &argv);
};

class ShellCommandRunner : public CommandRunner {
public:
  CommandResult run(const std::vector<std::string> &argv) override;

  static std::string quote(const std::string &arg);
};
