// src/command/CommandRunner.cpp

#include "CommandRunner.hpp"
#include "Errors.hpp"

#include <array>
#include <cstdio>
#include <sys/wait.h>

#include <spdlog/spdlog.h>

CommandResult CommandRunner::runChecked(const std::vector<std::string> &argv) {
  CommandResult result = run(argv);
  if (result.exit_code != 0) {
    throw CommandError(describe(argv), result.exit_code, result.output);
  }
  return result;
}

std::string CommandRunner::describe(const std::vector<std::string> &argv) {
  std::string description;
  for (const auto &arg : argv) {
    if (!description.empty()) {
      description += ' ';
    }
    description += arg;
  }
  return description;
}

CommandResult ShellCommandRunner::run(const std::vector<std::string> &argv) {
  if (argv.empty()) {
    throw CommandError("<empty>", -1, "empty command");
  }

  std::string command;
  for (const auto &arg : argv) {
    command += quote(arg) + ' ';
  }
  // merge stderr so tool diagnostics end up in error messages
  command += "2>&1";

  spdlog::debug("Executing: {}", describe(argv));

  FILE *pipe = popen(command.c_str(), "r");
  if (!pipe) {
    spdlog::critical("Could not start: {}", describe(argv));
    throw CommandError(describe(argv), -1, "could not start process");
  }

  std::string output;
  std::array<char, 4096> buffer{};
  size_t bytes_read = 0;
  while ((bytes_read = fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
    output.append(buffer.data(), bytes_read);
  }

  int status = pclose(pipe);
  if (status == -1) {
    throw CommandError(describe(argv), -1, "could not collect exit status");
  }

  int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;

  // Windows tools answer with CRLF line endings
  std::erase(output, '\r');

  spdlog::debug("Exit code {} from {}", exit_code, argv.front());
  return CommandResult{exit_code, output};
}

std::string ShellCommandRunner::quote(const std::string &arg) {
  // single quotes preserve everything except the single quote itself
  std::string quoted = "'";
  for (char c : arg) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += '\'';
  return quoted;
}
