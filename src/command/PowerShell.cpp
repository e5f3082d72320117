// src/command/PowerShell.cpp

#include "PowerShell.hpp"

PowerShell::PowerShell(CommandRunner &runner, const std::string &executable)
    : runner_(runner), executable_(executable) {}

CommandResult PowerShell::run(const std::string &script) {
  return runner_.run(
      {executable_, "-NoProfile", "-NonInteractive", "-Command", script});
}

std::string PowerShell::runChecked(const std::string &script) {
  return runner_
      .runChecked(
          {executable_, "-NoProfile", "-NonInteractive", "-Command", script})
      .output;
}

std::string PowerShell::literal(const std::string &text) {
  // inside single quotes only the quote itself needs doubling
  std::string quoted = "'";
  for (char c : text) {
    quoted += c;
    if (c == '\'') {
      quoted += '\'';
    }
  }
  quoted += '\'';
  return quoted;
}
