// src/command/PowerShell.hpp

// Runs one-line PowerShell scripts through a CommandRunner:
//   powershell.exe -NoProfile -NonInteractive -Command "<script>"
// Cmdlets should use -ErrorAction Stop so a failure becomes a non-zero exit.

#pragma once

#include <string>

#include "CommandRunner.hpp"

class PowerShell {
public:
  PowerShell(CommandRunner &runner, const std::string &executable);

  CommandResult run(const std::string &script);
  // throws CommandError on a non-zero exit
  std::string runChecked(const std::string &script);

  // 'text' as a PowerShell single-quoted literal
  static std::string literal(const std::string &text);

private:
  CommandRunner &runner_;
  std::string executable_;
};
