// src/privilege/PrivilegeCheck.cpp

#include "PrivilegeCheck.hpp"
#include "Errors.hpp"

#include <spdlog/spdlog.h>

void PrivilegeCheck::require() {
  bool elevated = false;
  try {
    elevated = isAdministrator();
  } catch (const CommandError &error) {
    spdlog::critical("Could not determine privileges: {}", error.what());
    throw PrivilegeError(std::string("could not determine privileges: ") +
                         error.what());
  }

  if (!elevated) {
    spdlog::critical("Administrator rights are required.");
    throw PrivilegeError(
        "administrator rights are required, run from an elevated shell");
  }
}

WindowsAdminCheck::WindowsAdminCheck(PowerShell &powershell)
    : powershell_(powershell) {}

bool WindowsAdminCheck::isAdministrator() {
  const std::string output = powershell_.runChecked(
      "([Security.Principal.WindowsPrincipal]"
      "[Security.Principal.WindowsIdentity]::GetCurrent())"
      ".IsInRole([Security.Principal.WindowsBuiltInRole]::Administrator)");
  // prints "True" or "False"
  return output.find("True") != std::string::npos;
}
