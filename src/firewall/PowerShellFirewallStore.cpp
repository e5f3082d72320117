// src/firewall/PowerShellFirewallStore.cpp

#include "PowerShellFirewallStore.hpp"
#include "Errors.hpp"

#include <spdlog/spdlog.h>

PowerShellFirewallStore::PowerShellFirewallStore(PowerShell &powershell)
    : powershell_(powershell) {}

bool PowerShellFirewallStore::remove(const std::string &name) {
  if (!exists(name)) {
    return false;
  }

  // removes every rule carrying the name, duplicates included
  powershell_.runChecked("Remove-NetFirewallRule -DisplayName " +
                         PowerShell::literal(name) + " -ErrorAction Stop");
  return true;
}

void PowerShellFirewallStore::create(const FirewallRuleSpec &rule) {
  powershell_.runChecked(createScript(rule));
}

bool PowerShellFirewallStore::exists(const std::string &name) {
  const std::string script =
      "@(Get-NetFirewallRule -DisplayName " + PowerShell::literal(name) +
      " -ErrorAction SilentlyContinue).Count";
  const std::string output = powershell_.runChecked(script);

  try {
    return std::stoi(output) > 0;
  } catch (const std::exception &) {
    throw CommandError(script, 0, "unexpected rule count: " + output);
  }
}

std::string
PowerShellFirewallStore::createScript(const FirewallRuleSpec &rule) {
  // New-NetFirewallRule -DisplayName 'WSL Port 3000' -Direction Inbound
  //   -Action Allow -Protocol TCP -LocalPort 3000 -Profile Private,Domain
  std::string profiles;
  for (const auto &profile : rule.profiles) {
    if (!profiles.empty()) {
      profiles += ',';
    }
    profiles += profile;
  }

  return "New-NetFirewallRule -DisplayName " + PowerShell::literal(rule.name) +
         " -Direction " + rule.direction + " -Action " + rule.action +
         " -Protocol " + rule.protocol + " -LocalPort " +
         std::to_string(rule.port) + " -Profile " + profiles +
         " -ErrorAction Stop | Out-Null";
}
