// src/firewall/PowerShellFirewallStore.hpp
#pragma once

#include <string>

#include "FirewallStore.hpp"
#include "PowerShell.hpp"

// FirewallStore backed by the NetSecurity cmdlets
// (Get-, New- and Remove-NetFirewallRule), rules matched by display name
class PowerShellFirewallStore : public FirewallStore {
public:
  explicit PowerShellFirewallStore(PowerShell &powershell);

  bool remove(const std::string &name) override;
  void create(const FirewallRuleSpec &rule) override;
  bool exists(const std::string &name) override;

  static std::string createScript(const FirewallRuleSpec &rule);

private:
  PowerShell &powershell_;
};
