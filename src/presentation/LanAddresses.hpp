// src/presentation/LanAddresses.hpp

// Lists the host's IPv4 addresses other machines on the network can use.
// Loopback, link-local (169.254/16) and Hyper-V virtual switch adapters
// (the guest's own network) are left out.

#pragma once

#include <string>
#include <vector>

#include "PowerShell.hpp"

class LanAddresses {
public:
  explicit LanAddresses(PowerShell &powershell);

  // throws CommandError when the host cannot be queried
  std::vector<std::string> list();

  static std::vector<std::string> parse(const std::string &output);

private:
  PowerShell &powershell_;
};
