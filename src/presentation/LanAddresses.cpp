// src/presentation/LanAddresses.cpp

#include "LanAddresses.hpp"
#include "AddressResolver.hpp"

#include <sstream>

LanAddresses::LanAddresses(PowerShell &powershell) : powershell_(powershell) {}

std::vector<std::string> LanAddresses::list() {
  return parse(powershell_.runChecked(
      "Get-NetIPAddress -AddressFamily IPv4 -ErrorAction Stop | "
      "Where-Object { $_.InterfaceAlias -notmatch 'Loopback|vEthernet' } | "
      "Select-Object -ExpandProperty IPAddress"));
}

std::vector<std::string> LanAddresses::parse(const std::string &output) {
  std::vector<std::string> addresses;
  std::istringstream lines(output);
  std::string line;

  while (std::getline(lines, line)) {
    auto address = AddressResolver::firstIpv4Token(line);
    if (!address) {
      continue;
    }
    if (address->rfind("127.", 0) == 0 || address->rfind("169.254.", 0) == 0) {
      continue;
    }
    addresses.push_back(*address);
  }
  return addresses;
}
