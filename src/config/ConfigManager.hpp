// src/config/ConfigManager.hpp

// ---- ConfigManager Usage ---- //

// The constructor will attempt to load values from a JSON file.
// If no config file is found, it will use the default values.
// Example:
// ConfigManager mgr("config/config.json");
// Config config = mgr.getConfig();

// Missing sections or keys fall back to their defaults (with a warning),
// so a file only needs the values that differ. Command line options are
// applied on top of the returned Config by the caller.

// Layout:
// {
//   "forwarding": { "port": 3000, "ipv6": false },
//   "guest": { "distro": "Ubuntu", "fallback_interface": "eth0" },
//   "firewall": { "enabled": true, "profiles": ["Private", "Domain"],
//                 "rule_prefix": "WSL Port" },
//   "tools": { "wsl": "wsl.exe", "netsh": "netsh.exe",
//              "powershell": "powershell.exe" }
// }

#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct Config {
  // forwarding
  uint16_t port;
  bool ipv6;

  // guest
  std::string distro;
  std::string fallback_interface;

  // firewall
  bool firewall_enabled;
  std::vector<std::string> firewall_profiles;
  std::string rule_prefix;

  // host tooling
  std::string wsl_executable;
  std::string netsh_executable;
  std::string powershell_executable;

  bool operator==(const Config &) const = default;
};

Config defaultConfig();

class ConfigManager {
public:
  ConfigManager(const std::string &config_file);

  Config getConfig() const;

private:
  std::string config_file_;
  Config config_;

  void loadConfig();
  void loadDefaultConfig();
};
