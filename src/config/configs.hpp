// src/config/configs.hpp

#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Forwarded port, the guest's web UI is published on 3000
constexpr uint16_t DEFAULT_PORT = 3000;

// WSL distribution the service lives in
const std::string DEFAULT_DISTRO = "Ubuntu";

// Interface asked for when "hostname -I" gives nothing
const std::string DEFAULT_FALLBACK_INTERFACE = "eth0";

// Firewall rule names are "<prefix> <port>", e.g. "WSL Port 3000"
const std::string DEFAULT_RULE_PREFIX = "WSL Port";
const std::vector<std::string> DEFAULT_FIREWALL_PROFILES = {"Private",
                                                            "Domain"};
// Profile names the firewall accepts, "Any" must stand alone
const std::vector<std::string> KNOWN_FIREWALL_PROFILES = {"Domain", "Private",
                                                          "Public"};
const std::string ANY_FIREWALL_PROFILE = "Any";

// Listen addresses
const std::string LOOPBACK_V4 = "127.0.0.1";
const std::string ANY_ADDRESS_V4 = "0.0.0.0";
const std::string ANY_ADDRESS_V6 = "::";

// Host tooling, reachable from Windows and from inside WSL through interop
const std::string DEFAULT_WSL_EXECUTABLE = "wsl.exe";
const std::string DEFAULT_NETSH_EXECUTABLE = "netsh.exe";
const std::string DEFAULT_POWERSHELL_EXECUTABLE = "powershell.exe";

const std::string DEFAULT_CONFIG_FILE = "config/config.json";
