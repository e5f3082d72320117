// src/config/ConfigManager.cpp

#include "ConfigManager.hpp"
#include "configs.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

// Anonymous namespace (to avoid cluttering global namespace)
namespace {
namespace nm = nlohmann;

// Helper functions
template <typename T>
T getValueWithLog(const nm::json &j, const std::string &section,
                  const std::string &key, const T &defaultValue);
const nm::json &sectionOrEmpty(const nm::json &j, const std::string &section);
void loadForwarding(const nm::json &j, Config &config);
void loadGuest(const nm::json &j, Config &config);
void loadFirewall(const nm::json &j, Config &config);
void loadTools(const nm::json &j, Config &config);
} // namespace

Config defaultConfig() {
  return Config{DEFAULT_PORT,
                false,
                DEFAULT_DISTRO,
                DEFAULT_FALLBACK_INTERFACE,
                true,
                DEFAULT_FIREWALL_PROFILES,
                DEFAULT_RULE_PREFIX,
                DEFAULT_WSL_EXECUTABLE,
                DEFAULT_NETSH_EXECUTABLE,
                DEFAULT_POWERSHELL_EXECUTABLE};
}

ConfigManager::ConfigManager(const std::string &config_file)
    : config_file_(config_file), config_(defaultConfig()) {
  try {
    loadConfig();
  } catch (const std::exception &error) {
    spdlog::warn("No configuration available: {}. Using default "
                 "configuration.",
                 error.what());
    loadDefaultConfig();
  }
}

Config ConfigManager::getConfig() const { return config_; }

void ConfigManager::loadConfig() {
  std::ifstream infile(config_file_);
  if (!infile) {
    throw std::runtime_error("Error opening config file: " + config_file_);
  }

  try {
    nm::json j;
    infile >> j;

    Config loaded = defaultConfig();
    loadForwarding(j, loaded);
    loadGuest(j, loaded);
    loadFirewall(j, loaded);
    loadTools(j, loaded);
    config_ = loaded;

    spdlog::debug("Loaded configuration from {}.", config_file_);
  } catch (const std::exception &error) {
    spdlog::error("Error parsing config file {}: {}", config_file_,
                  error.what());
    throw;
  }
}

void ConfigManager::loadDefaultConfig() { config_ = defaultConfig(); }

// ---- Helper function implementations ---- //

namespace {

// Helper function: if key is missing, log and return default.
template <typename T>
T getValueWithLog(const nm::json &j, const std::string &section,
                  const std::string &key, const T &defaultValue) {
  if (!j.contains(key)) {
    spdlog::warn("Key '{}.{}' not found, using default.", section, key);
    return defaultValue;
  }
  return j.at(key).get<T>();
}

// Helper function: a missing section behaves like an empty one
const nm::json &sectionOrEmpty(const nm::json &j, const std::string &section) {
  static const nm::json empty = nm::json::object();
  if (!j.contains(section)) {
    spdlog::warn("Section '{}' not found in configuration, using defaults.",
                 section);
    return empty;
  }
  return j.at(section);
}

void loadForwarding(const nm::json &j, Config &config) {
  const auto &sec = sectionOrEmpty(j, "forwarding");

  int port = getValueWithLog<int>(sec, "forwarding", "port", config.port);
  if (port < 1 || port > 65535) {
    spdlog::warn("Port {} out of range, using default {}.", port, config.port);
  } else {
    config.port = static_cast<uint16_t>(port);
  }
  config.ipv6 = getValueWithLog(sec, "forwarding", "ipv6", config.ipv6);
}

void loadGuest(const nm::json &j, Config &config) {
  const auto &sec = sectionOrEmpty(j, "guest");
  config.distro = getValueWithLog(sec, "guest", "distro", config.distro);
  config.fallback_interface = getValueWithLog(
      sec, "guest", "fallback_interface", config.fallback_interface);
}

void loadFirewall(const nm::json &j, Config &config) {
  const auto &sec = sectionOrEmpty(j, "firewall");
  config.firewall_enabled =
      getValueWithLog(sec, "firewall", "enabled", config.firewall_enabled);
  config.firewall_profiles =
      getValueWithLog(sec, "firewall", "profiles", config.firewall_profiles);
  config.rule_prefix =
      getValueWithLog(sec, "firewall", "rule_prefix", config.rule_prefix);
}

void loadTools(const nm::json &j, Config &config) {
  const auto &sec = sectionOrEmpty(j, "tools");
  config.wsl_executable =
      getValueWithLog(sec, "tools", "wsl", config.wsl_executable);
  config.netsh_executable =
      getValueWithLog(sec, "tools", "netsh", config.netsh_executable);
  config.powershell_executable =
      getValueWithLog(sec, "tools", "powershell", config.powershell_executable);
}
} // namespace
