// src/cli/CliParser.hpp

// ---- CliParser Usage ---- //

// Turns the command line into CliOptions, then merges them with the loaded
// Config into the ReconcileRequest the Reconciler runs.

// Example:
// CliOptions options = CliParser::parse(argc, argv);
// ConfigManager config_manager(options.config_file);
// ReconcileRequest request =
//     CliParser::buildRequest(options, config_manager.getConfig());

// Values given on the command line win over the config file. Flags can
// only switch things on (--ipv6) or off (--no-firewall).

// parse() and buildRequest() throw UsageError for anything invalid: unknown
// action, port outside 1-65535, empty distro, unknown firewall profile.

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ConfigManager.hpp"
#include "Errors.hpp"
#include "Reconciler.hpp"

class UsageError : public PortbridgeError {
public:
  explicit UsageError(const std::string &message) : PortbridgeError(message) {}
};

struct CliOptions {
  std::optional<Action> action;
  std::optional<uint16_t> port;
  std::optional<std::string> distro;
  bool ipv6 = false;
  std::optional<std::vector<std::string>> profiles;
  bool no_firewall = false;
  std::string config_file;
  std::optional<std::string> log_file;
  bool verbose = false;
  bool help = false;
  std::string help_text;
};

class CliParser {
public:
  static CliOptions parse(int argc, const char *const argv[]);

  static ReconcileRequest buildRequest(const CliOptions &options,
                                       const Config &config);

  static Action parseAction(const std::string &name);

  // case-insensitive match against Domain/Private/Public, "Any" alone
  static std::vector<std::string>
  normalizeProfiles(const std::vector<std::string> &profiles);
};
