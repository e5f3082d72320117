// src/cli/CliParser.cpp

#include "CliParser.hpp"
#include "configs.hpp"

#include <algorithm>
#include <cctype>

#include <cxxopts.hpp>

namespace {
std::string lowercase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}
} // namespace

CliOptions CliParser::parse(int argc, const char *const argv[]) {
  CliOptions parsed;

  cxxopts::Options options(
      "portbridge",
      "Forward a host TCP port to a WSL guest whose address changes across "
      "restarts, and keep a matching firewall rule in sync.");
  options.positional_help("<add|refresh|remove|show>");

  std::string action;
  int port = 0;
  std::string distro;
  std::vector<std::string> profiles;
  std::string log_file;

  options.add_options()
      ("action", "add | refresh | remove | show",
       cxxopts::value<std::string>(action))
      ("p,port", "Port to forward (default 3000)", cxxopts::value<int>(port))
      ("d,distro", "WSL distribution to forward to (default Ubuntu)",
       cxxopts::value<std::string>(distro))
      ("6,ipv6", "Also forward IPv6 listeners to the guest",
       cxxopts::value<bool>(parsed.ipv6)->default_value("false"))
      ("profiles", "Firewall profiles for the rule (default Private,Domain)",
       cxxopts::value<std::vector<std::string>>(profiles))
      ("no-firewall",
       "Leave firewall rules alone on remove, keep them absent on add",
       cxxopts::value<bool>(parsed.no_firewall)->default_value("false"))
      ("c,config", "JSON configuration file",
       cxxopts::value<std::string>(parsed.config_file)
           ->default_value(DEFAULT_CONFIG_FILE))
      ("log-file", "Also write the log to this file",
       cxxopts::value<std::string>(log_file))
      ("v,verbose", "Show every command that is run",
       cxxopts::value<bool>(parsed.verbose)->default_value("false"))
      ("h,help", "Show help",
       cxxopts::value<bool>(parsed.help)->default_value("false"));
  options.parse_positional({"action"});

  cxxopts::ParseResult result;
  try {
    result = options.parse(argc, argv);
  } catch (const cxxopts::exceptions::exception &error) {
    throw UsageError(error.what());
  }

  parsed.help_text = options.help();
  if (parsed.help) {
    return parsed;
  }

  if (!result.count("action")) {
    throw UsageError("missing action, expected add, refresh, remove or show");
  }
  parsed.action = parseAction(action);

  if (result.count("port")) {
    if (port < 1 || port > 65535) {
      throw UsageError("port must be between 1 and 65535, got " +
                       std::to_string(port));
    }
    parsed.port = static_cast<uint16_t>(port);
  }

  if (result.count("distro")) {
    if (distro.empty()) {
      throw UsageError("distro name must not be empty");
    }
    parsed.distro = distro;
  }

  if (result.count("profiles")) {
    parsed.profiles = normalizeProfiles(profiles);
  }

  if (result.count("log-file")) {
    parsed.log_file = log_file;
  }

  return parsed;
}

ReconcileRequest CliParser::buildRequest(const CliOptions &options,
                                         const Config &config) {
  if (!options.action) {
    throw UsageError("missing action");
  }

  ReconcileRequest request;
  request.action = *options.action;
  request.port = options.port.value_or(config.port);
  request.guest = options.distro.value_or(config.distro);
  request.include_ipv6 = options.ipv6 || config.ipv6;
  request.manage_firewall = config.firewall_enabled && !options.no_firewall;
  if (options.profiles) {
    request.profiles = *options.profiles;
  } else if (request.manage_firewall) {
    request.profiles = normalizeProfiles(config.firewall_profiles);
  } else {
    // unused without firewall management, left unvalidated
    request.profiles = config.firewall_profiles;
  }

  if (request.guest.empty()) {
    throw UsageError("distro name must not be empty");
  }
  if (request.port == 0) {
    throw UsageError("port must be between 1 and 65535");
  }
  return request;
}

Action CliParser::parseAction(const std::string &name) {
  const std::string action = lowercase(name);
  if (action == "add") {
    return Action::ESTABLISH;
  }
  if (action == "refresh") {
    return Action::REFRESH;
  }
  if (action == "remove") {
    return Action::TEAR_DOWN;
  }
  if (action == "show") {
    return Action::INSPECT;
  }
  throw UsageError("unknown action '" + name +
                   "', expected add, refresh, remove or show");
}

std::vector<std::string>
CliParser::normalizeProfiles(const std::vector<std::string> &profiles) {
  if (profiles.empty()) {
    throw UsageError("at least one firewall profile is required");
  }

  std::vector<std::string> normalized;
  for (const auto &profile : profiles) {
    const std::string wanted = lowercase(profile);

    if (wanted == lowercase(ANY_FIREWALL_PROFILE)) {
      if (profiles.size() != 1) {
        throw UsageError(
            "firewall profile 'Any' cannot be combined with others");
      }
      return {ANY_FIREWALL_PROFILE};
    }

    auto known = std::find_if(
        KNOWN_FIREWALL_PROFILES.begin(), KNOWN_FIREWALL_PROFILES.end(),
        [&](const std::string &name) { return lowercase(name) == wanted; });
    if (known == KNOWN_FIREWALL_PROFILES.end()) {
      throw UsageError("unknown firewall profile '" + profile +
                       "', expected Domain, Private, Public or Any");
    }

    if (std::find(normalized.begin(), normalized.end(), *known) ==
        normalized.end()) {
      normalized.push_back(*known);
    }
  }
  return normalized;
}
