// src/main.cpp

#include <iostream>

#include <spdlog/spdlog.h>

#include "AddressResolver.hpp"
#include "CliParser.hpp"
#include "CommandRunner.hpp"
#include "ConfigManager.hpp"
#include "Errors.hpp"
#include "FirewallRuleSynchronizer.hpp"
#include "ForwardingRuleManager.hpp"
#include "LanAddresses.hpp"
#include "Logging.hpp"
#include "NetshForwardingStore.hpp"
#include "PowerShell.hpp"
#include "PowerShellFirewallStore.hpp"
#include "PrivilegeCheck.hpp"
#include "Reconciler.hpp"
#include "Renderer.hpp"
#include "WslGuestQuery.hpp"

namespace {
constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;
} // namespace

int main(int argc, char *argv[]) {
  CliOptions options;
  try {
    options = CliParser::parse(argc, argv);
  } catch (const UsageError &error) {
    std::cerr << "portbridge: " << error.what() << "\n"
              << "Try 'portbridge --help'.\n";
    return EXIT_USAGE;
  }

  if (options.help) {
    std::cout << options.help_text << "\n";
    return EXIT_OK;
  }

  try {
    setupLogging(options.verbose, options.log_file);
  } catch (const spdlog::spdlog_ex &error) {
    std::cerr << "portbridge: could not set up logging: " << error.what()
              << "\n";
    return EXIT_FAILED;
  }

  ConfigManager config_manager(options.config_file);
  const Config config = config_manager.getConfig();

  ReconcileRequest request;
  try {
    request = CliParser::buildRequest(options, config);
  } catch (const UsageError &error) {
    std::cerr << "portbridge: " << error.what() << "\n";
    return EXIT_USAGE;
  }

  // host tooling behind the store interfaces
  ShellCommandRunner runner;
  PowerShell powershell(runner, config.powershell_executable);
  WslGuestQuery guest_query(runner, config.wsl_executable);
  NetshForwardingStore forwarding_store(runner, config.netsh_executable);
  PowerShellFirewallStore firewall_store(powershell);
  WindowsAdminCheck privilege(powershell);

  AddressResolver resolver(guest_query, config.fallback_interface);
  ForwardingRuleManager forwarding(forwarding_store);
  FirewallRuleSynchronizer firewall(firewall_store, config.rule_prefix);
  Reconciler reconciler(privilege, resolver, forwarding, firewall);

  Renderer renderer(std::cout);

  try {
    ReconcileResult result = reconciler.run(request);
    renderer.render(request, result);

    if (result.success && (request.action == Action::ESTABLISH ||
                           request.action == Action::REFRESH)) {
      try {
        LanAddresses lan(powershell);
        renderer.renderLanHint(request.port, lan.list());
      } catch (const CommandError &error) {
        spdlog::warn("Could not list LAN addresses: {}", error.what());
      }
    }

    return result.success ? EXIT_OK : EXIT_FAILED;
  } catch (const PrivilegeError &error) {
    spdlog::critical("Nothing was changed: {}", error.what());
    return EXIT_FAILED;
  } catch (const PortbridgeError &error) {
    spdlog::critical("Fatal error: {}", error.what());
    return EXIT_FAILED;
  }
}
