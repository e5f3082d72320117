// src/firewall/FirewallRuleSynchronizer.cpp

#include "FirewallRuleSynchronizer.hpp"
#include "Errors.hpp"

#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>

FirewallRuleSynchronizer::FirewallRuleSynchronizer(
    FirewallStore &store, const std::string &rule_prefix)
    : store_(store), rule_prefix_(rule_prefix) {}

void FirewallRuleSynchronizer::sync(uint16_t port,
                                    const std::vector<std::string> &profiles,
                                    bool enabled) {
  const std::string name = ruleName(port);

  try {
    if (store_.remove(name)) {
      spdlog::info("Removed firewall rule '{}'.", name);
    } else {
      spdlog::debug("No firewall rule '{}' to remove.", name);
    }
  } catch (const CommandError &error) {
    spdlog::error("Could not remove firewall rule '{}': {}", name,
                  error.what());
    throw FirewallError("delete rule '" + name + "'", error.what());
  }

  if (!enabled) {
    return;
  }

  FirewallRuleSpec rule{name, port, profiles};
  try {
    store_.create(rule);
  } catch (const CommandError &error) {
    spdlog::error("Could not create firewall rule '{}': {}", name,
                  error.what());
    throw FirewallError("create rule '" + name + "'", error.what());
  }

  spdlog::info("Created firewall rule '{}' ({} TCP {}, profiles {}).", name,
               rule.direction, port, fmt::join(profiles, ","));
}

bool FirewallRuleSynchronizer::isPresent(uint16_t port) {
  const std::string name = ruleName(port);
  try {
    return store_.exists(name);
  } catch (const CommandError &error) {
    throw FirewallError("query rule '" + name + "'", error.what());
  }
}

std::string FirewallRuleSynchronizer::ruleName(uint16_t port) const {
  return rule_prefix_ + " " + std::to_string(port);
}
