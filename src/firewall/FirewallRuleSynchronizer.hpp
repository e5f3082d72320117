// src/firewall/FirewallRuleSynchronizer.hpp

// ---- FirewallRuleSynchronizer Usage ---- //

// Keeps exactly zero or one allow-rule per forwarded port. The rule name is
// derived from the port ("WSL Port 3000"), so the same port always maps to
// the same rule.

// Example:
// FirewallRuleSynchronizer firewall(store, "WSL Port");
// firewall.sync(3000, {"Private", "Domain"}, true);  // one rule present
// firewall.sync(3000, {}, false);                    // rule absent

// sync() always deletes first, then creates only when enabled. Running it
// any number of times leaves at most one rule behind.

// Store failures are rethrown as FirewallError. Forwarding entries that were
// already changed are left as they are.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "FirewallStore.hpp"

class FirewallRuleSynchronizer {
public:
  FirewallRuleSynchronizer(FirewallStore &store,
                           const std::string &rule_prefix);

  void sync(uint16_t port, const std::vector<std::string> &profiles,
            bool enabled);
  bool isPresent(uint16_t port);

  std::string ruleName(uint16_t port) const;

private:
  FirewallStore &store_;
  std::string rule_prefix_;
};
