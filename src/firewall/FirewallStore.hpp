// src/firewall/FirewallStore.hpp

// ---- FirewallStore Usage ---- //

// Narrow view of the host firewall, keyed by rule name. The host does not
// enforce unique names, FirewallRuleSynchronizer does.

// remove() => delete every rule with that name, false if there was none
// create() => add one rule
// exists() => whether any rule with that name is present

// Implementations throw CommandError when the host tooling fails.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct FirewallRuleSpec {
  std::string name;
  uint16_t port;
  std::vector<std::string> profiles;
  std::string direction = "Inbound";
  std::string protocol = "TCP";
  std::string action = "Allow";

  bool operator==(const FirewallRuleSpec &) const = default;
};

class FirewallStore {
public:
  virtual ~FirewallStore() = default;

  virtual bool remove(const std::string &name) = 0;
  virtual void create(const FirewallRuleSpec &rule) = 0;
  virtual bool exists(const std::string &name) = 0;
};
