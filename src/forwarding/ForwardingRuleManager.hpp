// src/forwarding/ForwardingRuleManager.hpp

// ---- ForwardingRuleManager Usage ---- //

// Owns the forwarding entries for one port:
//   v4tov4 0.0.0.0:<port> -> <guest>:<port>
//   v6tov4 [::]:<port>    -> <guest>:<port>   (only with include_ipv6)

// Example:
// ForwardingRuleManager forwarding(store);
// forwarding.remove(3000, false);              // clear stale entries
// forwarding.add(3000, "172.20.10.5", false);

// remove() also clears a v4tov4 entry on 127.0.0.1, older setups forwarded
// loopback only. Entries that do not exist are skipped silently.

// add() assumes remove() ran first, a conflicting entry makes it fail.

// Any store failure is rethrown as ForwardingError naming the entry, e.g.
// "add v4tov4 0.0.0.0:3000 -> 172.20.10.5:3000". Nothing is rolled back.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "ForwardingStore.hpp"

class ForwardingRuleManager {
public:
  explicit ForwardingRuleManager(ForwardingStore &store);

  void remove(uint16_t port, bool include_ipv6);
  void add(uint16_t port, const std::string &target_address,
           bool include_ipv6);
  std::vector<ForwardingEntry> list(ForwardingFamily family);

private:
  ForwardingStore &store_;

  void removeEntry(ForwardingFamily family, const std::string &listen_address,
                   uint16_t port);
  void addEntry(const ForwardingEntry &entry);
};
