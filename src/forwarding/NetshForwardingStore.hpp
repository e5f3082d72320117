// src/forwarding/NetshForwardingStore.hpp

// ForwardingStore backed by "netsh interface portproxy".

// netsh does not tell a missing entry apart from a real failure on delete
// (both exit non-zero), so a failed delete is followed by a re-list: if no
// entry with that key is left the delete counts as "nothing to remove".

#pragma once

#include <string>
#include <vector>

#include "CommandRunner.hpp"
#include "ForwardingStore.hpp"

class NetshForwardingStore : public ForwardingStore {
public:
  NetshForwardingStore(CommandRunner &runner,
                       const std::string &netsh_executable);

  void add(const ForwardingEntry &entry) override;
  bool remove(ForwardingFamily family, const std::string &listen_address,
              uint16_t listen_port) override;
  std::vector<ForwardingEntry> list(ForwardingFamily family) override;

  // parses the table printed by "netsh interface portproxy show <family>"
  static std::vector<ForwardingEntry> parseTable(ForwardingFamily family,
                                                 const std::string &output);

private:
  CommandRunner &runner_;
  std::string netsh_executable_;
};
