// src/forwarding/ForwardingRuleManager.cpp

#include "ForwardingRuleManager.hpp"
#include "Errors.hpp"
#include "configs.hpp"

#include <spdlog/spdlog.h>

namespace {
std::string describeKey(ForwardingFamily family,
                        const std::string &listen_address, uint16_t port) {
  // bracket IPv6 listen addresses so the port stays readable
  const std::string address = family == ForwardingFamily::V6_TO_V4
                                  ? "[" + listen_address + "]"
                                  : listen_address;
  return toString(family) + " " + address + ":" + std::to_string(port);
}
} // namespace

ForwardingRuleManager::ForwardingRuleManager(ForwardingStore &store)
    : store_(store) {}

void ForwardingRuleManager::remove(uint16_t port, bool include_ipv6) {
  spdlog::info("Removing forwarding entries for port {}.", port);

  removeEntry(ForwardingFamily::V4_TO_V4, LOOPBACK_V4, port);
  removeEntry(ForwardingFamily::V4_TO_V4, ANY_ADDRESS_V4, port);
  if (include_ipv6) {
    removeEntry(ForwardingFamily::V6_TO_V4, ANY_ADDRESS_V6, port);
  }
}

void ForwardingRuleManager::add(uint16_t port,
                                const std::string &target_address,
                                bool include_ipv6) {
  spdlog::info("Forwarding port {} to {}:{}.", port, target_address, port);

  addEntry(ForwardingEntry{ForwardingFamily::V4_TO_V4, ANY_ADDRESS_V4, port,
                           target_address, port});
  if (include_ipv6) {
    addEntry(ForwardingEntry{ForwardingFamily::V6_TO_V4, ANY_ADDRESS_V6, port,
                             target_address, port});
  }
}

std::vector<ForwardingEntry>
ForwardingRuleManager::list(ForwardingFamily family) {
  try {
    return store_.list(family);
  } catch (const CommandError &error) {
    throw ForwardingError("show " + toString(family), error.what());
  }
}

void ForwardingRuleManager::removeEntry(ForwardingFamily family,
                                        const std::string &listen_address,
                                        uint16_t port) {
  const std::string key = describeKey(family, listen_address, port);
  try {
    if (store_.remove(family, listen_address, port)) {
      spdlog::info("Deleted {}.", key);
    } else {
      spdlog::debug("Nothing to delete for {}.", key);
    }
  } catch (const CommandError &error) {
    spdlog::critical("Could not delete {}: {}", key, error.what());
    throw ForwardingError("delete " + key, error.what());
  }
}

void ForwardingRuleManager::addEntry(const ForwardingEntry &entry) {
  const std::string operation =
      "add " + describeKey(entry.family, entry.listen_address,
                           entry.listen_port) +
      " -> " + entry.connect_address + ":" +
      std::to_string(entry.connect_port);
  try {
    store_.add(entry);
    spdlog::info("Created {}.", operation.substr(4));
  } catch (const CommandError &error) {
    spdlog::critical("Could not {}: {}", operation, error.what());
    throw ForwardingError(operation, error.what());
  }
}
