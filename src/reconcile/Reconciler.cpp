// src/reconcile/Reconciler.cpp

#include "Reconciler.hpp"
#include "Errors.hpp"

#include <spdlog/spdlog.h>

std::string toString(Action action) {
  switch (action) {
  case Action::ESTABLISH:
    return "add";
  case Action::REFRESH:
    return "refresh";
  case Action::TEAR_DOWN:
    return "remove";
  case Action::INSPECT:
    return "show";
  }
  return "unknown";
}

Reconciler::Reconciler(PrivilegeCheck &privilege, AddressResolver &resolver,
                       ForwardingRuleManager &forwarding,
                       FirewallRuleSynchronizer &firewall)
    : privilege_(privilege), resolver_(resolver), forwarding_(forwarding),
      firewall_(firewall) {}

ReconcileResult Reconciler::run(const ReconcileRequest &request) {
  // throws PrivilegeError before any sub-operation
  privilege_.require();

  spdlog::info("Running '{}' for port {} (guest '{}', ipv6 {}, firewall {}).",
               toString(request.action), request.port, request.guest,
               request.include_ipv6 ? "on" : "off",
               request.manage_firewall ? "managed" : "unmanaged");

  ReconcileResult result{true, FailureKind::NONE, std::nullopt, "",
                         std::nullopt};

  if (request.action == Action::INSPECT) {
    try {
      result.table = snapshot(request);
    } catch (const ForwardingError &error) {
      spdlog::error("Could not read current state: {}", error.what());
      result.success = false;
      result.failure = FailureKind::FORWARDING;
      result.summary = error.what();
      return result;
    }

    if (result.table->firewall_query_error) {
      result.success = false;
      result.failure = FailureKind::FIREWALL;
      result.summary = *result.table->firewall_query_error;
    } else {
      result.summary = "Current forwarding state for port " +
                       std::to_string(request.port) + ".";
    }
    return result;
  }

  try {
    if (request.action == Action::TEAR_DOWN) {
      tearDown(request, result);
    } else {
      establish(request, result);
    }
  } catch (const ResolutionError &error) {
    result.success = false;
    result.failure = FailureKind::RESOLUTION;
    result.summary =
        std::string(error.what()) + ". Existing entries left as they are.";
  } catch (const ForwardingError &error) {
    result.success = false;
    result.failure = FailureKind::FORWARDING;
    result.summary = error.what();
  } catch (const FirewallError &error) {
    result.success = false;
    result.failure = FailureKind::FIREWALL;
    result.summary = std::string(error.what()) +
                     ". Forwarding changes already applied were kept.";
  }

  if (!result.success) {
    spdlog::error("'{}' failed: {}", toString(request.action), result.summary);
  }

  // always show what actually took effect
  result.table = trySnapshot(request);
  return result;
}

void Reconciler::establish(const ReconcileRequest &request,
                           ReconcileResult &result) {
  // resolve first, a missing guest must not tear down what is there
  const std::string address = resolver_.resolve(request.guest);
  result.guest_address = address;

  forwarding_.remove(request.port, request.include_ipv6);
  forwarding_.add(request.port, address, request.include_ipv6);

  // with firewall management off the rule is made sure to be absent
  firewall_.sync(request.port, request.profiles, request.manage_firewall);

  result.summary = "Port " + std::to_string(request.port) +
                   " forwarded to " + address + ":" +
                   std::to_string(request.port) + ".";
  spdlog::info("{}", result.summary);
}

void Reconciler::tearDown(const ReconcileRequest &request,
                          ReconcileResult &result) {
  forwarding_.remove(request.port, request.include_ipv6);

  if (request.manage_firewall) {
    firewall_.sync(request.port, request.profiles, false);
  }

  result.summary =
      "Forwarding for port " + std::to_string(request.port) + " removed.";
  spdlog::info("{}", result.summary);
}

TableSnapshot Reconciler::snapshot(const ReconcileRequest &request) {
  TableSnapshot table;
  table.v4_entries = forwarding_.list(ForwardingFamily::V4_TO_V4);
  table.v6_entries = forwarding_.list(ForwardingFamily::V6_TO_V4);
  table.firewall_rule_name = firewall_.ruleName(request.port);
  if (request.manage_firewall) {
    // the forwarding rows stay readable when the firewall query fails
    try {
      table.firewall_rule_present = firewall_.isPresent(request.port);
    } catch (const FirewallError &error) {
      spdlog::warn("Could not query firewall rule '{}': {}",
                   table.firewall_rule_name, error.what());
      table.firewall_query_error = error.what();
    }
  }
  return table;
}

std::optional<TableSnapshot>
Reconciler::trySnapshot(const ReconcileRequest &request) {
  try {
    return snapshot(request);
  } catch (const ForwardingError &error) {
    spdlog::warn("Could not read resulting state: {}", error.what());
    return std::nullopt;
  }
}
