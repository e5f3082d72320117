// src/reconcile/Reconciler.hpp

// ---- Reconciler Usage ---- //

// Composes the resolver, the forwarding manager and the firewall
// synchronizer into the four operations the tool offers. Every call is a
// one-shot transition, nothing is remembered between invocations.

// Example:
// Reconciler reconciler(privilege, resolver, forwarding, firewall);
// ReconcileResult result = reconciler.run(request);
// if (!result.success) { ... }

// Operations:
// ESTABLISH / REFRESH => resolve, remove, add, sync firewall
//                        (identical, refresh just says "the address moved")
// TEAR_DOWN           => remove, sync firewall to absent
// INSPECT             => list the table, no changes

// Ordering rules:
// - the privilege check runs first and throws PrivilegeError, nothing else
//   happens in that case
// - the address is resolved before anything is removed; when it cannot be
//   found the existing entries are left standing
// - stale entries are always removed before new ones are added

// Failures from resolution, forwarding and firewall are reported through
// ReconcileResult, not thrown, so the table can still be shown. Changes made
// before a failure are not rolled back.

// Two invocations running at once against the same port can interleave their
// remove/add steps. There is no locking.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "AddressResolver.hpp"
#include "FirewallRuleSynchronizer.hpp"
#include "ForwardingRuleManager.hpp"
#include "PrivilegeCheck.hpp"

enum class Action { ESTABLISH, REFRESH, TEAR_DOWN, INSPECT };

std::string toString(Action action);

struct ReconcileRequest {
  Action action;
  uint16_t port;
  std::string guest;
  bool include_ipv6;
  std::vector<std::string> profiles;
  bool manage_firewall;
};

enum class FailureKind { NONE, RESOLUTION, FORWARDING, FIREWALL };

// Forwarding table (and firewall rule) as seen after an operation
struct TableSnapshot {
  std::vector<ForwardingEntry> v4_entries;
  std::vector<ForwardingEntry> v6_entries;
  std::optional<bool> firewall_rule_present; // unset when not managed
  std::string firewall_rule_name;
  // set when the rule is managed but could not be queried
  std::optional<std::string> firewall_query_error;
};

struct ReconcileResult {
  bool success;
  FailureKind failure;
  std::optional<std::string> guest_address;
  std::string summary;
  std::optional<TableSnapshot> table;
};

class Reconciler {
public:
  Reconciler(PrivilegeCheck &privilege, AddressResolver &resolver,
             ForwardingRuleManager &forwarding,
             FirewallRuleSynchronizer &firewall);

  ReconcileResult run(const ReconcileRequest &request);

private:
  PrivilegeCheck &privilege_;
  AddressResolver &resolver_;
  ForwardingRuleManager &forwarding_;
  FirewallRuleSynchronizer &firewall_;

  void establish(const ReconcileRequest &request, ReconcileResult &result);
  void tearDown(const ReconcileRequest &request, ReconcileResult &result);
  TableSnapshot snapshot(const ReconcileRequest &request);
  std::optional<TableSnapshot> trySnapshot(const ReconcileRequest &request);
};
