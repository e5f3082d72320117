// src/guest/AddressResolver.hpp

// ---- AddressResolver Usage ---- //

// Finds the current IPv4 address of a guest. The address changes every time
// the guest restarts, so it is looked up fresh on every call, never cached.

// Example:
// AddressResolver resolver(guest_query, "eth0");
// std::string ip = resolver.resolve("Ubuntu"); // "172.20.10.5"

// Lookup order:
// 1. listInterfaces(), first token that is a dotted quad
// 2. interfaceDetail(fallback interface), first "a.b.c.d/nn" token, the
//    "/nn" is stripped
// 3. ResolutionError

// A primary lookup that fails to run counts the same as one that printed
// nothing useful. There are no retries beyond the one fallback.

#pragma once

#include <optional>
#include <string>

#include "GuestQuery.hpp"

class AddressResolver {
public:
  AddressResolver(GuestQuery &query, const std::string &fallback_interface);

  std::string resolve(const std::string &guest);

  // first whitespace-delimited token made of four 1-3 digit groups
  static std::optional<std::string> firstIpv4Token(const std::string &text);
  // first "a.b.c.d/nn" token, returned without the prefix length
  static std::optional<std::string> firstCidrToken(const std::string &text);

private:
  GuestQuery &query_;
  std::string fallback_interface_;
};
