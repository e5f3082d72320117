// src/guest/GuestQuery.hpp

// ---- GuestQuery Usage ---- //

// Capability interface for asking a guest environment about its network
// interfaces. Both calls return the raw text the guest printed, parsing is
// left to AddressResolver.

// listInterfaces()  => the short "all addresses" listing (hostname -I)
// interfaceDetail() => the detailed view of one named interface (ip addr show)

// Implementations throw CommandError when the query could not be run.

#pragma once

#include <string>

class GuestQuery {
public:
  virtual ~GuestQuery() = default;

  virtual std::string listInterfaces(const std::string &guest) = 0;
  virtual std::string interfaceDetail(const std::string &guest,
                                      const std::string &interface_name) = 0;
};
