// src/forwarding/ForwardingStore.hpp

// ---- ForwardingStore Usage ---- //

// Narrow view of the host's TCP forwarding table. The table is global,
// mutable and not transactional; it is keyed by
// (family, listen address, listen port).

// add()    => create one entry, assumes no entry with the same key exists
// remove() => delete the entry with that key, returns false if there was
//             none (absence is not an error)
// list()   => every entry of one family, in the order the host reports them

// Implementations throw CommandError when the host tooling fails.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

enum class ForwardingFamily {
  V4_TO_V4, // listen on IPv4, connect to IPv4
  V6_TO_V4, // listen on IPv6, connect to IPv4
};

std::string toString(ForwardingFamily family);

struct ForwardingEntry {
  ForwardingFamily family;
  std::string listen_address;
  uint16_t listen_port;
  std::string connect_address;
  uint16_t connect_port;

  bool operator==(const ForwardingEntry &) const = default;
};

class ForwardingStore {
public:
  virtual ~ForwardingStore() = default;

  virtual void add(const ForwardingEntry &entry) = 0;
  virtual bool remove(ForwardingFamily family,
                      const std::string &listen_address,
                      uint16_t listen_port) = 0;
  virtual std::vector<ForwardingEntry> list(ForwardingFamily family) = 0;
};
