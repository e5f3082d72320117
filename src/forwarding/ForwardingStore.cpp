// src/forwarding/ForwardingStore.cpp

#include "ForwardingStore.hpp"

std::string toString(ForwardingFamily family) {
  switch (family) {
  case ForwardingFamily::V4_TO_V4:
    return "v4tov4";
  case ForwardingFamily::V6_TO_V4:
    return "v6tov4";
  }
  return "unknown";
}
