// src/guest/AddressResolver.cpp

#include "AddressResolver.hpp"
#include "Errors.hpp"

#include <regex>
#include <sstream>

#include <spdlog/spdlog.h>

namespace {
// No octet range check, same leniency as the host tooling
const std::regex IPV4_TOKEN(R"(^\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}$)");
const std::regex
    CIDR_TOKEN(R"(^(\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3})/\d{1,2}$)");
} // namespace

AddressResolver::AddressResolver(GuestQuery &query,
                                 const std::string &fallback_interface)
    : query_(query), fallback_interface_(fallback_interface) {}

std::string AddressResolver::resolve(const std::string &guest) {
  spdlog::info("Resolving IPv4 address of guest '{}'.", guest);

  try {
    auto address = firstIpv4Token(query_.listInterfaces(guest));
    if (address) {
      spdlog::info("Guest '{}' is at {}.", guest, *address);
      return *address;
    }
    spdlog::warn("Interface listing of '{}' had no IPv4 address, trying {}.",
                 guest, fallback_interface_);
  } catch (const CommandError &error) {
    spdlog::warn("Interface listing of '{}' failed: {}. Trying {}.", guest,
                 error.what(), fallback_interface_);
  }

  try {
    auto address =
        firstCidrToken(query_.interfaceDetail(guest, fallback_interface_));
    if (address) {
      spdlog::info("Guest '{}' is at {} (from {}).", guest, *address,
                   fallback_interface_);
      return *address;
    }
  } catch (const CommandError &error) {
    spdlog::error("Interface detail of '{}' failed: {}", guest, error.what());
    throw ResolutionError(guest, std::string("no address found (") +
                                     error.what() + ")");
  }

  spdlog::error("No IPv4 address found for guest '{}'.", guest);
  throw ResolutionError(guest, "no address found");
}

std::optional<std::string>
AddressResolver::firstIpv4Token(const std::string &text) {
  std::istringstream tokens(text);
  std::string token;
  while (tokens >> token) {
    if (std::regex_match(token, IPV4_TOKEN)) {
      return token;
    }
  }
  return std::nullopt;
}

std::optional<std::string>
AddressResolver::firstCidrToken(const std::string &text) {
  std::istringstream tokens(text);
  std::string token;
  std::smatch match;
  while (tokens >> token) {
    if (std::regex_match(token, match, CIDR_TOKEN)) {
      return match[1].str();
    }
  }
  return std::nullopt;
}
