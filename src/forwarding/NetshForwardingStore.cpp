// src/forwarding/NetshForwardingStore.cpp

#include "NetshForwardingStore.hpp"
#include "Errors.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include <spdlog/spdlog.h>

namespace {
bool isNumber(const std::string &token) {
  return !token.empty() && token.size() <= 5 &&
         std::all_of(token.begin(), token.end(),
                     [](unsigned char c) { return std::isdigit(c); });
}
} // namespace

NetshForwardingStore::NetshForwardingStore(CommandRunner &runner,
                                           const std::string &netsh_executable)
    : runner_(runner), netsh_executable_(netsh_executable) {}

void NetshForwardingStore::add(const ForwardingEntry &entry) {
  // netsh interface portproxy add v4tov4 listenaddress=0.0.0.0
  //   listenport=3000 connectaddress=172.20.10.5 connectport=3000
  runner_.runChecked({netsh_executable_, "interface", "portproxy", "add",
                      toString(entry.family),
                      "listenaddress=" + entry.listen_address,
                      "listenport=" + std::to_string(entry.listen_port),
                      "connectaddress=" + entry.connect_address,
                      "connectport=" + std::to_string(entry.connect_port)});
}

bool NetshForwardingStore::remove(ForwardingFamily family,
                                  const std::string &listen_address,
                                  uint16_t listen_port) {
  std::vector<std::string> command = {
      netsh_executable_, "interface",
      "portproxy",       "delete",
      toString(family),  "listenaddress=" + listen_address,
      "listenport=" + std::to_string(listen_port)};

  CommandResult result = runner_.run(command);
  if (result.exit_code == 0) {
    return true;
  }

  const CommandError delete_error(CommandRunner::describe(command),
                                  result.exit_code, result.output);

  std::vector<ForwardingEntry> entries;
  try {
    entries = list(family);
  } catch (const CommandError &error) {
    spdlog::debug("Could not re-list {} entries: {}", toString(family),
                  error.what());
    throw delete_error;
  }

  bool still_present =
      std::any_of(entries.begin(), entries.end(), [&](const auto &entry) {
        return entry.listen_address == listen_address &&
               entry.listen_port == listen_port;
      });

  if (still_present) {
    throw delete_error;
  }

  spdlog::debug("No {} entry on {}:{} to delete.", toString(family),
                listen_address, listen_port);
  return false;
}

std::vector<ForwardingEntry>
NetshForwardingStore::list(ForwardingFamily family) {
  auto result = runner_.runChecked(
      {netsh_executable_, "interface", "portproxy", "show", toString(family)});
  return parseTable(family, result.output);
}

std::vector<ForwardingEntry>
NetshForwardingStore::parseTable(ForwardingFamily family,
                                 const std::string &output) {
  // Listen on ipv4:             Connect to ipv4:
  //
  // Address         Port        Address         Port
  // --------------- ----------  --------------- ----------
  // 0.0.0.0         3000        172.20.10.5     3000
  std::vector<ForwardingEntry> entries;
  std::istringstream lines(output);
  std::string line;

  while (std::getline(lines, line)) {
    std::istringstream fields(line);
    std::vector<std::string> tokens;
    std::string token;
    while (fields >> token) {
      tokens.push_back(token);
    }

    // only data rows have a numeric port in columns 2 and 4
    if (tokens.size() != 4 || !isNumber(tokens[1]) || !isNumber(tokens[3])) {
      continue;
    }

    int listen_port = std::stoi(tokens[1]);
    int connect_port = std::stoi(tokens[3]);
    if (listen_port > 65535 || connect_port > 65535) {
      continue;
    }

    entries.push_back(ForwardingEntry{family, tokens[0],
                                      static_cast<uint16_t>(listen_port),
                                      tokens[2],
                                      static_cast<uint16_t>(connect_port)});
  }
  return entries;
}
