// src/presentation/Renderer.cpp

#include "Renderer.hpp"

#include <iomanip>

Renderer::Renderer(std::ostream &out) : out_(out) {}

void Renderer::render(const ReconcileRequest &request,
                      const ReconcileResult &result) {
  out_ << (result.success ? "OK: " : "FAILED: ") << result.summary << "\n";

  if (result.guest_address) {
    out_ << "Guest '" << request.guest << "' is at " << *result.guest_address
         << "\n";
  }

  if (result.table) {
    renderTable(*result.table);
  } else if (request.action != Action::INSPECT) {
    out_ << "(forwarding table could not be read)\n";
  }
}

void Renderer::renderTable(const TableSnapshot &table) {
  renderEntries("IPv4 -> IPv4", table.v4_entries);
  renderEntries("IPv6 -> IPv4", table.v6_entries);

  if (table.firewall_rule_present) {
    out_ << "\nFirewall rule '" << table.firewall_rule_name << "': "
         << (*table.firewall_rule_present ? "present" : "absent") << "\n";
  } else if (table.firewall_query_error) {
    out_ << "\nFirewall rule '" << table.firewall_rule_name << "': unknown\n";
  } else {
    out_ << "\nFirewall rule '" << table.firewall_rule_name
         << "': not managed\n";
  }
}

void Renderer::renderLanHint(uint16_t port,
                             const std::vector<std::string> &addresses) {
  if (addresses.empty()) {
    out_ << "\nNo LAN address found for this host.\n";
    return;
  }

  out_ << "\nReachable from the local network at:\n";
  for (const auto &address : addresses) {
    out_ << "  http://" << address << ":" << port << "\n";
  }
}

void Renderer::renderEntries(const std::string &title,
                             const std::vector<ForwardingEntry> &entries) {
  out_ << "\n" << title << "\n";
  if (entries.empty()) {
    out_ << "  (none)\n";
    return;
  }

  out_ << "  " << std::left << std::setw(18) << "Listen address"
       << std::setw(8) << "Port" << std::setw(18) << "Connect address"
       << "Port\n";
  for (const auto &entry : entries) {
    out_ << "  " << std::left << std::setw(18) << entry.listen_address
         << std::setw(8) << entry.listen_port << std::setw(18)
         << entry.connect_address << entry.connect_port << "\n";
  }
}
