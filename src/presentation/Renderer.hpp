// src/presentation/Renderer.hpp

// Prints the outcome of one invocation: a status line, the forwarding table
// for both families, the firewall rule state and, after a successful
// add/refresh, the LAN addresses the service can be reached on.

#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "Reconciler.hpp"

class Renderer {
public:
  explicit Renderer(std::ostream &out);

  void render(const ReconcileRequest &request, const ReconcileResult &result);
  void renderTable(const TableSnapshot &table);
  void renderLanHint(uint16_t port, const std::vector<std::string> &addresses);

private:
  std::ostream &out_;

  void renderEntries(const std::string &title,
                     const std::vector<ForwardingEntry> &entries);
};
