// src/guest/WslGuestQuery.cpp

#include "WslGuestQuery.hpp"

WslGuestQuery::WslGuestQuery(CommandRunner &runner,
                             const std::string &wsl_executable)
    : runner_(runner), wsl_executable_(wsl_executable) {}

std::string WslGuestQuery::listInterfaces(const std::string &guest) {
  // wsl.exe -d <distro> -- hostname -I
  // prints every address of the guest on one line, IPv4 first
  return runner_
      .runChecked({wsl_executable_, "-d", guest, "--", "hostname", "-I"})
      .output;
}

std::string WslGuestQuery::interfaceDetail(const std::string &guest,
                                           const std::string &interface_name) {
  // wsl.exe -d <distro> -- ip -4 addr show eth0
  // the address appears as "inet 172.20.10.5/20 brd ..."
  return runner_
      .runChecked({wsl_executable_, "-d", guest, "--", "ip", "-4", "addr",
                   "show", interface_name})
      .output;
}
