// src/guest/WslGuestQuery.hpp
#pragma once

#include <string>

#include "CommandRunner.hpp"
#include "GuestQuery.hpp"

// Queries a WSL distribution by running commands inside it through wsl.exe
class WslGuestQuery : public GuestQuery {
public:
  WslGuestQuery(CommandRunner &runner, const std::string &wsl_executable);

  std::string listInterfaces(const std::string &guest) override;
  std::string interfaceDetail(const std::string &guest,
                              const std::string &interface_name) override;

private:
  CommandRunner &runner_;
  std::string wsl_executable_;
};
