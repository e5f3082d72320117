// src/privilege/PrivilegeCheck.hpp

// Both the forwarding table and the firewall refuse changes from a
// non-elevated caller, so the check runs once before anything else.
// require() throws PrivilegeError.

#pragma once

#include "PowerShell.hpp"

class PrivilegeCheck {
public:
  virtual ~PrivilegeCheck() = default;

  virtual bool isAdministrator() = 0;
  void require();
};

// Asks Windows whether the current token is in the Administrators role
class WindowsAdminCheck : public PrivilegeCheck {
public:
  explicit WindowsAdminCheck(PowerShell &powershell);

  bool isAdministrator() override;

private:
  PowerShell &powershell_;
};
