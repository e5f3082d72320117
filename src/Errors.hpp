// src/Errors.hpp

// ---- Error taxonomy ---- //

// Every failure the tool reports derives from PortbridgeError so main can
// catch one type at the top level.

// CommandError   => a subprocess could not run or exited non-zero
// PrivilegeError => caller is not an administrator, nothing was touched
// ResolutionError => the guest's address could not be discovered
// ForwardingError => the forwarding table rejected a create/delete
// FirewallError  => the firewall store rejected a create/delete

// ForwardingError and FirewallError carry the sub-operation that failed,
// e.g. "delete v4tov4 0.0.0.0:3000", so the operator can retry by hand.

#pragma once

#include <stdexcept>
#include <string>

class PortbridgeError : public std::runtime_error {
public:
  explicit PortbridgeError(const std::string &message)
      : std::runtime_error(message) {}
};

class CommandError : public PortbridgeError {
public:
  CommandError(const std::string &command, int exit_code,
               const std::string &output)
      : PortbridgeError("Command failed: " + command +
                        " (exit code: " + std::to_string(exit_code) + ")" +
                        (output.empty() ? "" : ": " + output)),
        command_(command), exit_code_(exit_code), output_(output) {}

  const std::string &command() const { return command_; }
  int exitCode() const { return exit_code_; }
  const std::string &output() const { return output_; }

private:
  std::string command_;
  int exit_code_;
  std::string output_;
};

class PrivilegeError : public PortbridgeError {
public:
  explicit PrivilegeError(const std::string &message)
      : PortbridgeError(message) {}
};

class ResolutionError : public PortbridgeError {
public:
  ResolutionError(const std::string &guest, const std::string &reason)
      : PortbridgeError("Could not resolve address of guest '" + guest +
                        "': " + reason),
        guest_(guest) {}

  const std::string &guest() const { return guest_; }

private:
  std::string guest_;
};

// Shared shape for store-level failures of the two managers
class StoreOperationError : public PortbridgeError {
public:
  StoreOperationError(const std::string &store, const std::string &operation,
                      const std::string &reason)
      : PortbridgeError(store + " operation '" + operation +
                        "' failed: " + reason),
        operation_(operation) {}

  const std::string &operation() const { return operation_; }

private:
  std::string operation_;
};

class ForwardingError : public StoreOperationError {
public:
  ForwardingError(const std::string &operation, const std::string &reason)
      : StoreOperationError("Forwarding", operation, reason) {}
};

class FirewallError : public StoreOperationError {
public:
  FirewallError(const std::string &operation, const std::string &reason)
      : StoreOperationError("Firewall", operation, reason) {}
};
