// src/logging/Logging.hpp

// Replaces spdlog's default logger with one writing to the console and,
// when a path is given, to a log file as well. Call once at startup, before
// anything logs.

// Example:
// setupLogging(verbose, "logs/portbridge.log");
// spdlog::info("...");

#pragma once

#include <optional>
#include <string>

void setupLogging(bool verbose, const std::optional<std::string> &log_file);
