// src/logging/Logging.cpp

#include "Logging.hpp"

#include <memory>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

void setupLogging(bool verbose, const std::optional<std::string> &log_file) {
  std::vector<spdlog::sink_ptr> sinks;

  auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console->set_pattern("[%^%l%$] %v");
  sinks.push_back(console);

  if (log_file) {
    // the file always gets everything, including each command that ran
    auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(*log_file);
    file->set_level(spdlog::level::debug);
    file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    sinks.push_back(file);
  }

  console->set_level(verbose ? spdlog::level::debug : spdlog::level::info);

  auto logger = std::make_shared<spdlog::logger>("portbridge", sinks.begin(),
                                                 sinks.end());
  logger->set_level(spdlog::level::debug);
  spdlog::set_default_logger(logger);
}
