// logger.h - lightweight logging wrapper around spdlog
#pragma once

#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace hostgate::logger {

// Convert textual level to spdlog level (case-insensitive). Unknown -> info.
spdlog::level::level_enum parse_level(const std::string& level_text);

// Log file path from HOSTGATE_LOG_FILE, or empty when file logging is disabled.
std::string get_log_file_path();

// Initialize default logger with optional pattern and file sink.
// additional_sinks is mainly for testing (e.g., ostream sink injection).
void init(const std::string& level = "info",
          const std::string& pattern = "[%Y-%m-%d %T.%e] [%l] %v",
          const std::string& file_path = "",
          std::vector<spdlog::sink_ptr> additional_sinks = {});

// Initialize for a container deployment:
// stdout (human-readable) + optional JSON lines file (HOSTGATE_LOG_FILE).
void init_for_deployment(const std::string& level);

}  // namespace hostgate::logger
