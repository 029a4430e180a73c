#include "utils/logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fs = std::filesystem;

namespace hostgate::logger {

namespace {
    constexpr const char* LOGGER_NAME = "hostgate";
    constexpr const char* LOG_FILE_ENV = "HOSTGATE_LOG_FILE";
    constexpr const char* STDOUT_PATTERN = "[%Y-%m-%d %T.%e] [%l] %v";
    constexpr const char* JSON_PATTERN = R"({"ts":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","msg":"%v"})";
}  // namespace

spdlog::level::level_enum parse_level(const std::string& level_text) {
    std::string lower = level_text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "critical" || lower == "fatal") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return spdlog::level::info;
}

std::string get_log_file_path() {
    if (const char* env = std::getenv(LOG_FILE_ENV)) {
        return env;
    }
    return {};
}

void init(const std::string& level,
          const std::string& pattern,
          const std::string& file_path,
          std::vector<spdlog::sink_ptr> additional_sinks) {
    std::vector<spdlog::sink_ptr> sinks = std::move(additional_sinks);

    if (!file_path.empty()) {
        const auto parent = fs::path(file_path).parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }
        sinks.push_back(
            std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path, false));
    }

    // Containers collect stdout; fall back to it when nothing else is configured
    if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    if (!pattern.empty()) {
        spdlog::set_pattern(pattern);
    }
    spdlog::set_level(parse_level(level));
    spdlog::flush_on(spdlog::level::info);
}

void init_for_deployment(const std::string& level) {
    std::vector<spdlog::sink_ptr> sinks;

    auto stdout_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    stdout_sink->set_pattern(STDOUT_PATTERN);
    sinks.push_back(stdout_sink);

    const std::string log_path = get_log_file_path();
    if (!log_path.empty()) {
        const auto parent = fs::path(log_path).parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path, false);
        file_sink->set_pattern(JSON_PATTERN);
        sinks.push_back(file_sink);
    }

    // Preserve per-sink patterns (stdout human-readable, file JSON).
    init(level, "", "", sinks);

    if (!log_path.empty()) {
        spdlog::info("File logging enabled: {}", log_path);
    }
}

}  // namespace hostgate::logger
