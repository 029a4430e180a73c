#include "utils/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iterator>
#include <sstream>
#include <spdlog/spdlog.h>

#include "system/tensor_parallelism.h"

namespace hostgate {

namespace {

std::optional<std::string> getEnvValue(const char* name) {
    if (!name || !*name) {
        return std::nullopt;
    }
    if (const char* v = std::getenv(name)) {
        return std::string(v);
    }
    return std::nullopt;
}

/// Get environment variable with fallback to deprecated name
/// Logs a warning if the deprecated name is used
std::optional<std::string> getEnvWithFallback(const char* new_name, const char* old_name) {
    if (auto v = getEnvValue(new_name)) {
        return v;
    }
    if (auto v = getEnvValue(old_name)) {
        spdlog::warn("Environment variable '{}' is deprecated, use '{}' instead", old_name, new_name);
        return v;
    }
    return std::nullopt;
}

std::string trimAscii(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

int parseIntEnv(const char* name, const std::string& value) {
    try {
        size_t idx = 0;
        long long v = std::stoll(value, &idx);
        if (idx != value.size() || v < 0 || v > 1000000) {
            throw ConfigError(std::string(name) + " must be a non-negative integer: " + value);
        }
        return static_cast<int>(v);
    } catch (const std::invalid_argument&) {
        throw ConfigError(std::string(name) + " must be an integer: " + value);
    } catch (const std::out_of_range&) {
        throw ConfigError(std::string(name) + " is out of range: " + value);
    }
}

bool isValidPort(int port) {
    return port > 0 && port <= 65535;
}

std::string toLowerAscii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool isKnownLogLevel(const std::string& level) {
    static const char* kLevels[] = {"trace", "debug", "info", "warn", "warning",
                                    "error", "critical", "off"};
    const std::string lower = toLowerAscii(level);
    return std::any_of(std::begin(kLevels), std::end(kLevels),
                       [&lower](const char* l) { return lower == l; });
}

}  // namespace

std::vector<std::string> splitServedModelNames(const std::string& csv) {
    std::vector<std::string> out;
    std::stringstream ss(csv);
    std::string token;
    while (std::getline(ss, token, ',')) {
        token = trimAscii(token);
        if (!token.empty()) out.push_back(token);
    }
    return out;
}

DeploymentParams loadDeploymentParams() {
    return loadDeploymentParamsWithLog().first;
}

std::pair<DeploymentParams, std::string> loadDeploymentParamsWithLog() {
    DeploymentParams params;
    std::ostringstream log;

    if (auto env = getEnvValue("MODEL_ID")) {
        params.model_id = *env;
        log << "env:MODEL_ID=" << *env << " ";
    }
    if (auto env = getEnvValue("TOKENIZER")) {
        // An empty TOKENIZER means "use the model's own tokenizer"
        if (!env->empty()) {
            params.tokenizer = *env;
            log << "env:TOKENIZER=" << *env << " ";
        }
    }
    if (auto env = getEnvValue("INSTANCE_TYPE")) {
        params.instance_type = *env;
        log << "env:INSTANCE_TYPE=" << *env << " ";
    } else {
        log << "default:INSTANCE_TYPE=" << kDefaultInstanceType << " ";
    }
    if (auto env = getEnvValue("API_HOST")) {
        params.host = *env;
        log << "env:API_HOST=" << *env << " ";
    }
    if (auto env = getEnvValue("API_PORT")) {
        params.port = parseIntEnv("API_PORT", *env);
        log << "env:API_PORT=" << params.port << " ";
    }
    if (auto env = getEnvWithFallback("HOSTGATE_LOG_LEVEL", "UVICORN_LOG_LEVEL")) {
        params.log_level = *env;
        log << "env:LOG_LEVEL=" << *env << " ";
    }
    if (auto env = getEnvValue("SERVED_MODEL_NAME")) {
        params.served_model_names = splitServedModelNames(*env);
        log << "env:SERVED_MODEL_NAME=" << *env << " ";
    }
    if (auto env = getEnvValue("ENGINE_URL")) {
        params.engine_url = trimAscii(*env);
        log << "env:ENGINE_URL=" << params.engine_url << " ";
    }
    if (auto env = getEnvValue("ENGINE_COMMAND")) {
        if (!trimAscii(*env).empty()) {
            params.engine_command = *env;
            log << "env:ENGINE_COMMAND=" << *env << " ";
        }
    }
    if (auto env = getEnvValue("ENGINE_PORT")) {
        params.engine_port = parseIntEnv("ENGINE_PORT", *env);
        if (!isValidPort(params.engine_port)) {
            throw ConfigError("ENGINE_PORT must be between 1 and 65535: " + *env);
        }
        log << "env:ENGINE_PORT=" << params.engine_port << " ";
    }
    if (auto env = getEnvValue("ENGINE_STARTUP_TIMEOUT_SECONDS")) {
        params.engine_startup_timeout_seconds =
            parseIntEnv("ENGINE_STARTUP_TIMEOUT_SECONDS", *env);
        log << "env:ENGINE_STARTUP_TIMEOUT_SECONDS=" << params.engine_startup_timeout_seconds << " ";
    }

    if (auto env = getEnvValue("HOSTGATE_HTTP_THREADS")) {
        params.http_threads = parseIntEnv("HOSTGATE_HTTP_THREADS", *env);
        if (params.http_threads < 1 || params.http_threads > kMaxHttpThreads) {
            throw ConfigError("HOSTGATE_HTTP_THREADS must be between 1 and " +
                              std::to_string(kMaxHttpThreads));
        }
        log << "env:HOSTGATE_HTTP_THREADS=" << params.http_threads << " ";
    }

    return {params, log.str()};
}

EngineConfig resolveEngineConfig(const DeploymentParams& params) {
    if (!params.model_id || trimAscii(*params.model_id).empty()) {
        throw ConfigError("MODEL_ID must be provided");
    }
    if (!isValidPort(params.port)) {
        throw ConfigError("port must be between 1 and 65535: " + std::to_string(params.port));
    }
    if (!isKnownLogLevel(params.log_level)) {
        throw ConfigError("unknown log level: " + params.log_level);
    }

    const std::string instance_type = params.instance_type.value_or(kDefaultInstanceType);

    EngineConfig cfg;
    cfg.model = *params.model_id;
    if (params.tokenizer && !params.tokenizer->empty()) {
        cfg.tokenizer = params.tokenizer;
    }
    cfg.tensor_parallel_size = tensorParallelSizeForInstance(instance_type);
    cfg.host = params.host;
    cfg.port = params.port;
    cfg.log_level = toLowerAscii(params.log_level);
    cfg.trust_remote_code = kTrustRemoteCode;
    cfg.max_model_len = kMaxModelLen;
    cfg.limit_mm_per_prompt = {{"image", kMaxImagesPerPrompt}};
    cfg.served_model_names = params.served_model_names;
    return cfg;
}

std::vector<std::string> buildEngineArgs(const EngineConfig& config,
                                         const std::string& engine_host,
                                         int engine_port) {
    std::vector<std::string> args;
    args.insert(args.end(), {"--model", config.model});
    if (config.tokenizer) {
        args.insert(args.end(), {"--tokenizer", *config.tokenizer});
    }
    args.insert(args.end(), {"--tensor-parallel-size", std::to_string(config.tensor_parallel_size)});
    args.insert(args.end(), {"--host", engine_host, "--port", std::to_string(engine_port)});
    if (config.trust_remote_code) {
        args.push_back("--trust-remote-code");
    }
    args.insert(args.end(), {"--max-model-len", std::to_string(config.max_model_len)});
    for (const auto& [modality, limit] : config.limit_mm_per_prompt) {
        args.insert(args.end(), {"--limit-mm-per-prompt", modality + "=" + std::to_string(limit)});
    }
    if (!config.served_model_names.empty()) {
        args.push_back("--served-model-name");
        args.insert(args.end(), config.served_model_names.begin(), config.served_model_names.end());
    }
    return args;
}

}  // namespace hostgate
