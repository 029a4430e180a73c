#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace hostgate {

/// Startup configuration failure (missing model, unsupported instance type,
/// malformed value). Never surfaced as an HTTP response.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Engine-safety policy of this deployment profile. Not caller-configurable.
constexpr bool kTrustRemoteCode = true;
constexpr int kMaxModelLen = 4049;
constexpr int kMaxImagesPerPrompt = 2;

constexpr const char* kDefaultHost = "0.0.0.0";
constexpr int kDefaultPort = 8000;
constexpr const char* kDefaultLogLevel = "info";
constexpr const char* kDefaultEngineCommand = "vllm serve";
constexpr int kDefaultEnginePort = 8081;
constexpr int kDefaultEngineStartupTimeoutSeconds = 1800;
// Each streamed invocation holds one worker for its whole generation, so the
// pool is sized above engine concurrency to keep /ping answerable.
constexpr int kDefaultHttpThreads = 512;
constexpr int kMaxHttpThreads = 1024;

/// Raw deployment parameters as supplied by the hosting platform
/// (environment, optionally overridden on the command line).
struct DeploymentParams {
    std::optional<std::string> model_id;
    std::optional<std::string> tokenizer;
    std::optional<std::string> instance_type;  // nullopt -> kDefaultInstanceType
    std::string host{kDefaultHost};
    int port{kDefaultPort};
    std::string log_level{kDefaultLogLevel};
    std::vector<std::string> served_model_names;
    int http_threads{kDefaultHttpThreads};

    // Engine server attachment
    std::string engine_url;  // attach to an already running engine when set
    std::string engine_command{kDefaultEngineCommand};
    int engine_port{kDefaultEnginePort};
    int engine_startup_timeout_seconds{kDefaultEngineStartupTimeoutSeconds};
};

/// Read MODEL_ID, TOKENIZER, INSTANCE_TYPE, API_HOST, API_PORT,
/// HOSTGATE_LOG_LEVEL (UVICORN_LOG_LEVEL), SERVED_MODEL_NAME, ENGINE_URL,
/// ENGINE_COMMAND, ENGINE_PORT, ENGINE_STARTUP_TIMEOUT_SECONDS and
/// HOSTGATE_HTTP_THREADS.
/// Throws ConfigError on malformed numeric values.
DeploymentParams loadDeploymentParams();
std::pair<DeploymentParams, std::string> loadDeploymentParamsWithLog();

/// Validated engine configuration. Built once at startup, immutable afterwards.
struct EngineConfig {
    std::string model;
    std::optional<std::string> tokenizer;
    int tensor_parallel_size{1};
    std::string host{kDefaultHost};
    int port{kDefaultPort};
    std::string log_level{kDefaultLogLevel};
    bool trust_remote_code{kTrustRemoteCode};
    int max_model_len{kMaxModelLen};
    std::map<std::string, int> limit_mm_per_prompt;  // modality -> max items
    std::vector<std::string> served_model_names;     // empty -> {model}
};

/// Pure mapping from deployment parameters to EngineConfig. No I/O.
/// Throws ConfigError when the model id is missing, the instance type is not
/// supported, or the port/log level is invalid.
EngineConfig resolveEngineConfig(const DeploymentParams& params);

/// Render the config as OpenAI-compatible engine server arguments.
std::vector<std::string> buildEngineArgs(const EngineConfig& config,
                                         const std::string& engine_host,
                                         int engine_port);

/// Split "a, b,,c" into {"a", "b", "c"}.
std::vector<std::string> splitServedModelNames(const std::string& csv);

}  // namespace hostgate
