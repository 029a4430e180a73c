#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "core/engine.h"
#include "core/engine_process.h"
#include "utils/config.h"

namespace hostgate {

constexpr const char* kEngineLoopbackHost = "127.0.0.1";

/// Engine reached over HTTP: an OpenAI-compatible engine server on loopback,
/// optionally owned as a supervised child process.
class RemoteEngine : public Engine {
public:
    explicit RemoteEngine(std::string base_url,
                          std::unique_ptr<EngineProcess> process = nullptr);
    ~RemoteEngine() override;

    std::string runtime() const override { return "openai_http"; }

    /// GET /v1/models; reads max_model_len of the first listed model.
    ModelConfig modelConfig() const override;

    /// POST /v1/chat/completions with the request payload.
    EngineResult createChatCompletion(const ChatCompletionRequest& request) const override;

    /// Poll GET /health until it answers 200, the timeout elapses, or the
    /// owned engine process exits.
    bool waitUntilReady(std::chrono::seconds timeout);

    const std::string& baseUrl() const { return base_url_; }

private:
    EngineResult completeBuffered(const nlohmann::json& payload) const;
    EngineResult completeStreaming(const nlohmann::json& payload) const;

    std::string base_url_;
    std::unique_ptr<EngineProcess> process_;
};

/// Convert a non-2xx engine reply into a structured error. JSON bodies are
/// kept as-is; anything else is wrapped in an OpenAI-style error object.
ErrorResponse toErrorResponse(int status, const std::string& body);

/// Factory used at startup: attaches to ENGINE_URL when set, otherwise
/// launches ENGINE_COMMAND with arguments derived from the EngineConfig and
/// waits for it to become ready.
EngineFactory makeRemoteEngineFactory(const DeploymentParams& params);

}  // namespace hostgate
