#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace hostgate {

struct ChatMessage {
    std::string role;
    nlohmann::json content;  // string, array of content parts, or null
};

/// OpenAI-compatible tool/function definition
struct ToolDefinition {
    std::string name;
    std::string description;
    nlohmann::json parameters;  // JSON schema
};

struct ToolChoice {
    enum class Mode {
        Unspecified,
        None,
        Auto,
        Required,
        Named,
    };
    Mode mode{Mode::Unspecified};
    std::string function_name;  // Named only
};

struct SamplingParams {
    std::optional<double> temperature;
    std::optional<double> top_p;
    std::optional<int> top_k;
    std::optional<int> n;
    std::optional<int> max_tokens;
    std::optional<int64_t> seed;
    std::optional<double> presence_penalty;
    std::optional<double> frequency_penalty;
    std::vector<std::string> stop;
    bool logprobs{false};
    std::optional<int> top_logprobs;
};

/// Validated chat completion request.
/// payload is the caller's JSON object (with "model" filled in) that is handed
/// to the engine unchanged otherwise, so engine-specific extensions survive.
struct ChatCompletionRequest {
    std::string model;
    std::vector<ChatMessage> messages;
    SamplingParams sampling;
    bool stream{false};
    std::vector<ToolDefinition> tools;
    ToolChoice tool_choice;
    nlohmann::json payload;
};

/// Structured rejection declared by the engine (context too long, bad
/// sampling parameter, unknown model...). Relayed to the caller verbatim.
struct ErrorResponse {
    int code{400};
    nlohmann::json body;
};

/// Lazy, ordered sequence of response chunks (server-sent events).
class ChunkStream {
public:
    virtual ~ChunkStream() = default;

    /// Blocks until the next chunk is produced. Returns false at end of stream.
    virtual bool next(std::string& chunk) = 0;

    /// Stop producing and release upstream resources. Idempotent.
    virtual void cancel() = 0;
};

/// What the engine returned for one request.
struct EngineResult {
    enum class Kind {
        Buffered,
        Streamed,
        Error,
    };

    Kind kind{Kind::Buffered};
    nlohmann::json body;                  // Buffered
    std::shared_ptr<ChunkStream> stream;  // Streamed
    ErrorResponse error;                  // Error

    static EngineResult buffered(nlohmann::json body) {
        EngineResult r;
        r.kind = Kind::Buffered;
        r.body = std::move(body);
        return r;
    }

    static EngineResult streamed(std::shared_ptr<ChunkStream> stream) {
        EngineResult r;
        r.kind = Kind::Streamed;
        r.stream = std::move(stream);
        return r;
    }

    static EngineResult failure(ErrorResponse error) {
        EngineResult r;
        r.kind = Kind::Error;
        r.error = std::move(error);
        return r;
    }
};

/// Model metadata reported by the engine after it is up.
struct ModelConfig {
    std::string model;
    size_t max_model_len{0};  // 0 = not reported
};

}  // namespace hostgate
