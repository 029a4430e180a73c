#pragma once

#include <functional>
#include <memory>
#include <string>

#include "core/engine_types.h"

namespace hostgate {

struct EngineConfig;

/// Inference engine boundary. Implementations must be safe to call from
/// several request threads at once; the engine schedules concurrent
/// generations internally.
class Engine {
public:
    virtual ~Engine() = default;

    virtual std::string runtime() const = 0;

    virtual ModelConfig modelConfig() const = 0;

    /// Returns a buffered body, a chunk stream, or a structured engine error.
    /// Throws on transport or internal failure.
    virtual EngineResult createChatCompletion(const ChatCompletionRequest& request) const = 0;
};

using EngineFactory = std::function<std::unique_ptr<Engine>(const EngineConfig&)>;

}  // namespace hostgate
