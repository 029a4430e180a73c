#pragma once

#include <memory>
#include <string>

#include "core/engine_types.h"

namespace hostgate {

class EngineHandle;

/// Result of one invocation, ready to be written by the HTTP layer.
struct InvocationOutcome {
    enum class Kind {
        Buffered,   // one JSON body
        Streamed,   // text/event-stream, chunks pulled from stream
        Rejected,   // error status with JSON body
    };
    enum class Reason {
        None,
        InvalidFormat,       // 400, request failed validation
        DomainError,         // engine-declared error, relayed verbatim
        InvariantViolation,  // engine result shape disagrees with the stream flag
        InternalFault,       // anything else
    };

    Kind kind{Kind::Buffered};
    Reason reason{Reason::None};
    int status{200};
    std::string body;
    std::shared_ptr<ChunkStream> stream;
};

const char* outcomeReasonName(InvocationOutcome::Reason reason);

/// Translates the fixed /invocations contract into engine calls.
/// Holds no per-request state; one instance serves all requests concurrently.
class ProtocolAdapter {
public:
    explicit ProtocolAdapter(const EngineHandle& handle);

    /// Never throws. Every failure is folded into a Rejected outcome.
    InvocationOutcome invoke(const std::string& body, const std::string& request_id) const;

    static std::string internalErrorBody();

private:
    InvocationOutcome dispatch(const std::string& body, const std::string& request_id) const;

    const EngineHandle& handle_;
};

}  // namespace hostgate
