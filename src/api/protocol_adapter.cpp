#include "api/protocol_adapter.h"

#include <exception>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "api/request_schema.h"
#include "core/engine_handle.h"

namespace hostgate {

using json = nlohmann::json;

namespace {

// Error details may echo raw request bytes; never let invalid UTF-8 throw here.
std::string dumpLenient(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

InvocationOutcome rejected(InvocationOutcome::Reason reason, int status, std::string body) {
    InvocationOutcome out;
    out.kind = InvocationOutcome::Kind::Rejected;
    out.reason = reason;
    out.status = status;
    out.body = std::move(body);
    return out;
}

InvocationOutcome internalFault() {
    return rejected(InvocationOutcome::Reason::InternalFault, 500, ProtocolAdapter::internalErrorBody());
}

InvocationOutcome invariantViolation() {
    return rejected(InvocationOutcome::Reason::InvariantViolation, 500, ProtocolAdapter::internalErrorBody());
}

}  // namespace

const char* outcomeReasonName(InvocationOutcome::Reason reason) {
    switch (reason) {
        case InvocationOutcome::Reason::None:
            return "ok";
        case InvocationOutcome::Reason::InvalidFormat:
            return "invalid_format";
        case InvocationOutcome::Reason::DomainError:
            return "domain_error";
        case InvocationOutcome::Reason::InvariantViolation:
            return "invariant_violation";
        case InvocationOutcome::Reason::InternalFault:
            return "internal_fault";
    }
    return "unknown";
}

ProtocolAdapter::ProtocolAdapter(const EngineHandle& handle) : handle_(handle) {}

std::string ProtocolAdapter::internalErrorBody() {
    return json{{"error", "Internal server error"}}.dump();
}

InvocationOutcome ProtocolAdapter::invoke(const std::string& body, const std::string& request_id) const {
    try {
        return dispatch(body, request_id);
    } catch (const std::exception& e) {
        spdlog::error("[{}] invocation failed: {}", request_id, e.what());
        return internalFault();
    }
}

InvocationOutcome ProtocolAdapter::dispatch(const std::string& body, const std::string& request_id) const {
    ChatCompletionRequest request;
    std::string parse_error;
    bool parsed = false;
    try {
        parsed = parseChatCompletionRequest(body, request, parse_error);
    } catch (const json::exception& e) {
        parse_error = e.what();
    }
    if (!parsed) {
        spdlog::debug("[{}] invalid request: {}", request_id, parse_error);
        return rejected(InvocationOutcome::Reason::InvalidFormat, 400,
                        dumpLenient({{"error", "Invalid request format"}, {"details", parse_error}}));
    }

    if (request.model.empty()) {
        request.model = handle_.primaryModelName();
        request.payload["model"] = request.model;
    }

    EngineResult result;
    try {
        result = handle_.engine().createChatCompletion(request);
    } catch (const std::exception& e) {
        spdlog::error("[{}] engine invocation failed: {}", request_id, e.what());
        return internalFault();
    }

    switch (result.kind) {
        case EngineResult::Kind::Error:
            return rejected(InvocationOutcome::Reason::DomainError, result.error.code,
                            dumpLenient(result.error.body));

        case EngineResult::Kind::Streamed:
            if (!result.stream) {
                spdlog::error("[{}] engine returned an empty stream handle", request_id);
                return internalFault();
            }
            if (!request.stream) {
                spdlog::error("[{}] invariant violation: stream=false but engine returned a chunk stream",
                              request_id);
                result.stream->cancel();
                return invariantViolation();
            }
            {
                InvocationOutcome out;
                out.kind = InvocationOutcome::Kind::Streamed;
                out.stream = std::move(result.stream);
                return out;
            }

        case EngineResult::Kind::Buffered:
            if (request.stream) {
                spdlog::error("[{}] invariant violation: stream=true but engine returned a buffered result",
                              request_id);
                return invariantViolation();
            }
            {
                InvocationOutcome out;
                out.kind = InvocationOutcome::Kind::Buffered;
                out.body = dumpLenient(result.body);
                return out;
            }
    }
    return internalFault();
}

}  // namespace hostgate
