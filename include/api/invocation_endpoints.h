#pragma once

#include <httplib.h>
#include <string>
#include <nlohmann/json.hpp>

#include "api/protocol_adapter.h"

namespace hostgate {

/// GET /ping and POST /invocations.
class InvocationEndpoints {
public:
    explicit InvocationEndpoints(const ProtocolAdapter& adapter);

    void registerRoutes(httplib::Server& server);

    /// SSE event sent when the engine fails after the stream has started.
    static std::string streamErrorEvent(const std::string& message);

private:
    void handleInvocation(const httplib::Request& req, httplib::Response& res);

    static void setJson(httplib::Response& res, const std::string& body);

    const ProtocolAdapter& adapter_;
};

}  // namespace hostgate
