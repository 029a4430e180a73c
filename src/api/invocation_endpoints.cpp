#include "api/invocation_endpoints.h"

#include <chrono>
#include <memory>
#include <spdlog/spdlog.h>

#include "runtime/state.h"
#include "utils/sse.h"

namespace hostgate {

using json = nlohmann::json;

namespace {

double elapsedMs(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

// Lives until the response is fully written; for streams that is when the
// chunk provider is released.
struct InvocationState {
    std::shared_ptr<ChunkStream> stream;
    std::string request_id;
    std::chrono::steady_clock::time_point started;
    size_t chunks{0};
    bool completed{false};
    InflightGuard inflight;
};

}  // namespace

InvocationEndpoints::InvocationEndpoints(const ProtocolAdapter& adapter) : adapter_(adapter) {}

void InvocationEndpoints::setJson(httplib::Response& res, const std::string& body) {
    res.set_content(body, "application/json");
}

std::string InvocationEndpoints::streamErrorEvent(const std::string& message) {
    json err = {
        {"object", "error"},
        {"message", message},
        {"type", "InternalServerError"},
        {"code", 500}
    };
    return sse::formatData(err);
}

void InvocationEndpoints::registerRoutes(httplib::Server& server) {
    server.Get("/ping", [](const httplib::Request&, httplib::Response& res) {
        setJson(res, "{}");
    });

    server.Post("/invocations", [this](const httplib::Request& req, httplib::Response& res) {
        handleInvocation(req, res);
    });
}

void InvocationEndpoints::handleInvocation(const httplib::Request& req, httplib::Response& res) {
    const auto started = std::chrono::steady_clock::now();
    const std::string request_id = res.get_header_value("X-Request-Id");

    auto state = std::make_shared<InvocationState>();
    InvocationOutcome outcome = adapter_.invoke(req.body, request_id);

    if (outcome.kind != InvocationOutcome::Kind::Streamed) {
        res.status = outcome.status;
        setJson(res, outcome.body);
        spdlog::info("[{}] /invocations {} {} {:.1f}ms", request_id, res.status,
                     outcomeReasonName(outcome.reason), elapsedMs(started));
        return;
    }

    state->stream = std::move(outcome.stream);
    state->request_id = request_id;
    state->started = started;

    res.status = 200;
    res.set_header("Cache-Control", "no-cache");
    res.set_chunked_content_provider(
        "text/event-stream",
        [state](size_t, httplib::DataSink& sink) {
            std::string chunk;
            bool more = false;
            try {
                more = state->stream->next(chunk);
            } catch (const std::exception& e) {
                spdlog::error("[{}] engine stream failed after {} chunk(s): {}",
                              state->request_id, state->chunks, e.what());
                const auto event = streamErrorEvent("engine stream failed");
                sink.write(event.data(), event.size());
                sink.done();
                return true;
            }
            if (!more) {
                state->completed = true;
                sink.done();
                return true;
            }
            if (!sink.write(chunk.data(), chunk.size())) {
                spdlog::info("[{}] client disconnected after {} chunk(s)", state->request_id, state->chunks);
                state->stream->cancel();
                return false;
            }
            ++state->chunks;
            return true;
        },
        [state](bool success) {
            if (!success || !state->completed) {
                state->stream->cancel();
            }
            spdlog::info("[{}] /invocations 200 {} {} chunk(s) {:.1f}ms", state->request_id,
                         state->completed ? "streamed" : "stream_aborted", state->chunks,
                         elapsedMs(state->started));
        });
}

}  // namespace hostgate
