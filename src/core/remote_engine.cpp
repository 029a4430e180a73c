#include "core/remote_engine.h"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <httplib.h>
#include <spdlog/spdlog.h>

#include "core/engine_handle.h"
#include "utils/sse.h"

namespace hostgate {

using json = nlohmann::json;

namespace {

constexpr const char* kChatCompletionsPath = "/v1/chat/completions";
constexpr time_t kConnectTimeoutSec = 10;
// Per-read inactivity limit, not a request deadline. Generations may run long.
constexpr time_t kReadTimeoutSec = 3600;

std::string joinArgs(const std::vector<std::string>& args) {
    std::ostringstream oss;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i) oss << ' ';
        oss << args[i];
    }
    return oss.str();
}

// Chunk stream backed by one in-flight HTTP request to the engine server.
// A worker thread drives the request; next() hands events over in arrival order.
class HttpChunkStream : public ChunkStream {
public:
    struct Head {
        int status{0};
        std::string content_type;
    };

    HttpChunkStream(std::string base_url, std::string body)
        : base_url_(std::move(base_url)), body_(std::move(body)) {}

    ~HttpChunkStream() override {
        cancel();
        if (worker_.joinable()) worker_.join();
    }

    void start() {
        worker_ = std::thread([this]() { run(); });
    }

    // Blocks until the status line and headers have arrived.
    Head waitForHead() {
        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait(lock, [this]() { return head_ready_ || finished_; });
        if (!head_ready_) {
            throw std::runtime_error("engine request failed: " +
                                     (transport_error_.empty() ? std::string("no response") : transport_error_));
        }
        return head_;
    }

    // Blocks until the response is complete and returns the raw (non-SSE) body.
    std::string drainBody() {
        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait(lock, [this]() { return finished_; });
        if (!transport_error_.empty()) {
            throw std::runtime_error("engine response interrupted: " + transport_error_);
        }
        return raw_body_;
    }

    bool next(std::string& chunk) override {
        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait(lock, [this]() { return !events_.empty() || finished_ || cancelled_; });
        if (cancelled_) {
            return false;
        }
        if (!events_.empty()) {
            chunk = std::move(events_.front());
            events_.pop_front();
            return true;
        }
        if (!transport_error_.empty()) {
            throw std::runtime_error("engine stream interrupted: " + transport_error_);
        }
        return false;
    }

    void cancel() override {
        std::lock_guard<std::mutex> lock(mu_);
        if (cancelled_) return;
        cancelled_ = true;
        events_.clear();
        if (client_) {
            client_->stop();
        }
        cv_.notify_all();
    }

private:
    void run() {
        httplib::Client client(base_url_);
        client.set_connection_timeout(kConnectTimeoutSec, 0);
        client.set_read_timeout(kReadTimeoutSec, 0);
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (cancelled_) {
                finished_ = true;
                cv_.notify_all();
                return;
            }
            client_ = &client;
        }

        httplib::Request req;
        req.method = "POST";
        req.path = kChatCompletionsPath;
        req.body = body_;
        req.set_header("Content-Type", "application/json");
        req.set_header("Accept", "text/event-stream");
        req.response_handler = [this](const httplib::Response& res) {
            std::lock_guard<std::mutex> lock(mu_);
            head_.status = res.status;
            head_.content_type = res.get_header_value("Content-Type");
            head_ready_ = true;
            cv_.notify_all();
            return !cancelled_;
        };
        req.content_receiver = [this](const char* data, size_t len, uint64_t, uint64_t) {
            std::lock_guard<std::mutex> lock(mu_);
            if (cancelled_) return false;
            if (head_.status == 200 && sse::isEventStream(head_.content_type)) {
                for (auto& ev : splitter_.feed(data, len)) {
                    events_.push_back(std::move(ev));
                }
            } else {
                raw_body_.append(data, len);
            }
            cv_.notify_all();
            return true;
        };

        auto result = client.send(req);

        std::lock_guard<std::mutex> lock(mu_);
        client_ = nullptr;
        if (!cancelled_) {
            auto rest = splitter_.flush();
            if (!rest.empty()) {
                events_.push_back(std::move(rest));
            }
            if (!result) {
                transport_error_ = httplib::to_string(result.error());
            }
        }
        finished_ = true;
        cv_.notify_all();
    }

    const std::string base_url_;
    const std::string body_;
    std::thread worker_;

    std::mutex mu_;
    std::condition_variable cv_;
    bool head_ready_{false};
    bool finished_{false};
    bool cancelled_{false};
    Head head_;
    std::deque<std::string> events_;
    std::string raw_body_;
    std::string transport_error_;
    sse::EventSplitter splitter_;
    httplib::Client* client_{nullptr};
};

// Replays events that already arrived in full (engine answered a buffered
// request with SSE). Lets the adapter see the shape the engine really chose.
class BufferedChunkStream : public ChunkStream {
public:
    explicit BufferedChunkStream(std::deque<std::string> events) : events_(std::move(events)) {}

    bool next(std::string& chunk) override {
        if (events_.empty()) return false;
        chunk = std::move(events_.front());
        events_.pop_front();
        return true;
    }

    void cancel() override { events_.clear(); }

private:
    std::deque<std::string> events_;
};

}  // namespace

ErrorResponse toErrorResponse(int status, const std::string& body) {
    ErrorResponse err;
    err.code = status;
    auto parsed = json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        err.body = std::move(parsed);
        return err;
    }
    err.body = {
        {"object", "error"},
        {"message", body.empty() ? "engine returned status " + std::to_string(status) : body},
        {"type", "EngineError"},
        {"code", status}
    };
    return err;
}

RemoteEngine::RemoteEngine(std::string base_url, std::unique_ptr<EngineProcess> process)
    : base_url_(std::move(base_url)), process_(std::move(process)) {}

RemoteEngine::~RemoteEngine() {
    if (process_) {
        process_->terminate();
    }
}

ModelConfig RemoteEngine::modelConfig() const {
    httplib::Client client(base_url_);
    client.set_connection_timeout(kConnectTimeoutSec, 0);
    client.set_read_timeout(30, 0);

    auto res = client.Get("/v1/models");
    if (!res) {
        throw std::runtime_error("GET /v1/models failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw std::runtime_error("GET /v1/models returned status " + std::to_string(res->status));
    }

    auto body = json::parse(res->body);
    ModelConfig cfg;
    if (body.contains("data") && body["data"].is_array() && !body["data"].empty()) {
        const auto& first = body["data"][0];
        cfg.model = first.value("root", first.value("id", ""));
        if (first.contains("max_model_len") && first["max_model_len"].is_number_unsigned()) {
            cfg.max_model_len = first["max_model_len"].get<size_t>();
        }
    }
    return cfg;
}

EngineResult RemoteEngine::createChatCompletion(const ChatCompletionRequest& request) const {
    if (request.stream) {
        return completeStreaming(request.payload);
    }
    return completeBuffered(request.payload);
}

EngineResult RemoteEngine::completeBuffered(const json& payload) const {
    httplib::Client client(base_url_);
    client.set_connection_timeout(kConnectTimeoutSec, 0);
    client.set_read_timeout(kReadTimeoutSec, 0);

    auto res = client.Post(kChatCompletionsPath, payload.dump(), "application/json");
    if (!res) {
        throw std::runtime_error("engine request failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        return EngineResult::failure(toErrorResponse(res->status, res->body));
    }
    if (sse::isEventStream(res->get_header_value("Content-Type"))) {
        sse::EventSplitter splitter;
        auto events = splitter.feed(res->body.data(), res->body.size());
        auto rest = splitter.flush();
        if (!rest.empty()) events.push_back(std::move(rest));
        return EngineResult::streamed(std::make_shared<BufferedChunkStream>(
            std::deque<std::string>(events.begin(), events.end())));
    }
    return EngineResult::buffered(json::parse(res->body));
}

EngineResult RemoteEngine::completeStreaming(const json& payload) const {
    auto stream = std::make_shared<HttpChunkStream>(base_url_, payload.dump());
    stream->start();

    const auto head = stream->waitForHead();
    if (head.status != 200) {
        return EngineResult::failure(toErrorResponse(head.status, stream->drainBody()));
    }
    if (!sse::isEventStream(head.content_type)) {
        return EngineResult::buffered(json::parse(stream->drainBody()));
    }
    return EngineResult::streamed(std::move(stream));
}

bool RemoteEngine::waitUntilReady(std::chrono::seconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    httplib::Client client(base_url_);
    client.set_connection_timeout(2, 0);
    client.set_read_timeout(2, 0);

    int attempts = 0;
    while (std::chrono::steady_clock::now() < deadline) {
        if (process_ && !process_->isAlive()) {
            spdlog::error("Engine process exited before becoming ready (status {})", process_->exitStatus());
            return false;
        }
        auto res = client.Get("/health");
        if (res && res->status == 200) {
            spdlog::info("Engine at {} ready after {} probe(s)", base_url_, attempts + 1);
            return true;
        }
        if (++attempts % 30 == 0) {
            spdlog::info("Waiting for engine at {} ({} probes so far)", base_url_, attempts);
        }
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    return false;
}

EngineFactory makeRemoteEngineFactory(const DeploymentParams& params) {
    return [params](const EngineConfig& config) -> std::unique_ptr<Engine> {
        std::unique_ptr<RemoteEngine> engine;
        if (!params.engine_url.empty()) {
            spdlog::info("Attaching to engine at {}", params.engine_url);
            engine = std::make_unique<RemoteEngine>(params.engine_url);
        } else {
            if (params.engine_port == config.port) {
                throw EngineInitError("ENGINE_PORT must differ from the API port (" +
                                      std::to_string(config.port) + ")");
            }
            auto argv = EngineProcess::buildArgv(
                params.engine_command,
                buildEngineArgs(config, kEngineLoopbackHost, params.engine_port));
            spdlog::info("Launching engine: {}", joinArgs(argv));
            auto process = EngineProcess::launch(argv);
            engine = std::make_unique<RemoteEngine>(
                std::string("http://") + kEngineLoopbackHost + ":" + std::to_string(params.engine_port),
                std::move(process));
        }

        if (!engine->waitUntilReady(std::chrono::seconds(params.engine_startup_timeout_seconds))) {
            throw EngineInitError("engine at " + engine->baseUrl() + " did not become ready within " +
                                  std::to_string(params.engine_startup_timeout_seconds) + "s");
        }
        return engine;
    };
}

}  // namespace hostgate
