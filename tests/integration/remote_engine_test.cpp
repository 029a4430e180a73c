#include <gtest/gtest.h>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <thread>

#include "api/request_schema.h"
#include "core/engine_handle.h"
#include "core/remote_engine.h"

using namespace hostgate;
using json = nlohmann::json;

namespace {

const std::vector<std::string> kUpstreamEvents = {
    "data: {\"choices\":[{\"delta\":{\"role\":\"assistant\"}}]}\n\n",
    "data: {\"choices\":[{\"delta\":{\"content\":\"Hi\"}}]}\n\n",
    "data: {\"choices\":[{\"delta\":{\"content\":\" there\"}}]}\n\n",
    "data: [DONE]\n\n",
};

// Minimal OpenAI-compatible engine server.
class FakeUpstream {
public:
    explicit FakeUpstream(int port) : port_(port) {
        server_.Get("/health", [](const httplib::Request&, httplib::Response& res) {
            res.status = 200;
        });
        server_.Get("/v1/models", [](const httplib::Request&, httplib::Response& res) {
            json body = {
                {"object", "list"},
                {"data", json::array({{{"id", "alias"}, {"root", "org/model"}, {"max_model_len", 4049}}})}
            };
            res.set_content(body.dump(), "application/json");
        });
        server_.Post("/v1/chat/completions", [this](const httplib::Request& req, httplib::Response& res) {
            last_body = req.body;
            auto body = json::parse(req.body);
            const std::string mode = body.value("model", "");
            if (mode == "reject") {
                res.status = 400;
                res.set_content(R"({"object":"error","message":"bad temperature","type":"BadRequestError","code":400})",
                                "application/json");
                return;
            }
            if (mode == "crash") {
                res.status = 500;
                res.set_content("Internal Server Error", "text/plain");
                return;
            }
            if (body.value("stream", false)) {
                res.set_chunked_content_provider(
                    "text/event-stream", [this](size_t, httplib::DataSink& sink) {
                        // Split across event boundaries on purpose
                        std::string wire;
                        for (const auto& e : kUpstreamEvents) wire += e;
                        for (size_t i = 0; i < wire.size(); i += 7) {
                            const auto piece = wire.substr(i, 7);
                            if (!sink.write(piece.data(), piece.size())) return false;
                        }
                        sink.done();
                        return true;
                    });
                return;
            }
            json reply = {
                {"id", "chatcmpl-9"},
                {"object", "chat.completion"},
                {"model", mode},
                {"choices", json::array({{{"index", 0},
                                          {"message", {{"role", "assistant"}, {"content", "Hi there"}}},
                                          {"finish_reason", "stop"}}})}
            };
            res.set_content(reply.dump(), "application/json");
        });

        thread_ = std::thread([this]() { server_.listen("127.0.0.1", port_); });
        while (!server_.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    ~FakeUpstream() {
        server_.stop();
        if (thread_.joinable()) thread_.join();
    }

    std::string url() const { return "http://127.0.0.1:" + std::to_string(port_); }

    std::string last_body;

private:
    int port_;
    httplib::Server server_;
    std::thread thread_;
};

ChatCompletionRequest makeRequest(const std::string& model, bool stream) {
    json body = {
        {"model", model},
        {"messages", json::array({{{"role", "user"}, {"content", "hi"}}})},
        {"stream", stream},
        {"guided_regex", "[a-z]+"}
    };
    ChatCompletionRequest req;
    std::string error;
    EXPECT_TRUE(parseChatCompletionRequest(body, req, error)) << error;
    return req;
}

std::vector<std::string> drain(ChunkStream& stream) {
    std::vector<std::string> out;
    std::string chunk;
    while (stream.next(chunk)) out.push_back(chunk);
    return out;
}

}  // namespace

TEST(RemoteEngineTest, ReadsModelConfigFromModelsEndpoint) {
    FakeUpstream upstream(18140);
    RemoteEngine engine(upstream.url());

    const auto cfg = engine.modelConfig();
    EXPECT_EQ(cfg.model, "org/model");
    EXPECT_EQ(cfg.max_model_len, 4049u);
    EXPECT_EQ(engine.runtime(), "openai_http");
}

TEST(RemoteEngineTest, BufferedCompletion) {
    FakeUpstream upstream(18141);
    RemoteEngine engine(upstream.url());

    auto result = engine.createChatCompletion(makeRequest("alias", false));
    ASSERT_EQ(result.kind, EngineResult::Kind::Buffered);
    EXPECT_EQ(result.body["choices"][0]["message"]["content"], "Hi there");

    // Unknown fields reach the engine untouched
    auto forwarded = json::parse(upstream.last_body);
    EXPECT_EQ(forwarded["guided_regex"], "[a-z]+");
}

TEST(RemoteEngineTest, StreamedCompletionReframesEvents) {
    FakeUpstream upstream(18142);
    RemoteEngine engine(upstream.url());

    auto result = engine.createChatCompletion(makeRequest("alias", true));
    ASSERT_EQ(result.kind, EngineResult::Kind::Streamed);
    ASSERT_NE(result.stream, nullptr);
    EXPECT_EQ(drain(*result.stream), kUpstreamEvents);
}

TEST(RemoteEngineTest, UpstreamJsonErrorIsDomainError) {
    FakeUpstream upstream(18143);
    RemoteEngine engine(upstream.url());

    for (bool stream : {false, true}) {
        auto result = engine.createChatCompletion(makeRequest("reject", stream));
        ASSERT_EQ(result.kind, EngineResult::Kind::Error) << "stream=" << stream;
        EXPECT_EQ(result.error.code, 400);
        EXPECT_EQ(result.error.body["message"], "bad temperature");
        EXPECT_EQ(result.error.body["type"], "BadRequestError");
    }
}

TEST(RemoteEngineTest, UpstreamPlainTextErrorIsWrapped) {
    FakeUpstream upstream(18144);
    RemoteEngine engine(upstream.url());

    auto result = engine.createChatCompletion(makeRequest("crash", false));
    ASSERT_EQ(result.kind, EngineResult::Kind::Error);
    EXPECT_EQ(result.error.code, 500);
    EXPECT_EQ(result.error.body["object"], "error");
    EXPECT_EQ(result.error.body["message"], "Internal Server Error");
    EXPECT_EQ(result.error.body["code"], 500);
}

TEST(RemoteEngineTest, UnreachableEngineThrows) {
    RemoteEngine engine("http://127.0.0.1:18149");
    EXPECT_THROW(engine.createChatCompletion(makeRequest("alias", false)), std::exception);
    EXPECT_THROW(engine.createChatCompletion(makeRequest("alias", true)), std::exception);
}

TEST(RemoteEngineTest, CancelStopsStream) {
    FakeUpstream upstream(18145);
    RemoteEngine engine(upstream.url());

    auto result = engine.createChatCompletion(makeRequest("alias", true));
    ASSERT_EQ(result.kind, EngineResult::Kind::Streamed);
    result.stream->cancel();
    std::string chunk;
    EXPECT_FALSE(result.stream->next(chunk));
    result.stream->cancel();  // idempotent
}

TEST(RemoteEngineTest, WaitUntilReady) {
    FakeUpstream upstream(18146);
    RemoteEngine ready(upstream.url());
    EXPECT_TRUE(ready.waitUntilReady(std::chrono::seconds(5)));

    RemoteEngine missing("http://127.0.0.1:18148");
    EXPECT_FALSE(missing.waitUntilReady(std::chrono::seconds(1)));
}

TEST(RemoteEngineTest, ToErrorResponse) {
    auto kept = toErrorResponse(404, R"({"message":"The model `x` does not exist."})");
    EXPECT_EQ(kept.code, 404);
    EXPECT_EQ(kept.body, json({{"message", "The model `x` does not exist."}}));

    auto empty = toErrorResponse(503, "");
    EXPECT_EQ(empty.body["message"], "engine returned status 503");
    EXPECT_EQ(empty.body["type"], "EngineError");

    // A JSON array is not an error object
    auto wrapped = toErrorResponse(400, "[1,2]");
    EXPECT_EQ(wrapped.body["message"], "[1,2]");
}

TEST(RemoteEngineTest, FactoryAttachesToEngineUrl) {
    FakeUpstream upstream(18147);
    DeploymentParams params;
    params.model_id = "org/model";
    params.engine_url = upstream.url();
    params.engine_startup_timeout_seconds = 5;

    auto handle = EngineHandle::initialize(resolveEngineConfig(params), makeRemoteEngineFactory(params));
    EXPECT_EQ(handle->engine().runtime(), "openai_http");
    EXPECT_EQ(handle->modelConfig().max_model_len, 4049u);
}

TEST(RemoteEngineTest, FactoryRejectsEnginePortEqualToApiPort) {
    DeploymentParams params;
    params.model_id = "org/model";
    params.port = 9000;
    params.engine_port = 9000;
    EXPECT_THROW(makeRemoteEngineFactory(params)(resolveEngineConfig(params)), EngineInitError);
}

TEST(RemoteEngineTest, FactoryFailsWhenEngineCannotStart) {
    DeploymentParams params;
    params.model_id = "org/model";
    params.engine_command = "hostgate-no-such-engine serve";
    params.engine_port = 18150;
    EXPECT_THROW(EngineHandle::initialize(resolveEngineConfig(params), makeRemoteEngineFactory(params)),
                 EngineInitError);
}

TEST(RemoteEngineTest, FactoryFailsWhenEngineExitsBeforeReady) {
    DeploymentParams params;
    params.model_id = "org/model";
    params.engine_command = "false";  // exits 1 immediately, ignoring arguments
    params.engine_port = 18151;
    params.engine_startup_timeout_seconds = 10;

    const auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(makeRemoteEngineFactory(params)(resolveEngineConfig(params)), EngineInitError);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(8));
}
