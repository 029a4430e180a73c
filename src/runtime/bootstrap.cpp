#include "runtime/bootstrap.h"

#include <stdexcept>
#include <thread>
#include <httplib.h>
#include <spdlog/spdlog.h>

#include "api/http_server.h"
#include "api/invocation_endpoints.h"
#include "api/protocol_adapter.h"
#include "core/engine_handle.h"
#include "runtime/state.h"
#include "utils/logger.h"

namespace hostgate {

namespace {

std::string selfCheckHost(const std::string& bind_address) {
    if (bind_address.empty() || bind_address == "0.0.0.0") return "127.0.0.1";
    if (bind_address == "::") return "::1";
    return bind_address;
}

}  // namespace

Bootstrap::Bootstrap(DeploymentParams params, EngineFactory factory)
    : params_(std::move(params)), factory_(std::move(factory)) {}

Bootstrap::~Bootstrap() { shutdown(); }

void Bootstrap::startup() {
    if (init_logging_) {
        logger::init_for_deployment(params_.log_level);
    }

    config_ = resolveEngineConfig(params_);
    spdlog::info("Resolved engine config: model={} tensor_parallel_size={} max_model_len={}",
                 config_->model, config_->tensor_parallel_size, config_->max_model_len);

    handle_ = EngineHandle::initialize(*config_, factory_);
    adapter_ = std::make_unique<ProtocolAdapter>(*handle_);
    endpoints_ = std::make_unique<InvocationEndpoints>(*adapter_);
}

void Bootstrap::start() {
    if (!endpoints_) {
        throw std::logic_error("Bootstrap::start() called before startup()");
    }

    server_ = std::make_unique<HttpServer>(config_->host, config_->port, *endpoints_);
    server_->setThreadCount(params_.http_threads);
    server_->setLogger([](const httplib::Request& req, const httplib::Response& res) {
        spdlog::debug("{} {} {} id={}", req.method, req.path, res.status,
                      res.get_header_value("X-Request-Id"));
    });
    server_->start();

    httplib::Client self_check(selfCheckHost(config_->host), config_->port);
    self_check.set_connection_timeout(1, 0);
    self_check.set_read_timeout(1, 0);
    const int max_wait = 50;  // 50 * 100ms = 5s max
    for (int i = 0; i < max_wait; ++i) {
        auto res = self_check.Get("/ping");
        if (res && res->status == 200) {
            spdlog::info("Server ready after {}ms", (i + 1) * 100);
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    spdlog::warn("Self-check GET /ping did not succeed; continuing");
}

void Bootstrap::waitForShutdown(std::chrono::milliseconds poll) {
    while (is_running()) {
        std::this_thread::sleep_for(poll);
    }
}

void Bootstrap::shutdown() {
    if (server_) {
        spdlog::info("Stopping listener ({} request(s) in flight)", inflight_request_count());
        server_->stop();
        server_.reset();
    }
    endpoints_.reset();
    adapter_.reset();
    handle_.reset();
}

int runServer(DeploymentParams params, EngineFactory factory, bool single_iteration) {
    try {
        Bootstrap bootstrap(std::move(params), std::move(factory));
        bootstrap.startup();
        if (!is_running()) {
            spdlog::info("Shutdown requested during startup; not starting the listener");
            bootstrap.shutdown();
            return 0;
        }
        bootstrap.start();

        if (single_iteration) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
            request_shutdown();
        }
        bootstrap.waitForShutdown();

        spdlog::info("Shutting down ({} request(s) served)", total_request_count());
        bootstrap.shutdown();
    } catch (const ConfigError& e) {
        spdlog::critical("Configuration error: {}", e.what());
        return 1;
    } catch (const EngineInitError& e) {
        spdlog::critical("Engine initialization failed: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }

    spdlog::info("Shutdown complete");
    return 0;
}

}  // namespace hostgate
