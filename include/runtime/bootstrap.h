#pragma once

#include <chrono>
#include <memory>
#include <optional>

#include "core/engine.h"
#include "utils/config.h"

namespace hostgate {

class EngineHandle;
class HttpServer;
class InvocationEndpoints;
class ProtocolAdapter;

/// Owns the process lifecycle: configuration, the engine handle and the
/// HTTP listener. The engine is fully up before the listener binds, and the
/// listener is stopped before the engine is released.
class Bootstrap {
public:
    Bootstrap(DeploymentParams params, EngineFactory factory);
    ~Bootstrap();

    Bootstrap(const Bootstrap&) = delete;
    Bootstrap& operator=(const Bootstrap&) = delete;

    /// Logger init, config resolution, engine handle construction.
    /// Throws ConfigError or EngineInitError.
    void startup();

    /// Bind the listener and wait until it answers GET /ping.
    /// Throws std::runtime_error when the address cannot be bound.
    void start();

    /// Block until request_shutdown() is called (signal handler).
    void waitForShutdown(std::chrono::milliseconds poll = std::chrono::milliseconds(200));

    /// Stop the listener, then tear down the engine handle. Idempotent.
    void shutdown();

    const EngineHandle* handle() const { return handle_.get(); }
    const std::optional<EngineConfig>& config() const { return config_; }

    void setInitLogging(bool enable) { init_logging_ = enable; }

private:
    DeploymentParams params_;
    EngineFactory factory_;
    bool init_logging_{true};

    std::optional<EngineConfig> config_;
    std::unique_ptr<EngineHandle> handle_;
    std::unique_ptr<ProtocolAdapter> adapter_;
    std::unique_ptr<InvocationEndpoints> endpoints_;
    std::unique_ptr<HttpServer> server_;
};

/// startup() + start() + waitForShutdown() + shutdown(), mapped to a process
/// exit code (0 on clean shutdown, 1 on any startup failure).
/// The caller marks the process running first; a shutdown requested while
/// startup() runs skips the listener.
int runServer(DeploymentParams params, EngineFactory factory, bool single_iteration = false);

}  // namespace hostgate
