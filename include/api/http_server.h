#pragma once

#include <httplib.h>
#include <atomic>
#include <functional>
#include <string>
#include <thread>

#include "utils/config.h"

namespace hostgate {

class InvocationEndpoints;

using Logger = std::function<void(const httplib::Request&, const httplib::Response&)>;

class HttpServer {
public:
    HttpServer(std::string bind_address, int port, InvocationEndpoints& endpoints);
    ~HttpServer();

    /// Bind and start serving on a background thread.
    /// Throws std::runtime_error when the address cannot be bound.
    void start();
    void stop();

    /// Worker pool size. Call before start().
    void setThreadCount(int threads) { thread_count_ = threads; }
    void setLogger(Logger logger) { logger_ = std::move(logger); }

    int port() const { return port_; }
    bool isRunning() const { return running_; }

private:
    std::string bind_address_;
    int port_;
    InvocationEndpoints& endpoints_;
    httplib::Server server_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    int thread_count_{kDefaultHttpThreads};
    Logger logger_{};
};

}  // namespace hostgate
