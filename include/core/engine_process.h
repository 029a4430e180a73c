#pragma once

#include <sys/types.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace hostgate {

/// Supervised engine server child process.
/// The process is terminated (SIGTERM, then SIGKILL after the grace period)
/// when this object is destroyed.
class EngineProcess {
public:
    /// Spawn argv[0] (looked up on PATH) with the given arguments.
    /// Throws EngineInitError when the process cannot be started.
    static std::unique_ptr<EngineProcess> launch(const std::vector<std::string>& argv);

    /// "vllm serve" + {"--model", "m"} -> {"vllm", "serve", "--model", "m"}
    static std::vector<std::string> buildArgv(const std::string& command,
                                              const std::vector<std::string>& args);

    EngineProcess(const EngineProcess&) = delete;
    EngineProcess& operator=(const EngineProcess&) = delete;
    ~EngineProcess();

    pid_t pid() const { return pid_; }

    /// Non-blocking liveness check. Reaps the child once it has exited.
    bool isAlive();

    /// Exit status once the child has exited (-1 while running).
    int exitStatus() const { return exit_status_; }

    void terminate(std::chrono::seconds grace = std::chrono::seconds(30));

private:
    explicit EngineProcess(pid_t pid) : pid_(pid) {}

    pid_t pid_{-1};
    bool reaped_{false};
    int exit_status_{-1};
};

}  // namespace hostgate
