#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/engine.h"
#include "utils/config.h"

namespace hostgate {

/// Engine could not be brought up. Fatal at startup.
class EngineInitError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Single long-lived reference to the inference engine and its metadata.
/// Created once before the listener accepts traffic, then shared read-only
/// by every request until process shutdown.
class EngineHandle {
public:
    /// Build the engine through factory and query its model metadata.
    /// Throws EngineInitError when construction or the metadata query fails.
    static std::unique_ptr<EngineHandle> initialize(const EngineConfig& config,
                                                    const EngineFactory& factory);

    EngineHandle(const EngineHandle&) = delete;
    EngineHandle& operator=(const EngineHandle&) = delete;
    EngineHandle(EngineHandle&&) = delete;
    EngineHandle& operator=(EngineHandle&&) = delete;
    ~EngineHandle();

    const Engine& engine() const { return *engine_; }
    const EngineConfig& config() const { return config_; }
    const ModelConfig& modelConfig() const { return model_config_; }

    /// Declared aliases, or the raw model id when none were declared.
    const std::vector<std::string>& servedModelNames() const { return served_model_names_; }
    const std::string& primaryModelName() const { return served_model_names_.front(); }

private:
    EngineHandle(EngineConfig config,
                 std::unique_ptr<Engine> engine,
                 ModelConfig model_config,
                 std::vector<std::string> served_model_names);

    const EngineConfig config_;
    std::unique_ptr<Engine> engine_;
    const ModelConfig model_config_;
    const std::vector<std::string> served_model_names_;
};

}  // namespace hostgate
