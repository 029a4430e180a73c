#include "core/engine_handle.h"

#include <spdlog/spdlog.h>

namespace hostgate {

EngineHandle::EngineHandle(EngineConfig config,
                           std::unique_ptr<Engine> engine,
                           ModelConfig model_config,
                           std::vector<std::string> served_model_names)
    : config_(std::move(config)),
      engine_(std::move(engine)),
      model_config_(std::move(model_config)),
      served_model_names_(std::move(served_model_names)) {}

EngineHandle::~EngineHandle() {
    spdlog::info("Releasing engine handle ({})", engine_ ? engine_->runtime() : "none");
}

std::unique_ptr<EngineHandle> EngineHandle::initialize(const EngineConfig& config,
                                                       const EngineFactory& factory) {
    if (!factory) {
        throw EngineInitError("no engine factory configured");
    }

    std::unique_ptr<Engine> engine;
    try {
        engine = factory(config);
    } catch (const EngineInitError&) {
        throw;
    } catch (const std::exception& e) {
        throw EngineInitError(std::string("engine construction failed: ") + e.what());
    }
    if (!engine) {
        throw EngineInitError("engine factory returned no engine");
    }

    ModelConfig model_config;
    try {
        model_config = engine->modelConfig();
    } catch (const std::exception& e) {
        throw EngineInitError(std::string("failed to query model config: ") + e.what());
    }
    if (model_config.model.empty()) {
        model_config.model = config.model;
    }
    if (model_config.max_model_len == 0) {
        model_config.max_model_len = static_cast<size_t>(config.max_model_len);
    }

    std::vector<std::string> served = config.served_model_names;
    if (served.empty()) {
        served.push_back(config.model);
    }

    spdlog::info("Engine ready: runtime={} model={} max_model_len={} tensor_parallel_size={}",
                 engine->runtime(), model_config.model, model_config.max_model_len,
                 config.tensor_parallel_size);

    return std::unique_ptr<EngineHandle>(new EngineHandle(
        config, std::move(engine), std::move(model_config), std::move(served)));
}

}  // namespace hostgate
