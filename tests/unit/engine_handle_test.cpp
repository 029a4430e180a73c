#include <gtest/gtest.h>

#include "core/engine_handle.h"
#include "fake_engine.h"

using namespace hostgate;
using hostgate::test::FakeEngine;
using hostgate::test::factoryFor;
using hostgate::test::minimalConfig;

TEST(EngineHandleTest, InitializesThroughFactory) {
    auto engine = std::make_unique<FakeEngine>();
    engine->model_config = {"org/model", 4096};
    EngineConfig seen;
    auto config = minimalConfig("org/model");

    auto handle = EngineHandle::initialize(config, factoryFor(std::move(engine), &seen));

    ASSERT_NE(handle, nullptr);
    EXPECT_EQ(seen.model, "org/model");
    EXPECT_EQ(handle->engine().runtime(), "fake");
    EXPECT_EQ(handle->modelConfig().max_model_len, 4096u);
    EXPECT_EQ(handle->config().max_model_len, 4049);
}

TEST(EngineHandleTest, ServedNamesDefaultToModelId) {
    auto handle = EngineHandle::initialize(minimalConfig("org/model"),
                                           factoryFor(std::make_unique<FakeEngine>()));
    EXPECT_EQ(handle->servedModelNames(), (std::vector<std::string>{"org/model"}));
    EXPECT_EQ(handle->primaryModelName(), "org/model");
}

TEST(EngineHandleTest, ServedNamesUseDeclaredAliases) {
    auto config = minimalConfig("org/model");
    config.served_model_names = {"alias-a", "alias-b"};
    auto handle = EngineHandle::initialize(config, factoryFor(std::make_unique<FakeEngine>()));
    EXPECT_EQ(handle->servedModelNames(), (std::vector<std::string>{"alias-a", "alias-b"}));
    EXPECT_EQ(handle->primaryModelName(), "alias-a");
}

TEST(EngineHandleTest, FallsBackToPolicyWhenEngineReportsNothing) {
    auto engine = std::make_unique<FakeEngine>();
    engine->model_config = {};
    auto handle = EngineHandle::initialize(minimalConfig("org/model"), factoryFor(std::move(engine)));
    EXPECT_EQ(handle->modelConfig().model, "org/model");
    EXPECT_EQ(handle->modelConfig().max_model_len, 4049u);
}

TEST(EngineHandleTest, FactoryExceptionBecomesEngineInitError) {
    EngineFactory failing = [](const EngineConfig&) -> std::unique_ptr<Engine> {
        throw std::runtime_error("CUDA out of memory");
    };
    try {
        EngineHandle::initialize(minimalConfig(), failing);
        FAIL() << "expected EngineInitError";
    } catch (const EngineInitError& e) {
        EXPECT_NE(std::string(e.what()).find("CUDA out of memory"), std::string::npos);
    }
}

TEST(EngineHandleTest, EngineInitErrorPassesThroughUnchanged) {
    EngineFactory failing = [](const EngineConfig&) -> std::unique_ptr<Engine> {
        throw EngineInitError("engine did not become ready");
    };
    try {
        EngineHandle::initialize(minimalConfig(), failing);
        FAIL() << "expected EngineInitError";
    } catch (const EngineInitError& e) {
        EXPECT_STREQ(e.what(), "engine did not become ready");
    }
}

TEST(EngineHandleTest, NullEngineAndMissingFactoryAreErrors) {
    EngineFactory null_factory = [](const EngineConfig&) { return std::unique_ptr<Engine>(); };
    EXPECT_THROW(EngineHandle::initialize(minimalConfig(), null_factory), EngineInitError);
    EXPECT_THROW(EngineHandle::initialize(minimalConfig(), EngineFactory{}), EngineInitError);
}

TEST(EngineHandleTest, ModelConfigFailureIsEngineInitError) {
    auto engine = std::make_unique<FakeEngine>();
    engine->model_config_error = true;
    EXPECT_THROW(EngineHandle::initialize(minimalConfig(), factoryFor(std::move(engine))),
                 EngineInitError);
}
