#include <gtest/gtest.h>
#include <cstdlib>
#include <string>
#include <unordered_map>
#include <vector>

#include "utils/config.h"

using namespace hostgate;

class EnvGuard {
public:
    EnvGuard(const std::vector<std::string>& keys) : keys_(keys) {
        for (const auto& k : keys_) {
            const char* v = std::getenv(k.c_str());
            if (v) saved_[k] = v;
            unsetenv(k.c_str());
        }
    }
    ~EnvGuard() {
        for (const auto& k : keys_) {
            if (auto it = saved_.find(k); it != saved_.end()) {
                setenv(k.c_str(), it->second.c_str(), 1);
            } else {
                unsetenv(k.c_str());
            }
        }
    }
private:
    std::vector<std::string> keys_;
    std::unordered_map<std::string, std::string> saved_;
};

static const std::vector<std::string> kDeploymentEnv = {
    "MODEL_ID", "TOKENIZER", "INSTANCE_TYPE", "API_HOST", "API_PORT",
    "HOSTGATE_LOG_LEVEL", "UVICORN_LOG_LEVEL", "SERVED_MODEL_NAME",
    "ENGINE_URL", "ENGINE_COMMAND", "ENGINE_PORT",
    "ENGINE_STARTUP_TIMEOUT_SECONDS", "HOSTGATE_HTTP_THREADS"};

TEST(UtilsConfigTest, DefaultsWhenEnvironmentIsEmpty) {
    EnvGuard guard(kDeploymentEnv);

    auto info = loadDeploymentParamsWithLog();
    const auto& params = info.first;

    EXPECT_FALSE(params.model_id.has_value());
    EXPECT_FALSE(params.tokenizer.has_value());
    EXPECT_FALSE(params.instance_type.has_value());
    EXPECT_EQ(params.host, "0.0.0.0");
    EXPECT_EQ(params.port, 8000);
    EXPECT_EQ(params.log_level, "info");
    EXPECT_TRUE(params.served_model_names.empty());
    EXPECT_TRUE(params.engine_url.empty());
    EXPECT_EQ(params.engine_command, "vllm serve");
    EXPECT_EQ(params.engine_port, 8081);
    EXPECT_EQ(params.engine_startup_timeout_seconds, 1800);
    EXPECT_EQ(params.http_threads, kDefaultHttpThreads);
    EXPECT_NE(info.second.find("default:INSTANCE_TYPE=ml.g6.4xlarge"), std::string::npos);
}

TEST(UtilsConfigTest, ReadsDeploymentEnvironment) {
    EnvGuard guard(kDeploymentEnv);

    setenv("MODEL_ID", "meta-llama/Llama-3.2-11B-Vision-Instruct", 1);
    setenv("TOKENIZER", "meta-llama/tokenizer", 1);
    setenv("INSTANCE_TYPE", "ml.g5.12xlarge", 1);
    setenv("API_HOST", "127.0.0.1", 1);
    setenv("API_PORT", "9000", 1);
    setenv("SERVED_MODEL_NAME", "llama, vision ,,", 1);
    setenv("ENGINE_URL", "http://127.0.0.1:9100", 1);
    setenv("ENGINE_PORT", "9200", 1);
    setenv("ENGINE_STARTUP_TIMEOUT_SECONDS", "60", 1);
    setenv("HOSTGATE_HTTP_THREADS", "16", 1);

    auto info = loadDeploymentParamsWithLog();
    const auto& params = info.first;

    EXPECT_EQ(params.model_id.value(), "meta-llama/Llama-3.2-11B-Vision-Instruct");
    EXPECT_EQ(params.tokenizer.value(), "meta-llama/tokenizer");
    EXPECT_EQ(params.instance_type.value(), "ml.g5.12xlarge");
    EXPECT_EQ(params.host, "127.0.0.1");
    EXPECT_EQ(params.port, 9000);
    EXPECT_EQ(params.served_model_names, (std::vector<std::string>{"llama", "vision"}));
    EXPECT_EQ(params.engine_url, "http://127.0.0.1:9100");
    EXPECT_EQ(params.engine_port, 9200);
    EXPECT_EQ(params.engine_startup_timeout_seconds, 60);
    EXPECT_EQ(params.http_threads, 16);
    EXPECT_NE(info.second.find("env:API_PORT=9000"), std::string::npos);
}

TEST(UtilsConfigTest, EmptyTokenizerIsIgnored) {
    EnvGuard guard(kDeploymentEnv);
    setenv("TOKENIZER", "", 1);
    EXPECT_FALSE(loadDeploymentParams().tokenizer.has_value());
}

TEST(UtilsConfigTest, NewLogLevelVariableTakesPriorityOverDeprecated) {
    EnvGuard guard(kDeploymentEnv);

    setenv("UVICORN_LOG_LEVEL", "debug", 1);
    EXPECT_EQ(loadDeploymentParams().log_level, "debug");

    setenv("HOSTGATE_LOG_LEVEL", "warn", 1);
    EXPECT_EQ(loadDeploymentParams().log_level, "warn");
}

TEST(UtilsConfigTest, MalformedNumbersAreConfigErrors) {
    EnvGuard guard(kDeploymentEnv);

    setenv("API_PORT", "abc", 1);
    EXPECT_THROW(loadDeploymentParams(), ConfigError);
    setenv("API_PORT", "80x", 1);
    EXPECT_THROW(loadDeploymentParams(), ConfigError);
    unsetenv("API_PORT");

    setenv("ENGINE_PORT", "70000", 1);
    EXPECT_THROW(loadDeploymentParams(), ConfigError);
    unsetenv("ENGINE_PORT");

    setenv("HOSTGATE_HTTP_THREADS", "5000", 1);
    EXPECT_THROW(loadDeploymentParams(), ConfigError);
    setenv("HOSTGATE_HTTP_THREADS", "0", 1);
    EXPECT_THROW(loadDeploymentParams(), ConfigError);
}

TEST(UtilsConfigTest, ResolveRequiresModelId) {
    DeploymentParams params;
    try {
        resolveEngineConfig(params);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_STREQ(e.what(), "MODEL_ID must be provided");
    }

    params.model_id = "   ";
    EXPECT_THROW(resolveEngineConfig(params), ConfigError);
}

TEST(UtilsConfigTest, ResolveAppliesFixedPolicy) {
    DeploymentParams params;
    params.model_id = "org/model";

    const auto cfg = resolveEngineConfig(params);
    EXPECT_EQ(cfg.model, "org/model");
    EXPECT_FALSE(cfg.tokenizer.has_value());
    EXPECT_EQ(cfg.tensor_parallel_size, 1);  // ml.g6.4xlarge
    EXPECT_TRUE(cfg.trust_remote_code);
    EXPECT_EQ(cfg.max_model_len, 4049);
    ASSERT_EQ(cfg.limit_mm_per_prompt.count("image"), 1u);
    EXPECT_EQ(cfg.limit_mm_per_prompt.at("image"), 2);
    EXPECT_EQ(cfg.host, "0.0.0.0");
    EXPECT_EQ(cfg.port, 8000);
}

TEST(UtilsConfigTest, ResolveUsesInstanceTypeTable) {
    DeploymentParams params;
    params.model_id = "org/model";
    params.instance_type = "ml.p4d.24xlarge";
    EXPECT_EQ(resolveEngineConfig(params).tensor_parallel_size, 8);

    params.instance_type = "ml.g6.12xlarge";
    EXPECT_EQ(resolveEngineConfig(params).tensor_parallel_size, 4);
}

TEST(UtilsConfigTest, ResolveRejectsUnsupportedInstanceType) {
    DeploymentParams params;
    params.model_id = "org/model";
    params.instance_type = "ml.t3.medium";
    try {
        resolveEngineConfig(params);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("ml.t3.medium"), std::string::npos);
    }

    // Set-but-empty is not the same as unset
    params.instance_type = "";
    EXPECT_THROW(resolveEngineConfig(params), ConfigError);
}

TEST(UtilsConfigTest, ResolveValidatesPortAndLogLevel) {
    DeploymentParams params;
    params.model_id = "org/model";

    params.port = 0;
    EXPECT_THROW(resolveEngineConfig(params), ConfigError);
    params.port = 8000;

    params.log_level = "chatty";
    EXPECT_THROW(resolveEngineConfig(params), ConfigError);

    params.log_level = "DEBUG";
    EXPECT_EQ(resolveEngineConfig(params).log_level, "debug");
}

TEST(UtilsConfigTest, ResolveIsDeterministic) {
    DeploymentParams params;
    params.model_id = "org/model";
    params.tokenizer = "org/tok";
    params.instance_type = "ml.g5.48xlarge";
    params.served_model_names = {"alias"};

    const auto a = resolveEngineConfig(params);
    const auto b = resolveEngineConfig(params);
    EXPECT_EQ(buildEngineArgs(a, "127.0.0.1", 8081), buildEngineArgs(b, "127.0.0.1", 8081));
}

TEST(UtilsConfigTest, BuildEngineArgsInOrder) {
    DeploymentParams params;
    params.model_id = "org/model";
    params.tokenizer = "org/tok";
    params.instance_type = "ml.g5.12xlarge";
    params.served_model_names = {"a", "b"};

    const auto args = buildEngineArgs(resolveEngineConfig(params), "127.0.0.1", 8081);
    const std::vector<std::string> expected = {
        "--model", "org/model",
        "--tokenizer", "org/tok",
        "--tensor-parallel-size", "4",
        "--host", "127.0.0.1",
        "--port", "8081",
        "--trust-remote-code",
        "--max-model-len", "4049",
        "--limit-mm-per-prompt", "image=2",
        "--served-model-name", "a", "b",
    };
    EXPECT_EQ(args, expected);
}

TEST(UtilsConfigTest, BuildEngineArgsOmitsOptionalFlags) {
    DeploymentParams params;
    params.model_id = "org/model";

    const auto args = buildEngineArgs(resolveEngineConfig(params), "127.0.0.1", 9000);
    for (const auto& a : args) {
        EXPECT_NE(a, "--tokenizer");
        EXPECT_NE(a, "--served-model-name");
    }
    EXPECT_EQ(args.front(), "--model");
}

TEST(UtilsConfigTest, SplitServedModelNames) {
    EXPECT_EQ(splitServedModelNames("a,b"), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(splitServedModelNames(" a , ,b ,"), (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(splitServedModelNames("").empty());
    EXPECT_TRUE(splitServedModelNames(" , ").empty());
}
