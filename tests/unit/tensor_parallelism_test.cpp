#include <gtest/gtest.h>

#include "system/tensor_parallelism.h"
#include "utils/config.h"

namespace {

using hostgate::ConfigError;
using hostgate::instanceTypeGpuTable;
using hostgate::isSupportedInstanceType;
using hostgate::kDefaultInstanceType;
using hostgate::tensorParallelSizeForInstance;

TEST(TensorParallelismTest, MapsEveryTableEntry) {
    EXPECT_EQ(tensorParallelSizeForInstance("ml.g5.4xlarge"), 1);
    EXPECT_EQ(tensorParallelSizeForInstance("ml.g6.4xlarge"), 1);
    EXPECT_EQ(tensorParallelSizeForInstance("ml.g5.12xlarge"), 4);
    EXPECT_EQ(tensorParallelSizeForInstance("ml.g6.12xlarge"), 4);
    EXPECT_EQ(tensorParallelSizeForInstance("ml.g5.48xlarge"), 8);
    EXPECT_EQ(tensorParallelSizeForInstance("ml.g6.48xlarge"), 8);
    EXPECT_EQ(tensorParallelSizeForInstance("ml.p4d.24xlarge"), 8);
    EXPECT_EQ(tensorParallelSizeForInstance("ml.p4de.24xlarge"), 8);
    EXPECT_EQ(tensorParallelSizeForInstance("ml.p5.48xlarge"), 8);
    EXPECT_EQ(instanceTypeGpuTable().size(), 9u);
}

TEST(TensorParallelismTest, DefaultInstanceTypeIsSupported) {
    EXPECT_TRUE(isSupportedInstanceType(kDefaultInstanceType));
    EXPECT_EQ(tensorParallelSizeForInstance(kDefaultInstanceType), 1);
}

TEST(TensorParallelismTest, EveryDegreeIsPositive) {
    for (const auto& [type, degree] : instanceTypeGpuTable()) {
        EXPECT_GT(degree, 0) << type;
    }
}

TEST(TensorParallelismTest, UnknownTypeThrowsNamingTheValue) {
    try {
        tensorParallelSizeForInstance("ml.g7.2xlarge");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("ml.g7.2xlarge"), std::string::npos);
    }
}

// 大文字小文字や前後の空白は補正しない (完全一致のみ)
TEST(TensorParallelismTest, LookupIsExactMatch) {
    EXPECT_FALSE(isSupportedInstanceType("ML.G5.4XLARGE"));
    EXPECT_FALSE(isSupportedInstanceType(" ml.g5.4xlarge"));
    EXPECT_FALSE(isSupportedInstanceType("g5.4xlarge"));
    EXPECT_FALSE(isSupportedInstanceType(""));
    EXPECT_THROW(tensorParallelSizeForInstance(""), ConfigError);
}

}  // namespace
