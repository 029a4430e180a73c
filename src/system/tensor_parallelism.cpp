#include "system/tensor_parallelism.h"

#include "utils/config.h"

namespace hostgate {

const std::map<std::string, int>& instanceTypeGpuTable() {
    static const std::map<std::string, int> kTable = {
        {"ml.g5.4xlarge", 1},
        {"ml.g6.4xlarge", 1},
        {"ml.g5.12xlarge", 4},
        {"ml.g6.12xlarge", 4},
        {"ml.g5.48xlarge", 8},
        {"ml.g6.48xlarge", 8},
        {"ml.p4d.24xlarge", 8},
        {"ml.p4de.24xlarge", 8},
        {"ml.p5.48xlarge", 8},
    };
    return kTable;
}

bool isSupportedInstanceType(const std::string& instance_type) {
    const auto& table = instanceTypeGpuTable();
    return table.find(instance_type) != table.end();
}

int tensorParallelSizeForInstance(const std::string& instance_type) {
    const auto& table = instanceTypeGpuTable();
    auto it = table.find(instance_type);
    if (it == table.end()) {
        // 未知のインスタンスタイプは既定値に丸めない
        throw ConfigError("Instance type " + instance_type + " not found in the dictionary");
    }
    return it->second;
}

}  // namespace hostgate
