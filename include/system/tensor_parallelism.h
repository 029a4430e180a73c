#pragma once

#include <map>
#include <string>

namespace hostgate {

// Instance type assumed when the hosting platform does not declare one.
constexpr const char* kDefaultInstanceType = "ml.g6.4xlarge";

// Fixed instance type -> tensor parallel degree (GPUs per instance).
const std::map<std::string, int>& instanceTypeGpuTable();

// Tensor parallel degree for an instance type.
// Throws ConfigError when the type is not an exact key of the table.
int tensorParallelSizeForInstance(const std::string& instance_type);

bool isSupportedInstanceType(const std::string& instance_type);

}  // namespace hostgate
