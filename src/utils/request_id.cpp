#include "utils/request_id.h"

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace hostgate {

std::string generate_request_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    uint64_t v = rng();
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << v;
    return oss.str();
}

std::string resolve_request_id(const std::string& incoming) {
    if (incoming.empty() || incoming.size() > kMaxRequestIdLength) {
        return generate_request_id();
    }
    const bool printable = std::all_of(incoming.begin(), incoming.end(), [](char c) {
        return c > 0x20 && c < 0x7f;
    });
    return printable ? incoming : generate_request_id();
}

}  // namespace hostgate
