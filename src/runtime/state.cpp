#include "runtime/state.h"

namespace hostgate {

std::atomic<bool> g_running_flag{false};
std::atomic<unsigned int> g_inflight_requests{0};
std::atomic<uint64_t> g_total_requests{0};

}  // namespace hostgate
