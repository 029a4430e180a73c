#pragma once

#include <atomic>
#include <cstdint>

namespace hostgate {

extern std::atomic<bool> g_running_flag;
extern std::atomic<unsigned int> g_inflight_requests;
extern std::atomic<uint64_t> g_total_requests;

inline bool is_running() { return g_running_flag.load(); }
/// Set once at process start, before signal handlers are installed, so an
/// early SIGTERM is never overwritten.
inline void mark_running() { g_running_flag.store(true); }
inline void request_shutdown() { g_running_flag.store(false); }

inline unsigned int inflight_request_count() { return g_inflight_requests.load(); }
inline uint64_t total_request_count() { return g_total_requests.load(); }

/// Counts one invocation from dispatch until its response has been fully
/// written (for streams, until the chunk provider is released).
class InflightGuard {
public:
    InflightGuard() {
        g_inflight_requests.fetch_add(1);
        g_total_requests.fetch_add(1);
    }
    InflightGuard(const InflightGuard&) = delete;
    InflightGuard& operator=(const InflightGuard&) = delete;

    ~InflightGuard() { g_inflight_requests.fetch_sub(1); }
};

}  // namespace hostgate
