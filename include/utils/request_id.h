// request_id.h - X-Request-Id helpers
#pragma once

#include <string>

namespace hostgate {

constexpr size_t kMaxRequestIdLength = 128;

// Random 16-hex-character request id.
std::string generate_request_id();

// Caller-supplied id if it is safe to echo back in a header and a log line
// (non-empty, at most kMaxRequestIdLength visible ASCII characters),
// otherwise a freshly generated one.
std::string resolve_request_id(const std::string& incoming);

}  // namespace hostgate
