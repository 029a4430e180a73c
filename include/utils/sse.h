// sse.h - server-sent events framing helpers
#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace hostgate::sse {

/// Re-frames an arbitrarily chunked SSE byte stream into whole events.
/// Each returned event keeps its terminating blank line.
class EventSplitter {
public:
    std::vector<std::string> feed(const char* data, size_t len);

    /// Trailing bytes that never got a terminator (empty if none).
    std::string flush();

private:
    std::string buffer_;
};

/// "data: <json>\n\n"
std::string formatData(const nlohmann::json& payload);

/// Stream terminator used by OpenAI-compatible servers.
std::string doneEvent();

bool isEventStream(const std::string& content_type);

}  // namespace hostgate::sse
