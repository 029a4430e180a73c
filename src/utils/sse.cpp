#include "utils/sse.h"

#include <algorithm>
#include <cctype>

namespace hostgate::sse {

namespace {

// Position just past the first event terminator, or npos.
size_t findEventEnd(const std::string& buffer) {
    const size_t lf = buffer.find("\n\n");
    const size_t crlf = buffer.find("\r\n\r\n");
    if (lf == std::string::npos && crlf == std::string::npos) {
        return std::string::npos;
    }
    if (crlf == std::string::npos || (lf != std::string::npos && lf < crlf)) {
        return lf + 2;
    }
    return crlf + 4;
}

}  // namespace

std::vector<std::string> EventSplitter::feed(const char* data, size_t len) {
    std::vector<std::string> events;
    buffer_.append(data, len);
    size_t end;
    while ((end = findEventEnd(buffer_)) != std::string::npos) {
        events.push_back(buffer_.substr(0, end));
        buffer_.erase(0, end);
    }
    return events;
}

std::string EventSplitter::flush() {
    std::string rest;
    rest.swap(buffer_);
    return rest;
}

std::string formatData(const nlohmann::json& payload) {
    return "data: " + payload.dump() + "\n\n";
}

std::string doneEvent() {
    return "data: [DONE]\n\n";
}

bool isEventStream(const std::string& content_type) {
    std::string lower = content_type;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.rfind("text/event-stream", 0) == 0;
}

}  // namespace hostgate::sse
