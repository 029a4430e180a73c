#include "api/request_schema.h"

#include <array>
#include <limits>
#include <optional>

namespace hostgate {

using json = nlohmann::json;

namespace {

constexpr std::array<const char*, 6> kKnownRoles = {
    "system", "user", "assistant", "tool", "developer", "function"};

bool hasStringField(const json& obj, const char* key, const char* expected) {
    auto it = obj.find(key);
    return it != obj.end() && it->is_string() && it->get_ref<const std::string&>() == expected;
}

bool isKnownRole(const std::string& role) {
    for (const auto* r : kKnownRoles) {
        if (role == r) return true;
    }
    return false;
}

// Optional fields sent as JSON null are treated as absent.
bool present(const json& body, const char* key) {
    auto it = body.find(key);
    return it != body.end() && !it->is_null();
}

bool fitsInt(const json& v) {
    if (v.is_number_unsigned()) {
        return v.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max());
    }
    const auto n = v.get<int64_t>();
    return n >= std::numeric_limits<int>::min() && n <= std::numeric_limits<int>::max();
}

bool parseNumber(const json& body, const char* key, std::optional<double>& out, std::string& error) {
    if (!present(body, key)) return true;
    const auto& v = body[key];
    if (!v.is_number()) {
        error = std::string(key) + " must be a number";
        return false;
    }
    out = v.get<double>();
    return true;
}

bool parseInt(const json& body, const char* key, std::optional<int>& out, std::string& error) {
    if (!present(body, key)) return true;
    const auto& v = body[key];
    if (!v.is_number_integer() || !fitsInt(v)) {
        error = std::string(key) + " must be an integer";
        return false;
    }
    out = v.get<int>();
    return true;
}

bool parseMessageContent(const ChatMessage& msg, size_t index, std::string& error) {
    const auto& content = msg.content;
    if (content.is_string()) return true;
    if (content.is_null()) {
        if (msg.role == "assistant") return true;
        error = "messages[" + std::to_string(index) + "].content must not be null for role " + msg.role;
        return false;
    }
    if (content.is_array()) {
        for (size_t i = 0; i < content.size(); ++i) {
            const auto& part = content[i];
            if (!part.is_object() || !part.contains("type") || !part["type"].is_string()) {
                error = "messages[" + std::to_string(index) + "].content[" + std::to_string(i) +
                        "] must be an object with a string type";
                return false;
            }
        }
        return true;
    }
    error = "messages[" + std::to_string(index) + "].content must be a string, array, or null";
    return false;
}

bool parseMessages(const json& body, std::vector<ChatMessage>& out, std::string& error) {
    if (!body.contains("messages")) {
        error = "messages is required";
        return false;
    }
    const auto& messages = body["messages"];
    if (!messages.is_array()) {
        error = "messages must be an array";
        return false;
    }
    if (messages.empty()) {
        error = "messages must not be empty";
        return false;
    }

    for (size_t i = 0; i < messages.size(); ++i) {
        const auto& m = messages[i];
        if (!m.is_object()) {
            error = "messages[" + std::to_string(i) + "] must be an object";
            return false;
        }
        if (!m.contains("role") || !m["role"].is_string()) {
            error = "messages[" + std::to_string(i) + "].role must be a string";
            return false;
        }
        ChatMessage msg;
        msg.role = m["role"].get<std::string>();
        if (!isKnownRole(msg.role)) {
            error = "messages[" + std::to_string(i) + "].role '" + msg.role + "' is not supported";
            return false;
        }
        msg.content = m.contains("content") ? m["content"] : json(nullptr);
        if (!parseMessageContent(msg, i, error)) {
            return false;
        }
        out.push_back(std::move(msg));
    }
    return true;
}

bool parseStop(const json& body, std::vector<std::string>& out, std::string& error) {
    if (!present(body, "stop")) return true;
    const auto& stop = body["stop"];
    if (stop.is_string()) {
        out.push_back(stop.get<std::string>());
        return true;
    }
    if (stop.is_array()) {
        for (const auto& item : stop) {
            if (!item.is_string()) {
                error = "stop must be a string or array of strings";
                return false;
            }
            out.push_back(item.get<std::string>());
        }
        return true;
    }
    error = "stop must be a string or array of strings";
    return false;
}

// Value ranges of sampling fields belong to the engine, which answers them
// with its own error body.
bool parseSampling(const json& body, SamplingParams& out, std::string& error) {
    if (!parseNumber(body, "temperature", out.temperature, error)) return false;
    if (!parseNumber(body, "top_p", out.top_p, error)) return false;
    if (!parseNumber(body, "presence_penalty", out.presence_penalty, error)) return false;
    if (!parseNumber(body, "frequency_penalty", out.frequency_penalty, error)) return false;

    if (!parseInt(body, "top_k", out.top_k, error)) return false;
    if (!parseInt(body, "n", out.n, error)) return false;
    if (!parseInt(body, "max_tokens", out.max_tokens, error)) return false;

    std::optional<int> max_completion_tokens;
    if (!parseInt(body, "max_completion_tokens", max_completion_tokens, error)) return false;
    if (!out.max_tokens && max_completion_tokens) {
        out.max_tokens = max_completion_tokens;
    }

    if (present(body, "seed")) {
        if (!body["seed"].is_number_integer()) {
            error = "seed must be an integer";
            return false;
        }
        out.seed = body["seed"].is_number_unsigned()
                       ? static_cast<int64_t>(body["seed"].get<uint64_t>())
                       : body["seed"].get<int64_t>();
    }

    if (!parseStop(body, out.stop, error)) return false;

    if (present(body, "logprobs")) {
        if (!body["logprobs"].is_boolean()) {
            error = "logprobs must be a boolean";
            return false;
        }
        out.logprobs = body["logprobs"].get<bool>();
    }
    if (!parseInt(body, "top_logprobs", out.top_logprobs, error)) return false;
    if (out.top_logprobs && (*out.top_logprobs < 0 || *out.top_logprobs > kMaxTopLogprobs)) {
        error = "top_logprobs must be between 0 and " + std::to_string(kMaxTopLogprobs);
        return false;
    }
    return true;
}

bool parseTools(const json& body, std::vector<ToolDefinition>& out, std::string& error) {
    if (!present(body, "tools")) return true;
    const auto& tools = body["tools"];
    if (!tools.is_array()) {
        error = "tools must be an array";
        return false;
    }
    for (size_t i = 0; i < tools.size(); ++i) {
        const auto& tool = tools[i];
        const std::string where = "tools[" + std::to_string(i) + "]";
        if (!tool.is_object()) {
            error = where + " must be an object";
            return false;
        }
        if (!hasStringField(tool, "type", "function")) {
            error = where + ".type must be \"function\"";
            return false;
        }
        if (!tool.contains("function") || !tool["function"].is_object()) {
            error = where + ".function must be an object";
            return false;
        }
        const auto& fn = tool["function"];
        if (!fn.contains("name") || !fn["name"].is_string() || fn["name"].get<std::string>().empty()) {
            error = where + ".function.name must be a non-empty string";
            return false;
        }
        ToolDefinition def;
        def.name = fn["name"].get<std::string>();
        if (fn.contains("description") && fn["description"].is_string()) {
            def.description = fn["description"].get<std::string>();
        }
        if (fn.contains("parameters")) {
            def.parameters = fn["parameters"];
        }
        out.push_back(std::move(def));
    }
    return true;
}

bool parseToolChoice(const json& body, ToolChoice& out, std::string& error) {
    if (!present(body, "tool_choice")) return true;
    const auto& choice = body["tool_choice"];
    if (choice.is_string()) {
        const auto mode = choice.get<std::string>();
        if (mode == "none") {
            out.mode = ToolChoice::Mode::None;
        } else if (mode == "auto") {
            out.mode = ToolChoice::Mode::Auto;
        } else if (mode == "required") {
            out.mode = ToolChoice::Mode::Required;
        } else {
            error = "tool_choice must be \"none\", \"auto\", \"required\", or a function object";
            return false;
        }
        return true;
    }
    if (choice.is_object()) {
        if (!hasStringField(choice, "type", "function") ||
            !choice.contains("function") || !choice["function"].is_object() ||
            !choice["function"].contains("name") || !choice["function"]["name"].is_string()) {
            error = "tool_choice object must be {\"type\": \"function\", \"function\": {\"name\": ...}}";
            return false;
        }
        out.mode = ToolChoice::Mode::Named;
        out.function_name = choice["function"]["name"].get<std::string>();
        return true;
    }
    error = "tool_choice must be a string or object";
    return false;
}

}  // namespace

bool parseChatCompletionRequest(const json& body, ChatCompletionRequest& out, std::string& error) {
    if (!body.is_object()) {
        error = "request body must be a JSON object";
        return false;
    }

    ChatCompletionRequest req;

    if (present(body, "model")) {
        if (!body["model"].is_string()) {
            error = "model must be a string";
            return false;
        }
        req.model = body["model"].get<std::string>();
    }

    if (!parseMessages(body, req.messages, error)) return false;

    if (present(body, "stream")) {
        if (!body["stream"].is_boolean()) {
            error = "stream must be a boolean";
            return false;
        }
        req.stream = body["stream"].get<bool>();
    }
    if (present(body, "stream_options")) {
        if (!req.stream) {
            error = "stream_options is only allowed when stream is true";
            return false;
        }
        if (!body["stream_options"].is_object()) {
            error = "stream_options must be an object";
            return false;
        }
    }

    if (!parseSampling(body, req.sampling, error)) return false;
    if (!parseTools(body, req.tools, error)) return false;
    if (!parseToolChoice(body, req.tool_choice, error)) return false;

    if (req.tool_choice.mode == ToolChoice::Mode::Named) {
        bool found = false;
        for (const auto& t : req.tools) {
            if (t.name == req.tool_choice.function_name) {
                found = true;
                break;
            }
        }
        if (req.tools.empty()) {
            error = "tool_choice names a function but no tools were provided";
            return false;
        }
        if (!found) {
            error = "tool_choice function '" + req.tool_choice.function_name + "' is not in tools";
            return false;
        }
    }
    if (req.tool_choice.mode == ToolChoice::Mode::Required && req.tools.empty()) {
        error = "tool_choice \"required\" needs at least one tool";
        return false;
    }

    req.payload = body;
    out = std::move(req);
    return true;
}

bool parseChatCompletionRequest(const std::string& body, ChatCompletionRequest& out, std::string& error) {
    json parsed;
    try {
        parsed = json::parse(body);
    } catch (const json::parse_error& e) {
        error = e.what();
        return false;
    }
    return parseChatCompletionRequest(parsed, out, error);
}

}  // namespace hostgate
