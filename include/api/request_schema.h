#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "core/engine_types.h"

namespace hostgate {

constexpr int kMaxTopLogprobs = 20;

/// Decode and validate an untrusted chat completion body.
/// On failure returns false and leaves a human readable reason in error;
/// out is only written on success.
bool parseChatCompletionRequest(const std::string& body,
                                ChatCompletionRequest& out,
                                std::string& error);

bool parseChatCompletionRequest(const nlohmann::json& body,
                                ChatCompletionRequest& out,
                                std::string& error);

}  // namespace hostgate
