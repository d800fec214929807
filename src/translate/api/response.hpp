#pragma once

#include "error.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

struct ApiResponse {
    // Non-empty if the API reported a failure.
    std::string error;
    // First of transcript, results[0].text, text.
    std::optional<std::string> text;
    // First of results[0].audio_url, audio_url, audio_data.
    std::optional<std::string> audio;
    nlohmann::json raw;
};

// Fails with ApiError if the body is not JSON.
Result<ApiResponse> parse_response(const std::string& body);
