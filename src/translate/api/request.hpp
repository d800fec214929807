#pragma once

#include "config.hpp"
#include "language.hpp"

#include <nlohmann/json.hpp>
#include <string>

// Validated parameters of a single API call.
struct TranslationRequest {
    std::string audio_url;
    Language language = Language::English;
    bool translate = false;
    bool return_audio = false;
};

nlohmann::json build_payload(const TranslationRequest& req, const Config::Api& api);
