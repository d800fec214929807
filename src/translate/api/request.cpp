#include "request.hpp"

using json = nlohmann::json;

nlohmann::json build_payload(const TranslationRequest& req, const Config::Api& api) {
    return json{
        {"audio_url", req.audio_url},
        {"sampling_rate", api.sampling_rate},
        {"temperature", api.temperature},
        {"max_tokens", api.max_tokens},
        {"target_language", std::string(to_string(req.language))},
        {"is_translate", req.translate},
        {"return_translation_audio", req.return_audio},
    };
}
