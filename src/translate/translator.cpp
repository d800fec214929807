#include "translator.hpp"

#include "api/response.hpp"
#include "credentials.hpp"
#include "language.hpp"

#include <cstddef>
#include <format>
#include <nlohmann/json.hpp>
#include <print>

Translator::Translator(Config config, TranslationBackend& backend, Transcoder& transcoder,
                       std::ostream& out, bool verbose)
    : config_(std::move(config)), backend_(backend),
      resolver_(transcoder, config_.transcoder.keep_converted, verbose),
      out_(out), verbose_(verbose) {}

size_t payload_audio_url_length(const std::string& body) {
    try {
        auto j = nlohmann::json::parse(body);
        if (auto it = j.find("audio_url"); it != j.end() && it->is_string()) {
            return it->get_ref<const std::string&>().size();
        }
    } catch (const nlohmann::json::exception&) {
        // Unparsable bodies report no audio_url.
    }
    return 0;
}

Result<TranslationRequest> Translator::prepare(const Options& opts) {
    auto audio_url = resolver_.resolve(opts.file);
    if (!audio_url) return std::unexpected(audio_url.error());

    auto language = parse_language(opts.language);
    if (!language) return std::unexpected(language.error());

    return TranslationRequest{
        .audio_url = std::move(*audio_url),
        .language = *language,
        .translate = opts.translate,
        .return_audio = opts.return_audio,
    };
}

Result<void> Translator::run(const Options& opts) {
    auto req = prepare(opts);
    if (!req) return std::unexpected(req.error());

    auto key = load_api_key(config_.key_path());
    if (!key) return std::unexpected(key.error());

    auto body = build_payload(*req, config_.api).dump();
    if (verbose_) {
        log(std::format("Request payload size: {} bytes", body.size()));
        log(std::format("Audio URL in JSON length: {} characters",
                        payload_audio_url_length(body)));
    }

    log("Sending request to API...");
    auto response = backend_.post(body, *key);
    if (!response) return std::unexpected(response.error());

    log(std::format("Response status: {}, length: {} characters",
                    response->status, response->body.size()));
    return report(response->body, req->return_audio);
}

Result<void> Translator::report(const std::string& body, bool return_audio) {
    auto resp = parse_response(body);
    if (!resp) return std::unexpected(resp.error());

    if (verbose_ && body.size() < 1000) {
        log("Raw response:\n" + resp->raw.dump(2));
    }

    if (!resp->error.empty()) {
        return make_error(ErrorCode::ApiError, resp->error);
    }

    if (resp->text) {
        std::println(out_, "{}", *resp->text);
    } else {
        std::println(stderr, "Warning: No text found in response");
    }

    if (return_audio && resp->audio) {
        std::println(out_, "");
        std::println(out_, "Audio: {}", *resp->audio);
    }

    if (!resp->text) {
        std::println(out_, "Response:");
        std::println(out_, "{}", resp->raw.dump(2));
    }
    return {};
}

void Translator::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[reka-translate] {}", msg);
    }
}
