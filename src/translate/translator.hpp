#pragma once

#include "api/backend.hpp"
#include "api/request.hpp"
#include "audio/input_resolver.hpp"
#include "config.hpp"
#include "error.hpp"
#include "options.hpp"
#include "platform/transcoder.hpp"

#include <cstddef>
#include <ostream>
#include <string>

// Length of the audio_url string read back from a serialized payload, 0 if
// the body has none.
size_t payload_audio_url_length(const std::string& body);

// Runs one request end to end: resolve the audio source, validate the
// language, load the API key, POST the payload and print the result to out.
// Nothing touches the network before the input and language are valid.
class Translator {
public:
    Translator(Config config, TranslationBackend& backend, Transcoder& transcoder,
               std::ostream& out, bool verbose = false);

    Translator(const Translator&) = delete;
    Translator& operator=(const Translator&) = delete;

    Result<void> run(const Options& opts);

    // Validates the CLI options into a request; audio_url is resolved.
    Result<TranslationRequest> prepare(const Options& opts);

private:
    Result<void> report(const std::string& body, bool return_audio);
    void log(const std::string& msg);

    Config config_;
    TranslationBackend& backend_;
    InputResolver resolver_;
    std::ostream& out_;
    bool verbose_;
};
