#pragma once

#include <cstdint>
#include <string>

struct Config {
    struct Api {
        std::string endpoint = "https://api.reka.ai/v1/transcription_or_translation";
        // Empty means <config_dir>/api_key.
        std::string key_file;
        uint32_t sampling_rate = 16000;
        double temperature = 0.0;
        uint32_t max_tokens = 1024;
    } api;

    struct Transcoder {
        std::string program = "ffmpeg";
        bool keep_converted = false;
    } transcoder;

    // Resolved path of the API key file, with "~" expanded.
    std::string key_path() const;

    static Config load(const std::string& path);
    static Config load_default();
};
