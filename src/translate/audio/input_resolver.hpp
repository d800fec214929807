#pragma once

#include "error.hpp"
#include "platform/transcoder.hpp"

#include <string>

bool is_remote_url(const std::string& source);
bool is_data_uri(const std::string& source);

// Path of the converted WAV for a non-WAV input: <dir>/<stem>_tmp.wav.
std::string converted_path_for(const std::string& path);

// Turns the --file argument into the value sent as audio_url. URLs and data
// URIs pass through unchanged; local files are converted to WAV if needed
// and embedded as a base64 data URI.
class InputResolver {
public:
    InputResolver(Transcoder& transcoder, bool keep_converted = false, bool verbose = false);

    Result<std::string> resolve(const std::string& source);

private:
    Result<std::string> encode_file(const std::string& path);
    void log(const std::string& msg);

    Transcoder& transcoder_;
    bool keep_converted_;
    bool verbose_;
};
