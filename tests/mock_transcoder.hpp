#pragma once

#include "platform/transcoder.hpp"

#include <fstream>
#include <string>
#include <vector>

// Writes a fixed payload to the output path instead of running ffmpeg.
class MockTranscoder : public Transcoder {
public:
    Result<void> convert(const std::string& input, const std::string& output) override {
        calls.push_back({input, output});
        if (fail) {
            return make_error(ErrorCode::ConversionError, "mock conversion failed");
        }
        std::ofstream(output, std::ios::binary) << payload;
        return {};
    }

    struct Call {
        std::string input;
        std::string output;
    };
    std::vector<Call> calls;
    std::string payload = "RIFFconverted";
    bool fail = false;
};
