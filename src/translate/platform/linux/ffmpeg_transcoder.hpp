#pragma once

#include "platform/transcoder.hpp"

#include <string>
#include <vector>

class FfmpegTranscoder : public Transcoder {
public:
    explicit FfmpegTranscoder(std::string program = "ffmpeg");

    Result<void> convert(const std::string& input, const std::string& output) override;

    // Argument vector passed to the program, without argv[0].
    static std::vector<std::string> build_args(const std::string& input,
                                               const std::string& output);

    // Diagnostic lines worth forwarding: Duration, Stream and error lines.
    static bool is_relevant_line(const std::string& line);

private:
    std::string program_;
};
