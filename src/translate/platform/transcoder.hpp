#pragma once

#include "error.hpp"

#include <string>

// Converts an audio file to mono 16 kHz signed 16-bit PCM WAV.
class Transcoder {
public:
    virtual ~Transcoder() = default;
    virtual Result<void> convert(const std::string& input, const std::string& output) = 0;
};
