#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// Base64 (RFC 4648, padded, no line breaks) and data: URI helpers.
namespace datauri {

inline constexpr std::string_view kAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

inline std::string base64_encode(std::span<const uint8_t> data) {
    std::string out;
    out.reserve((data.size() + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 3 <= data.size(); i += 3) {
        uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | data[i + 2];
        out += kAlphabet[(n >> 18) & 0x3f];
        out += kAlphabet[(n >> 12) & 0x3f];
        out += kAlphabet[(n >> 6) & 0x3f];
        out += kAlphabet[n & 0x3f];
    }

    size_t rest = data.size() - i;
    if (rest == 1) {
        uint32_t n = uint32_t(data[i]) << 16;
        out += kAlphabet[(n >> 18) & 0x3f];
        out += kAlphabet[(n >> 12) & 0x3f];
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8);
        out += kAlphabet[(n >> 18) & 0x3f];
        out += kAlphabet[(n >> 12) & 0x3f];
        out += kAlphabet[(n >> 6) & 0x3f];
        out += '=';
    }
    return out;
}

// Returns nullopt on characters outside the alphabet, bad length or
// misplaced padding.
inline std::optional<std::vector<uint8_t>> base64_decode(std::string_view in) {
    if (in.size() % 4 != 0) return std::nullopt;

    std::array<int8_t, 256> table{};
    table.fill(-1);
    for (size_t i = 0; i < kAlphabet.size(); ++i) {
        table[static_cast<uint8_t>(kAlphabet[i])] = static_cast<int8_t>(i);
    }

    size_t padding = 0;
    if (!in.empty() && in.back() == '=') padding++;
    if (in.size() > 1 && in[in.size() - 2] == '=') padding++;

    std::vector<uint8_t> out;
    out.reserve(in.size() / 4 * 3);

    for (size_t i = 0; i < in.size(); i += 4) {
        bool last = i + 4 == in.size();
        uint32_t n = 0;
        for (size_t k = 0; k < 4; ++k) {
            char c = in[i + k];
            if (c == '=') {
                // Padding only in the final quantum's trailing positions.
                if (!last || k < 4 - padding) return std::nullopt;
                n <<= 6;
                continue;
            }
            int8_t v = table[static_cast<uint8_t>(c)];
            if (v < 0) return std::nullopt;
            n = (n << 6) | static_cast<uint32_t>(v);
        }
        out.push_back(static_cast<uint8_t>(n >> 16));
        if (!last || padding < 2) out.push_back(static_cast<uint8_t>(n >> 8));
        if (!last || padding < 1) out.push_back(static_cast<uint8_t>(n));
    }
    return out;
}

// MIME type by file extension (without the dot, any case).
inline std::string mime_type_for(std::string_view extension) {
    std::string ext(extension);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == "mp3") return "audio/mpeg";
    if (ext == "wav") return "audio/wav";
    if (ext == "ogg") return "audio/ogg";
    if (ext == "flac") return "audio/flac";
    if (ext == "m4a") return "audio/mp4";
    return "application/octet-stream";
}

inline std::string encode(std::span<const uint8_t> data, std::string_view mime) {
    std::string out = "data:";
    out += mime;
    out += ";base64,";
    out += base64_encode(data);
    return out;
}

struct Decoded {
    std::string mime;
    std::vector<uint8_t> bytes;
};

inline std::expected<Decoded, std::string> decode(std::string_view uri) {
    constexpr std::string_view prefix = "data:";
    constexpr std::string_view marker = ";base64,";

    if (!uri.starts_with(prefix)) {
        return std::unexpected("not a data URI");
    }
    auto pos = uri.find(marker);
    if (pos == std::string_view::npos) {
        return std::unexpected("data URI is not base64-encoded");
    }

    auto bytes = base64_decode(uri.substr(pos + marker.size()));
    if (!bytes) {
        return std::unexpected("data URI has an invalid base64 payload");
    }
    return Decoded{
        .mime = std::string(uri.substr(prefix.size(), pos - prefix.size())),
        .bytes = std::move(*bytes),
    };
}

} // namespace datauri
