#include "audio/input_resolver.hpp"

#include "audio/data_uri.hpp"
#include "platform/platform_paths.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <print>
#include <vector>

namespace fs = std::filesystem;

namespace {

std::string lowercase_extension(const fs::path& p) {
    auto ext = p.extension().string();
    if (!ext.empty() && ext[0] == '.') ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

// Removes the converted file when the resolver is done with it.
class ScopedFile {
public:
    explicit ScopedFile(std::string path) : path_(std::move(path)) {}
    ~ScopedFile() {
        if (!path_.empty()) {
            std::error_code ec;
            fs::remove(path_, ec);
        }
    }

    ScopedFile(const ScopedFile&) = delete;
    ScopedFile& operator=(const ScopedFile&) = delete;

    void release() { path_.clear(); }

private:
    std::string path_;
};

} // namespace

bool is_remote_url(const std::string& source) {
    return source.starts_with("http://") || source.starts_with("https://");
}

bool is_data_uri(const std::string& source) {
    return source.starts_with("data:");
}

std::string converted_path_for(const std::string& path) {
    fs::path p(path);
    return (p.parent_path() / (p.stem().string() + "_tmp.wav")).string();
}

InputResolver::InputResolver(Transcoder& transcoder, bool keep_converted, bool verbose)
    : transcoder_(transcoder), keep_converted_(keep_converted), verbose_(verbose) {}

Result<std::string> InputResolver::resolve(const std::string& source) {
    if (is_remote_url(source) || is_data_uri(source)) {
        return source;
    }

    auto path = platform::expand_home(source);

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return make_error(ErrorCode::NotFound, "Audio file not found: " + path);
    }

    auto ext = lowercase_extension(path);
    if (ext == "wav") {
        return encode_file(path);
    }

    log(std::format("File is not WAV format ({}), converting...",
                    ext.empty() ? "no extension" : ext));

    auto wav_path = converted_path_for(path);
    // A file already at wav_path belongs to the user and is never removed.
    bool preexisting = fs::exists(wav_path, ec);
    ScopedFile guard(wav_path);
    if (keep_converted_ || preexisting) guard.release();

    auto converted = transcoder_.convert(path, wav_path);
    if (!converted) {
        return std::unexpected(converted.error());
    }
    log("Conversion complete: " + wav_path);

    return encode_file(wav_path);
}

Result<std::string> InputResolver::encode_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return make_error(ErrorCode::NotFound, "Could not open audio file: " + path);
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)),
                               std::istreambuf_iterator<char>());
    if (f.bad()) {
        return make_error(ErrorCode::NotFound, "Could not read audio file: " + path);
    }
    log(std::format("File size: {} bytes", bytes.size()));

    auto mime = datauri::mime_type_for(lowercase_extension(path));
    auto uri = datauri::encode(bytes, mime);

    log(std::format("Base64 length: {} characters", uri.size() - uri.find(',') - 1));
    log(std::format("Data URI length: {} characters", uri.size()));
    return uri;
}

void InputResolver::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[reka-translate] {}", msg);
    }
}
