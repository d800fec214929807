#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::string Config::key_path() const {
    if (!api.key_file.empty()) return platform::expand_home(api.key_file);

    auto dir = platform::config_dir();
    if (dir.empty()) return {};
    return (fs::path(dir) / "api_key").string();
}

namespace {

// Negative or out-of-range values keep the default. Non-numbers throw.
void read_u32(const json& obj, const char* key, uint32_t& out) {
    if (!obj.contains(key)) return;
    auto v = obj.at(key).get<int64_t>();
    if (v < 0 || v > static_cast<int64_t>(UINT32_MAX)) {
        std::println(stderr, "config: {} out of range ({}), using {}", key, v, out);
        return;
    }
    out = static_cast<uint32_t>(v);
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("api")) {
            auto& a = j["api"];
            if (a.contains("endpoint")) cfg.api.endpoint = a["endpoint"].get<std::string>();
            if (a.contains("key_file")) cfg.api.key_file = a["key_file"].get<std::string>();
            read_u32(a, "sampling_rate", cfg.api.sampling_rate);
            if (a.contains("temperature")) cfg.api.temperature = a["temperature"].get<double>();
            read_u32(a, "max_tokens", cfg.api.max_tokens);
        }

        if (j.contains("transcoder")) {
            auto& t = j["transcoder"];
            if (t.contains("program")) cfg.transcoder.program = t["program"].get<std::string>();
            if (t.contains("keep_converted")) cfg.transcoder.keep_converted = t["keep_converted"].get<bool>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
