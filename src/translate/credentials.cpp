#include "credentials.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>
#include <iterator>
#include <print>
#include <system_error>

namespace fs = std::filesystem;

bool has_secure_permissions(fs::perms p) {
    auto mode = p & fs::perms::mask;
    return mode == (fs::perms::owner_read | fs::perms::owner_write) ||
           mode == fs::perms::owner_read;
}

Result<std::string> load_api_key(const std::string& path, std::FILE* warn) {
    std::error_code ec;
    if (path.empty()) {
        return make_error(ErrorCode::ConfigError,
                          "API key file not found: could not determine the config directory\n"
                          "Set HOME or XDG_CONFIG_HOME, or api.key_file in config.json");
    }
    if (!fs::is_regular_file(path, ec)) {
        auto dir = fs::path(path).parent_path().string();
        return make_error(ErrorCode::ConfigError, std::format(
            "API key file not found at {0}\n"
            "Please create the file and add your Reka API key\n"
            "\n"
            "You can do this by running:\n"
            "  mkdir -p {1}\n"
            "  echo 'your-api-key-here' > {0}\n"
            "  chmod 600 {0}",
            path, dir.empty() ? "." : dir));
    }

    auto st = fs::status(path, ec);
    if (!ec && !has_secure_permissions(st.permissions())) {
        std::println(warn, "Warning: API key file has insecure permissions ({:o})",
                     static_cast<unsigned>(st.permissions() & fs::perms::mask));
        std::println(warn, "Consider running: chmod 600 {}", path);
        std::println(warn, "");
    }

    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return make_error(ErrorCode::ConfigError, "Could not read API key file " + path);
    }

    std::string key(std::istreambuf_iterator<char>(f), {});
    std::erase_if(key, [](unsigned char c) { return std::isspace(c); });

    if (key.empty()) {
        return make_error(ErrorCode::ConfigError,
                          "API key file is empty\nPlease add your Reka API key to " + path);
    }
    return key;
}
