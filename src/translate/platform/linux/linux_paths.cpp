#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <string_view>
#include <sys/stat.h>
#include <unistd.h>

namespace platform {

namespace {

bool is_executable_file(const std::string& path) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) return false;
    return S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

} // namespace

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/reka";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/reka";
}

std::string expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path;

    const char* home = std::getenv("HOME");
    if (!home) return path;
    return std::string(home) + path.substr(1);
}

std::string find_executable(const std::string& program) {
    if (program.empty()) return {};
    if (program.find('/') != std::string::npos) {
        return is_executable_file(program) ? program : std::string{};
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) return {};

    std::string_view dirs(path_env);
    while (true) {
        auto sep = dirs.find(':');
        auto dir = dirs.substr(0, sep);
        // An empty PATH entry means the current directory.
        std::string candidate = dir.empty() ? program : std::string(dir) + "/" + program;
        if (is_executable_file(candidate)) return candidate;
        if (sep == std::string_view::npos) break;
        dirs.remove_prefix(sep + 1);
    }
    return {};
}

} // namespace platform
