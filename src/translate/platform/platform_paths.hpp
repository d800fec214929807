#pragma once

#include <string>

namespace platform {

// Directory holding config.json and api_key, empty if it cannot be determined.
std::string config_dir();

// Replaces a leading "~" or "~/" with $HOME. Other paths are returned as-is.
std::string expand_home(const std::string& path);

// Resolves a program name against $PATH. Names containing '/' are checked
// directly. Returns an empty string if no executable is found.
std::string find_executable(const std::string& program);

} // namespace platform
