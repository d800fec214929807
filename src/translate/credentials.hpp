#pragma once

#include "error.hpp"

#include <cstdio>
#include <filesystem>
#include <string>

// True if only the owner may read (and optionally write) the file: 0600 or 0400.
bool has_secure_permissions(std::filesystem::perms p);

// Reads the API key, stripping all whitespace. Missing, unreadable or empty
// files are ConfigError. Permissions other than 0600/0400 print a warning
// on `warn`; the key is still returned.
Result<std::string> load_api_key(const std::string& path, std::FILE* warn = stderr);
