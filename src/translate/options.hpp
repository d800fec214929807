#pragma once

#include "error.hpp"

#include <cstdio>
#include <string>

// Command-line request parameters. The language is kept as given so that it
// is validated after the audio source has been resolved.
struct Options {
    std::string file;
    std::string language = "english";
    bool translate = false;
    bool return_audio = false;

    std::string config_path;
    bool verbose = false;
    bool show_help = false;
};

// Accepts exactly "true" or "false".
Result<bool> parse_bool(const std::string& flag, const std::string& value);

// Parses argv[1..argc). With --help the remaining checks are skipped and
// show_help is set; otherwise --file is required.
Result<Options> parse_options(int argc, char* argv[]);

void print_usage(std::FILE* out, const char* prog);
void print_help(std::FILE* out, const char* prog);
