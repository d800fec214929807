#include "options.hpp"

#include <format>
#include <print>

Result<bool> parse_bool(const std::string& flag, const std::string& value) {
    if (value == "true") return true;
    if (value == "false") return false;
    return make_error(ErrorCode::InvalidArgument,
                      std::format("{} expects true or false, got '{}'", flag, value));
}

Result<Options> parse_options(int argc, char* argv[]) {
    Options opts;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            opts.show_help = true;
            return opts;
        }
        if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
            continue;
        }

        bool takes_value = arg == "-f" || arg == "--file" ||
                           arg == "-l" || arg == "--language" ||
                           arg == "-t" || arg == "--translate" ||
                           arg == "-a" || arg == "--audio" ||
                           arg == "-c" || arg == "--config";
        if (!takes_value) {
            return make_error(ErrorCode::InvalidArgument, "Unknown option " + arg);
        }
        if (i + 1 >= argc) {
            return make_error(ErrorCode::InvalidArgument, "Missing value for " + arg);
        }
        std::string value = argv[++i];

        if (arg == "-f" || arg == "--file") {
            opts.file = value;
        } else if (arg == "-l" || arg == "--language") {
            opts.language = value;
        } else if (arg == "-c" || arg == "--config") {
            opts.config_path = value;
        } else {
            auto flag = parse_bool(arg, value);
            if (!flag) return std::unexpected(flag.error());
            if (arg == "-t" || arg == "--translate") {
                opts.translate = *flag;
            } else {
                opts.return_audio = *flag;
            }
        }
    }

    if (opts.file.empty()) {
        return make_error(ErrorCode::InvalidArgument, "No audio file provided");
    }
    return opts;
}

void print_usage(std::FILE* out, const char* prog) {
    std::println(out, "Usage: {} -f|--file <AUDIO_FILE_OR_URL> [-l|--language <LANGUAGE>] "
                      "[-t|--translate <true|false>] [-a|--audio <true|false>]", prog);
}

void print_help(std::FILE* out, const char* prog) {
    print_usage(out, prog);
    std::println(out, "");
    std::println(out, "Options:");
    std::println(out, "  -f, --file        Local audio file path, URL, or data URI (required)");
    std::println(out, "  -l, --language    Target language (default: english)");
    std::println(out, "                    Supported: french, spanish, japanese, chinese, korean, italian, portuguese, german");
    std::println(out, "  -t, --translate   true for translation, false for transcription (default: false)");
    std::println(out, "  -a, --audio       true to return translated audio (default: false, only with -t true)");
    std::println(out, "  -c, --config      Config file path (default: ~/.config/reka/config.json)");
    std::println(out, "  -v, --verbose     Print progress diagnostics to stderr");
    std::println(out, "  -h, --help        Show this help");
    std::println(out, "");
    std::println(out, "Examples:");
    std::println(out, "  {} -f \"audio.mp3\"", prog);
    std::println(out, "  {} -f \"~/audio.wav\" --translate true --language french", prog);
    std::println(out, "  {} --file \"https://example.com/audio.mp3\" --translate true --language french", prog);
    std::println(out, "  {} -f \"audio.mp3\" -t true -l spanish -a true", prog);
}
