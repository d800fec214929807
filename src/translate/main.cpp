#include "api/reka_backend.hpp"
#include "config.hpp"
#include "options.hpp"
#include "platform/linux/ffmpeg_transcoder.hpp"
#include "translator.hpp"

#include <iostream>
#include <print>

int main(int argc, char* argv[]) {
    auto opts = parse_options(argc, argv);
    if (!opts) {
        std::println(stderr, "Error: {}", opts.error().message);
        print_help(stderr, argv[0]);
        return 1;
    }

    if (opts->show_help) {
        print_help(stdout, argv[0]);
        return 0;
    }

    Config config = opts->config_path.empty() ? Config::load_default()
                                              : Config::load(opts->config_path);

    if (opts->verbose) {
        std::println(stderr, "[reka-translate] Endpoint: {}", config.api.endpoint);
    }

    RekaBackend backend(config.api.endpoint);
    FfmpegTranscoder transcoder(config.transcoder.program);
    Translator translator(std::move(config), backend, transcoder, std::cout, opts->verbose);

    auto res = translator.run(*opts);
    if (!res) {
        std::println(stderr, "Error: {}", res.error().message);
        return 1;
    }
    return 0;
}
