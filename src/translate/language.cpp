#include "language.hpp"

#include <cstddef>
#include <format>

std::string_view to_string(Language lang) {
    return kLanguageNames[static_cast<size_t>(lang)];
}

Result<Language> parse_language(std::string_view name) {
    for (size_t i = 0; i < kLanguageNames.size(); ++i) {
        if (kLanguageNames[i] == name) {
            return static_cast<Language>(i);
        }
    }
    return make_error(ErrorCode::InvalidArgument,
                      std::format("Invalid target language: {}\nSupported languages: {}",
                                  name, supported_languages()));
}

std::string supported_languages() {
    std::string out;
    for (auto name : kLanguageNames) {
        if (!out.empty()) out += ", ";
        out += name;
    }
    return out;
}
