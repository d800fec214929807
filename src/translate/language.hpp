#pragma once

#include "error.hpp"

#include <array>
#include <string>
#include <string_view>

enum class Language {
    English,
    French,
    Spanish,
    Japanese,
    Chinese,
    Korean,
    Italian,
    Portuguese,
    German,
};

// Names as sent in the request body, in declaration order of Language.
inline constexpr std::array<std::string_view, 9> kLanguageNames = {
    "english", "french", "spanish", "japanese", "chinese",
    "korean", "italian", "portuguese", "german",
};

std::string_view to_string(Language lang);

// Exact, case-sensitive match against kLanguageNames.
Result<Language> parse_language(std::string_view name);

// "english, french, ..." for error messages.
std::string supported_languages();
