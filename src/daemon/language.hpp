#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

enum class Language {
    Chinese,
    English,
    Japanese,
    Korean,
    French,
    German,
    Spanish,
    Russian,
    Portuguese,
    Italian,
};

inline constexpr std::array<Language, 10> kLanguages = {
    Language::Chinese, Language::English, Language::Japanese, Language::Korean,
    Language::French, Language::German, Language::Spanish, Language::Russian,
    Language::Portuguese, Language::Italian,
};

std::string_view to_string(Language lang);

// Case-insensitive match on the English language name.
std::optional<Language> parse_language(std::string_view name);
