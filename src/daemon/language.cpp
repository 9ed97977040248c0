#include "language.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace {

constexpr std::array<std::pair<Language, std::string_view>, 10> kNames = {{
    {Language::Chinese, "Chinese"},
    {Language::English, "English"},
    {Language::Japanese, "Japanese"},
    {Language::Korean, "Korean"},
    {Language::French, "French"},
    {Language::German, "German"},
    {Language::Spanish, "Spanish"},
    {Language::Russian, "Russian"},
    {Language::Portuguese, "Portuguese"},
    {Language::Italian, "Italian"},
}};

bool iequals(std::string_view a, std::string_view b) {
    return std::ranges::equal(a, b, [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) ==
               std::tolower(static_cast<unsigned char>(y));
    });
}

} // namespace

std::string_view to_string(Language lang) {
    for (auto& [l, name] : kNames) {
        if (l == lang) return name;
    }
    return "Unknown";
}

std::optional<Language> parse_language(std::string_view name) {
    for (auto& [l, n] : kNames) {
        if (iequals(n, name)) return l;
    }
    return std::nullopt;
}
