#pragma once

#include <array>
#include <string_view>

namespace replacement_rules {

struct Replacement
{
    std::string_view pattern;
    std::string_view replacement;
};

// Abbreviation expansions run first: their output may still contain characters
// that the folding table rewrites afterwards ("Str." -> "Straße" -> "strasse").
inline constexpr std::array<Replacement, 3> kAbbreviations{ {
    { "Str.", "Straße" },
    { "str.", "straße" },
    { "STR.", "STRASSE" },
} };

// German umlaut and sharp-s folding
inline constexpr std::array<Replacement, 8> kCharacterFolding{ {
    { "ä", "ae" },
    { "ö", "oe" },
    { "ü", "ue" },
    { "Ä", "Ae" },
    { "Ö", "Oe" },
    { "Ü", "Ue" },
    { "ß", "ss" },
    { "ẞ", "SS" },
} };

} // namespace replacement_rules
