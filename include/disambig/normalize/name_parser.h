#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace disambig::normalize {

/**
 * Structured components of a human name.
 *
 * fullName is the input with surrounding whitespace trimmed and inner runs collapsed;
 * components keep their original case.
 */
struct ParsedName {
    std::string title;
    std::string first;
    std::string middle;
    std::string last;
    std::string suffix;
    std::string fullName;

    bool empty() const { return first.empty() && last.empty(); }
};

/**
 * Parses "First Middle Last", "Last, First Middle" and their titled/suffixed variants.
 * Nicknames in quotes or parentheses are dropped; last-name particles (van, de, von, ...)
 * stay attached to the last name.
 */
ParsedName parseHumanName(std::string_view raw);

// Number of UTF-8 code points in text
std::size_t utf8Length(std::string_view text);

// First UTF-8 code point of text (lead byte plus its continuation bytes), empty for empty text
std::string firstCodePoint(std::string_view text);

} // namespace disambig::normalize
