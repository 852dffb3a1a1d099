#include <disambig/normalize/name_parser.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <vector>

namespace disambig::normalize {

namespace {

constexpr std::array<std::string_view, 14> kTitles = {
    "dr", "prof", "professor", "mr", "mrs", "ms", "miss", "mx", "sir", "dame",
    "rev", "fr", "hon", "lady"};

constexpr std::array<std::string_view, 12> kSuffixes = {
    "jr", "sr", "ii", "iii", "iv", "phd", "md", "esq", "dds", "mba", "jd", "2nd"};

constexpr std::array<std::string_view, 17> kLastNameParticles = {
    "van", "von", "de", "der", "den", "da", "das", "del", "della", "di", "dos",
    "du", "la", "le", "st", "ter", "bin"};

// Lowercase with periods removed, for table lookups ("Ph.D." -> "phd")
std::string lookupKey(std::string_view piece) {
    std::string key;
    key.reserve(piece.size());
    for (unsigned char c : piece) {
        if (c != '.') {
            key.push_back(static_cast<char>(std::tolower(c)));
        }
    }
    return key;
}

template <std::size_t N>
bool inTable(const std::array<std::string_view, N>& table, std::string_view piece) {
    const auto key = lookupKey(piece);
    return std::find(table.begin(), table.end(), key) != table.end();
}

std::string collapseWhitespace(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    bool pendingSpace = false;
    for (unsigned char c : raw) {
        if (std::isspace(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(static_cast<char>(c));
    }
    return out;
}

std::string stripNicknames(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    char closing = 0;
    for (std::size_t i = 0; i < name.size(); ++i) {
        const char c = name[i];
        if (closing) {
            if (c == closing) closing = 0;
            continue;
        }
        const bool atWordStart = i == 0 || name[i - 1] == ' ';
        if (c == '(') {
            closing = ')';
        } else if (c == '"' && atWordStart) {
            closing = '"';
        } else {
            out.push_back(c);
        }
    }
    return collapseWhitespace(out);
}

std::vector<std::string> splitOn(std::string_view s, char sep) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (start <= s.size()) {
        auto pos = s.find(sep, start);
        if (pos == std::string_view::npos) pos = s.size();
        auto part = collapseWhitespace(s.substr(start, pos - start));
        if (!part.empty()) parts.push_back(std::move(part));
        start = pos + 1;
    }
    return parts;
}

std::string joinPieces(const std::vector<std::string>& pieces, std::size_t begin,
                       std::size_t end) {
    std::string out;
    for (std::size_t i = begin; i < end; ++i) {
        if (!out.empty()) out.push_back(' ');
        out += pieces[i];
    }
    return out;
}

void appendPiece(std::string& target, const std::string& piece) {
    if (!target.empty()) target.push_back(' ');
    target += piece;
}

// Assigns title/first/middle/last from pieces written in "First Middle Last" order
void parseForward(std::vector<std::string> pieces, ParsedName& name) {
    while (pieces.size() > 1 && inTable(kTitles, pieces.front())) {
        appendPiece(name.title, pieces.front());
        pieces.erase(pieces.begin());
    }
    while (pieces.size() > 1 && inTable(kSuffixes, pieces.back())) {
        std::string suffix = pieces.back();
        pieces.pop_back();
        name.suffix = name.suffix.empty() ? suffix : suffix + ", " + name.suffix;
    }
    if (pieces.empty()) {
        return;
    }
    if (pieces.size() == 1) {
        if (!name.title.empty()) {
            name.last = pieces.front();
        } else {
            name.first = pieces.front();
        }
        return;
    }

    // Particles before the final piece belong to the last name
    std::size_t lastBegin = pieces.size() - 1;
    while (lastBegin > 1 && inTable(kLastNameParticles, pieces[lastBegin - 1])) {
        --lastBegin;
    }
    name.first = pieces.front();
    name.middle = joinPieces(pieces, 1, lastBegin);
    name.last = joinPieces(pieces, lastBegin, pieces.size());
}

} // namespace

ParsedName parseHumanName(std::string_view raw) {
    ParsedName name;
    name.fullName = collapseWhitespace(raw);
    if (name.fullName.empty()) {
        return name;
    }

    const auto cleaned = stripNicknames(name.fullName);
    auto parts = splitOn(cleaned, ',');
    if (parts.empty()) {
        return name;
    }

    // "First Last, Jr." keeps forward order; "Last, First" is the inverted form
    bool trailingSuffixesOnly = parts.size() > 1;
    for (std::size_t i = 1; i < parts.size() && trailingSuffixesOnly; ++i) {
        for (const auto& piece : splitOn(parts[i], ' ')) {
            if (!inTable(kSuffixes, piece)) {
                trailingSuffixesOnly = false;
                break;
            }
        }
    }

    if (parts.size() == 1 || trailingSuffixesOnly) {
        parseForward(splitOn(parts.front(), ' '), name);
        for (std::size_t i = 1; i < parts.size(); ++i) {
            if (!name.suffix.empty()) name.suffix += ", ";
            name.suffix += parts[i];
        }
        return name;
    }

    // Inverted: "Last, [Title] First Middle[, Suffix]"
    name.last = parts.front();
    auto given = splitOn(parts[1], ' ');
    while (!given.empty() && inTable(kTitles, given.front())) {
        appendPiece(name.title, given.front());
        given.erase(given.begin());
    }
    while (given.size() > 1 && inTable(kSuffixes, given.back())) {
        name.suffix = given.back();
        given.pop_back();
    }
    if (!given.empty()) {
        name.first = given.front();
        name.middle = joinPieces(given, 1, given.size());
    }
    for (std::size_t i = 2; i < parts.size(); ++i) {
        if (!name.suffix.empty()) name.suffix += ", ";
        name.suffix += parts[i];
    }
    return name;
}

namespace {

bool isContinuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

} // namespace

std::size_t utf8Length(std::string_view text) {
    std::size_t count = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (i == 0 || !isContinuation(text[i])) {
            ++count;
        }
    }
    return count;
}

std::string firstCodePoint(std::string_view text) {
    if (text.empty()) {
        return {};
    }
    std::size_t end = 1;
    while (end < text.size() && isContinuation(text[end])) {
        ++end;
    }
    return std::string(text.substr(0, end));
}

} // namespace disambig::normalize
