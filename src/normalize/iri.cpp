#include <disambig/normalize/iri.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace disambig::normalize {

namespace {

using MaybeIri = std::optional<Result<ParsedIri>>;

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

Error invalid(std::string message) {
    return Error{ErrorCode::InvalidData, std::move(message)};
}

ParsedIri make(std::string scheme, std::string authority, std::string path) {
    ParsedIri out;
    out.iri = scheme + "://" + authority + path;
    out.scheme = std::move(scheme);
    out.authority = std::move(authority);
    out.path = std::move(path);
    return out;
}

MaybeIri parseDoi(const std::string& s) {
    static const std::regex re(
        R"(^(?:doi:\s*|(?:https?://)?(?:dx\.)?doi\.org/)?(10\.\d{4,9}(?:\.\d+)*/\S+)$)",
        std::regex::icase);
    std::smatch m;
    if (!std::regex_match(s, m, re)) {
        return std::nullopt;
    }
    return make("http", "dx.doi.org", "/" + upper(m[1].str()));
}

char orcidCheckDigit(std::string_view digits) {
    int total = 0;
    for (char c : digits) {
        total = (total + (c - '0')) * 2;
    }
    const int result = (12 - total % 11) % 11;
    return result == 10 ? 'X' : static_cast<char>('0' + result);
}

MaybeIri parseOrcid(const std::string& s) {
    static const std::regex re(
        R"(^(?:(?:https?://)?(?:www\.)?orcid\.org/)?(\d{4})-(\d{4})-(\d{4})-(\d{3}[\dXx])/?$)",
        std::regex::icase);
    std::smatch m;
    if (!std::regex_match(s, m, re)) {
        return std::nullopt;
    }
    const auto id = upper(m[1].str() + "-" + m[2].str() + "-" + m[3].str() + "-" + m[4].str());
    std::string digits;
    for (char c : id.substr(0, id.size() - 1)) {
        if (c != '-') digits.push_back(c);
    }
    if (orcidCheckDigit(digits) != id.back()) {
        return Result<ParsedIri>{invalid("'" + s + "' is not a valid ORCID (bad checksum)")};
    }
    return make("http", "orcid.org", "/" + id);
}

MaybeIri parseIssn(const std::string& s) {
    static const std::regex re(R"(^(?:urn:issn:|urn://issn/|issn:?\s*)?(\d{4})-?(\d{3}[\dXx])$)",
                               std::regex::icase);
    std::smatch m;
    if (!std::regex_match(s, m, re)) {
        return std::nullopt;
    }
    const auto digits = upper(m[1].str() + m[2].str());
    int sum = 0;
    for (std::size_t i = 0; i < 7; ++i) {
        sum += (digits[i] - '0') * static_cast<int>(8 - i);
    }
    const int check = (11 - sum % 11) % 11;
    const char expected = check == 10 ? 'X' : static_cast<char>('0' + check);
    if (digits.back() != expected) {
        return Result<ParsedIri>{invalid("'" + s + "' is not a valid ISSN (bad checksum)")};
    }
    return make("urn", "issn", "/" + digits.substr(0, 4) + "-" + digits.substr(4));
}

MaybeIri parseMailto(const std::string& s) {
    static const std::regex re(R"(^(?:mailto:)?([^\s@:/]+)@([^\s@/:]+\.[^\s@/:]+)$)",
                               std::regex::icase);
    std::smatch m;
    if (!std::regex_match(s, m, re)) {
        return std::nullopt;
    }
    ParsedIri out;
    out.scheme = "mailto";
    out.authority = lower(m[2].str());
    out.path = m[1].str() + "@" + out.authority;
    out.iri = "mailto:" + out.path;
    return out;
}

MaybeIri parseUrn(const std::string& s) {
    static const std::regex re(R"(^urn:(?://)?([a-z0-9][a-z0-9-]{0,31})[:/](\S+)$)",
                               std::regex::icase);
    std::smatch m;
    if (!std::regex_match(s, m, re)) {
        return std::nullopt;
    }
    return make("urn", lower(m[1].str()), "/" + m[2].str());
}

bool isHex(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

// Upper-cases existing escapes, escapes stray '%' and whitespace
std::string normalizeEscapes(std::string_view in) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        const auto c = static_cast<unsigned char>(in[i]);
        if (c == '%') {
            if (i + 2 < in.size() && isHex(in[i + 1]) && isHex(in[i + 2])) {
                out.push_back('%');
                out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(in[i + 1]))));
                out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(in[i + 2]))));
                i += 2;
            } else {
                out += "%25";
            }
        } else if (std::isspace(c) || c < 0x20) {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        } else {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

// RFC 3986 section 5.2.4
std::string removeDotSegments(std::string_view path) {
    std::vector<std::string_view> segments;
    std::size_t start = 1; // path always begins with '/'
    bool trailingSlash = false;
    while (start <= path.size()) {
        auto pos = path.find('/', start);
        if (pos == std::string_view::npos) pos = path.size();
        auto segment = path.substr(start, pos - start);
        trailingSlash = false;
        if (segment == "..") {
            if (!segments.empty()) segments.pop_back();
            trailingSlash = true;
        } else if (segment == ".") {
            trailingSlash = true;
        } else {
            segments.push_back(segment);
        }
        start = pos + 1;
    }

    std::string out;
    for (const auto& segment : segments) {
        out += '/';
        out += segment;
    }
    if (out.empty() || trailingSlash) {
        out += '/';
    }
    return out;
}

std::optional<std::string_view> defaultPort(std::string_view scheme) {
    if (scheme == "http") return "80";
    if (scheme == "https") return "443";
    if (scheme == "ftp" || scheme == "ftps") return "21";
    return std::nullopt;
}

bool validHost(std::string_view host) {
    if (host.empty()) return false;
    if (host.front() == '[') {
        return host.back() == ']' && host.size() > 2;
    }
    return std::all_of(host.begin(), host.end(), [](char ch) {
        const auto c = static_cast<unsigned char>(ch);
        return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c >= 0x80;
    });
}

MaybeIri parseUrl(const std::string& s) {
    static const std::regex re(R"(^(([^:/?#]+):)?(//([^/?#]*))?([^?#]*)(\?([^#]*))?(#(.*))?$)");
    static const std::regex schemeless(R"(^www\d?\.)", std::regex::icase);

    std::string input = s;
    if (std::regex_search(input, schemeless)) {
        input = "http://" + input;
    }

    std::smatch m;
    if (!std::regex_match(input, m, re) || !m[2].matched) {
        return std::nullopt;
    }

    const auto scheme = lower(m[2].str());
    static const std::array<std::string_view, 4> kSchemes = {"http", "https", "ftp", "ftps"};
    if (std::find(kSchemes.begin(), kSchemes.end(), scheme) == kSchemes.end()) {
        return Result<ParsedIri>{invalid("unsupported scheme '" + scheme + "' in '" + s + "'")};
    }
    if (!m[3].matched) {
        return Result<ParsedIri>{invalid("'" + s + "' has no authority")};
    }

    std::string authority = m[4].str();
    if (auto at = authority.rfind('@'); at != std::string::npos) {
        authority.erase(0, at + 1);
    }
    std::string host = authority;
    std::string port;
    const auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']', colon) == std::string::npos) {
        host = authority.substr(0, colon);
        port = authority.substr(colon + 1);
    }
    host = lower(host);
    while (!host.empty() && host.back() == '.') host.pop_back();
    if (!validHost(host)) {
        return Result<ParsedIri>{invalid("'" + s + "' has an invalid host")};
    }
    if (!std::all_of(port.begin(), port.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return Result<ParsedIri>{invalid("'" + s + "' has an invalid port")};
    }
    auto normalizedAuthority = host;
    if (!port.empty() && port != defaultPort(scheme)) {
        normalizedAuthority += ":" + port;
    }

    std::string path = m[5].str();
    if (path.empty() || path.front() != '/') {
        path.insert(path.begin(), '/');
    }
    path = removeDotSegments(normalizeEscapes(path));

    auto out = make(scheme, normalizedAuthority, path);
    if (m[6].matched) {
        out.iri += "?" + normalizeEscapes(m[7].str());
    }
    if (m[8].matched) {
        out.iri += "#" + normalizeEscapes(m[9].str());
    }
    return out;
}

} // namespace

Result<ParsedIri> parseIri(std::string_view raw, std::size_t maxLength) {
    const auto limit = std::min(maxLength, kMaxIriLength);
    if (raw.size() > limit) {
        return invalid("identifier of " + std::to_string(raw.size()) + " bytes exceeds the " +
                       std::to_string(limit) + " byte limit");
    }
    const std::string s(trim(raw));
    if (s.empty()) {
        return invalid("empty identifier");
    }

    using Recognizer = MaybeIri (*)(const std::string&);
    static constexpr std::array<Recognizer, 6> kRecognizers = {
        &parseDoi, &parseOrcid, &parseIssn, &parseMailto, &parseUrn, &parseUrl};

    for (auto recognize : kRecognizers) {
        if (auto parsed = recognize(s)) {
            return std::move(*parsed);
        }
    }
    return invalid("'" + s + "' is not a recognised identifier");
}

} // namespace disambig::normalize
