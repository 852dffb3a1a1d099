#pragma once

#include <disambig/core/types.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace disambig::normalize {

/**
 * Canonical form of an identifier URI.
 */
struct ParsedIri {
    std::string iri;       // e.g. "http://dx.doi.org/10.1234/ABC"
    std::string scheme;    // e.g. "http"
    std::string authority; // e.g. "dx.doi.org", "issn", "example.com:8080"
    std::string path;      // e.g. "/10.1234/ABC"
};

// Longest raw identifier handed to the recognizers; longer values are rejected unparsed
inline constexpr std::size_t kMaxIriLength = 4096;

/**
 * Recognizes DOIs, ORCIDs, ISSNs, mail addresses, URNs and http(s)/ftp(s) URLs in their
 * common spellings and returns the canonical IRI. parseIri(parseIri(x).iri) == parseIri(x).
 *
 * Fails with InvalidData when the input is none of those, fails its checksum, or is longer
 * than maxLength bytes.
 */
Result<ParsedIri> parseIri(std::string_view raw, std::size_t maxLength = kMaxIriLength);

} // namespace disambig::normalize
