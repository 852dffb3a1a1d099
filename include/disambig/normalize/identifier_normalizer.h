#pragma once

#include <disambig/core/types.h>
#include <disambig/graph/graph.h>
#include <disambig/normalize/iri.h>
#include <disambig/metadata/schema.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace disambig::normalize {

/**
 * Persisted identifier columns. host and scheme are always derived from uri.
 */
struct IdentifierFields {
    std::string uri;
    std::string host;
    std::string scheme;

    // Recomputes host and scheme from a stored URI; fails when the URI has no scheme
    static Result<IdentifierFields> fromUri(std::string_view uri);
};

enum class IdentifierKind { Work, Agent };

enum class NormalizeOutcome {
    Unchanged, // already canonical
    Rewritten, // accepted under its canonical IRI
    Rejected   // removed from the graph
};

/**
 * Canonicalizes the uri of one identifier node in place.
 *
 * Accepted nodes end up with exactly {uri, host, scheme}. Unparseable URIs, and for work
 * identifiers registry authorities (issn, orcid.org) and mailto, remove the node from the graph.
 * So do uris longer than maxUriLength bytes, without being parsed.
 */
Result<NormalizeOutcome> normalizeIdentifier(graph::Graph& graph, std::string_view nodeId,
                                             IdentifierKind kind,
                                             std::size_t maxUriLength = kMaxIriLength);

struct NormalizationSummary {
    std::size_t unchanged = 0;
    std::size_t rewritten = 0;
    std::size_t rejected = 0;
};

// Applies normalizeIdentifier to every workidentifier and agentidentifier node
Result<NormalizationSummary> normalizeIdentifiers(graph::Graph& graph,
                                                  const metadata::Schema& schema,
                                                  std::size_t maxUriLength = kMaxIriLength);

} // namespace disambig::normalize
