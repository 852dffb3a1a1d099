#include <disambig/normalize/identifier_normalizer.h>
#include <disambig/normalize/iri.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <utility>
#include <vector>

namespace disambig::normalize {

namespace {

constexpr std::array<std::string_view, 2> kDisallowedWorkAuthorities = {"issn", "orcid.org"};
constexpr std::array<std::string_view, 1> kDisallowedWorkSchemes = {"mailto"};

template <std::size_t N>
bool contains(const std::array<std::string_view, N>& values, std::string_view value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Raw values in log lines and errors are cut to a readable length
std::string preview(std::string_view raw) {
    constexpr std::size_t kPreviewLength = 120;
    if (raw.size() <= kPreviewLength) {
        return std::string(raw);
    }
    return std::string(raw.substr(0, kPreviewLength)) + "...";
}

const char* kindName(IdentifierKind kind) {
    return kind == IdentifierKind::Work ? "work" : "agent";
}

} // namespace

Result<IdentifierFields> IdentifierFields::fromUri(std::string_view uri) {
    // scheme ":" ["//" authority] path ["?" query] ["#" fragment]
    const auto colon = uri.find_first_of(":/?#");
    if (colon == std::string_view::npos || colon == 0 || uri[colon] != ':') {
        return Error{ErrorCode::InvalidData, "URI has no scheme: " + preview(uri)};
    }

    IdentifierFields out;
    out.uri = std::string(uri);
    out.scheme = lower(std::string(uri.substr(0, colon)));

    auto rest = uri.substr(colon + 1);
    std::string host;
    if (rest.substr(0, 2) == "//") {
        rest.remove_prefix(2);
        host = std::string(rest.substr(0, rest.find_first_of("/?#")));
        if (auto at = host.rfind('@'); at != std::string::npos) {
            host.erase(0, at + 1);
        }
        if (host.empty() || host.front() != '[') {
            if (auto port = host.rfind(':'); port != std::string::npos) {
                host.erase(port);
            }
        } else if (auto close = host.find(']'); close != std::string::npos) {
            host.erase(close + 1);
        }
    } else {
        // mailto:user@domain
        const auto path = rest.substr(0, rest.find_first_of("?#"));
        if (auto at = path.rfind('@'); at != std::string_view::npos) {
            host = std::string(path.substr(at + 1));
        }
    }
    out.host = lower(std::move(host));
    return out;
}

Result<NormalizeOutcome> normalizeIdentifier(graph::Graph& graph, std::string_view nodeId,
                                             IdentifierKind kind, std::size_t maxUriLength) {
    auto* node = graph.get(nodeId);
    if (!node) {
        return Error{ErrorCode::NotFound, "no node " + std::string(nodeId)};
    }

    const auto raw = node->stringAttr("uri");
    auto reject = [&]() -> Result<NormalizeOutcome> {
        graph.remove(nodeId);
        return NormalizeOutcome::Rejected;
    };

    if (!raw) {
        spdlog::warn("Discarding {} identifier {} without a uri", kindName(kind), nodeId);
        return reject();
    }

    auto parsed = parseIri(*raw, maxUriLength);
    if (!parsed) {
        spdlog::warn("Discarding invalid identifier {} with error {}", preview(*raw),
                     parsed.error().message);
        return reject();
    }
    const auto& iri = parsed.value();

    if (kind == IdentifierKind::Work && (contains(kDisallowedWorkAuthorities, iri.authority) ||
                                         contains(kDisallowedWorkSchemes, iri.scheme))) {
        spdlog::warn("Discarding {} {} as an invalid identifier for works", iri.authority,
                     iri.iri);
        return reject();
    }

    auto fields = IdentifierFields::fromUri(iri.iri);
    if (!fields) {
        spdlog::warn("Discarding identifier {}: {}", preview(*raw), fields.error().message);
        return reject();
    }

    const bool changed = *raw != iri.iri;
    if (changed) {
        spdlog::debug("Normalized {} to {}", *raw, iri.iri);
    }

    node->setAttrs(nlohmann::json{{"uri", fields.value().uri},
                                  {"host", fields.value().host},
                                  {"scheme", fields.value().scheme}});
    return changed ? NormalizeOutcome::Rewritten : NormalizeOutcome::Unchanged;
}

Result<NormalizationSummary> normalizeIdentifiers(graph::Graph& graph,
                                                  const metadata::Schema& schema,
                                                  std::size_t maxUriLength) {
    std::vector<std::pair<graph::NodeId, IdentifierKind>> pending;
    for (const auto* node : std::as_const(graph).nodes()) {
        const auto* type = schema.baseTypeOf(node->type());
        if (!type) {
            continue;
        }
        if (type->name == "workidentifier") {
            pending.emplace_back(node->id(), IdentifierKind::Work);
        } else if (type->name == "agentidentifier") {
            pending.emplace_back(node->id(), IdentifierKind::Agent);
        }
    }

    NormalizationSummary summary;
    for (const auto& [id, kind] : pending) {
        auto outcome = normalizeIdentifier(graph, id, kind, maxUriLength);
        if (!outcome) {
            return outcome.error();
        }
        switch (outcome.value()) {
            case NormalizeOutcome::Unchanged:
                ++summary.unchanged;
                break;
            case NormalizeOutcome::Rewritten:
                ++summary.rewritten;
                break;
            case NormalizeOutcome::Rejected:
                ++summary.rejected;
                break;
        }
    }
    spdlog::debug("Normalized identifiers: {} unchanged, {} rewritten, {} rejected",
                  summary.unchanged, summary.rewritten, summary.rejected);
    return summary;
}

} // namespace disambig::normalize
