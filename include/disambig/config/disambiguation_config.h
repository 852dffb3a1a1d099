#pragma once

#include <disambig/core/types.h>
#include <disambig/normalize/iri.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>

namespace disambig::config {

/**
 * Tunables of the matching passes, read from the [disambiguation] section.
 *
 *   [disambiguation]
 *   max_agent_relations = 500  # works with more existing relations skip fuzzy matching
 *   max_name_length = 200      # longer names are never compared
 *   source_id = 7              # taxonomy owner for non-central subjects
 *   max_uri_length = 2048      # longer identifier uris are discarded unparsed, at most 4096
 */
struct DisambiguationConfig {
    std::int64_t maxAgentRelations = 500;
    std::size_t maxNameLength = 200;
    std::optional<std::int64_t> sourceId;
    std::size_t maxUriLength = normalize::kMaxIriLength;
};

// Defaults when the file does not exist; InvalidArgument for values that are not valid numbers
// or out of range
Result<DisambiguationConfig> loadDisambiguationConfig(const std::filesystem::path& configPath);

} // namespace disambig::config
