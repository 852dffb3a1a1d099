#include <disambig/config/config_helpers.h>
#include <disambig/config/disambiguation_config.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdint>
#include <string>
#include <system_error>

namespace disambig::config {

namespace {

constexpr const char* kSection = "disambiguation";

Result<std::optional<std::int64_t>> readInteger(const std::filesystem::path& path,
                                                const std::string& key) {
    const auto raw = parse_config_value(path, kSection, key);
    if (raw.empty()) {
        return std::optional<std::int64_t>{};
    }
    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (ec != std::errc() || ptr != raw.data() + raw.size()) {
        return Error{ErrorCode::InvalidArgument,
                     "[" + std::string(kSection) + "] " + key + " is not an integer: " + raw};
    }
    if (value < 0) {
        return Error{ErrorCode::InvalidArgument,
                     "[" + std::string(kSection) + "] " + key + " must not be negative"};
    }
    return std::optional<std::int64_t>{value};
}

} // namespace

Result<DisambiguationConfig> loadDisambiguationConfig(const std::filesystem::path& configPath) {
    DisambiguationConfig config;

    std::error_code ec;
    if (configPath.empty() || !std::filesystem::exists(configPath, ec)) {
        spdlog::debug("No config at '{}', using disambiguation defaults", configPath.string());
        return config;
    }

    auto maxRelations = readInteger(configPath, "max_agent_relations");
    if (!maxRelations) return maxRelations.error();
    if (maxRelations.value()) config.maxAgentRelations = *maxRelations.value();

    auto maxName = readInteger(configPath, "max_name_length");
    if (!maxName) return maxName.error();
    if (maxName.value()) config.maxNameLength = static_cast<std::size_t>(*maxName.value());

    auto maxUri = readInteger(configPath, "max_uri_length");
    if (!maxUri) return maxUri.error();
    if (maxUri.value()) {
        const auto value = *maxUri.value();
        if (value == 0 || static_cast<std::uint64_t>(value) > normalize::kMaxIriLength) {
            return Error{ErrorCode::InvalidArgument,
                         "[" + std::string(kSection) + "] max_uri_length must be between 1 and " +
                             std::to_string(normalize::kMaxIriLength)};
        }
        config.maxUriLength = static_cast<std::size_t>(value);
    }

    auto source = readInteger(configPath, "source_id");
    if (!source) return source.error();
    config.sourceId = source.value();

    spdlog::debug("Loaded disambiguation config from {}: max_agent_relations={} "
                  "max_name_length={} max_uri_length={}",
                  configPath.string(), config.maxAgentRelations, config.maxNameLength,
                  config.maxUriLength);
    return config;
}

} // namespace disambig::config
