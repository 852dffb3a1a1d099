#include <disambig/config/config_helpers.h>
#include <disambig/config/disambiguation_config.h>
#include <disambig/disambiguation/disambiguator.h>
#include <disambig/graph/graph.h>
#include <disambig/metadata/candidate_store.h>
#include <disambig/normalize/identifier_normalizer.h>
#include <disambig/version.hpp>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/stderr_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace {

constexpr int kExitError = 1;
constexpr int kExitMergeRequired = 2;

struct Options {
    std::string dbPath;
    std::string graphPath;
    std::string configPath;
    std::optional<std::int64_t> sourceId;
    bool onlyNormalize = false;
    bool verbose = false;
};

disambig::Result<nlohmann::json> readJsonFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return disambig::Error{disambig::ErrorCode::FileNotFound, "cannot open " + path};
    }
    auto doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded()) {
        return disambig::Error{disambig::ErrorCode::InvalidData, path + " is not valid JSON"};
    }
    return doc;
}

nlohmann::json candidatesToJson(const std::vector<disambig::metadata::Candidate>& candidates) {
    auto out = nlohmann::json::array();
    for (const auto& candidate : candidates) {
        out.push_back({{"type", candidate.type}, {"id", candidate.id}});
    }
    return out;
}

nlohmann::json graphToJson(const disambig::graph::Graph& graph) {
    auto nodes = nlohmann::json::array();
    for (const auto* node : graph.nodes()) {
        auto item = node->attrs();
        item["@id"] = node->id();
        item["@type"] = node->type();
        for (const auto& [name, target] : node->relations()) {
            item[name] = {{"@id", target}};
        }
        nodes.push_back(std::move(item));
    }
    return {{"@graph", std::move(nodes)}};
}

int run(const Options& opts) {
    const auto configPath = disambig::config::get_config_path(opts.configPath);
    auto config = disambig::config::loadDisambiguationConfig(configPath);
    if (!config) {
        spdlog::error("Config error: {}", config.error().message);
        return kExitError;
    }
    if (opts.sourceId) {
        config.value().sourceId = opts.sourceId;
    }

    auto document = readJsonFile(opts.graphPath);
    if (!document) {
        spdlog::error("{}", document.error().message);
        return kExitError;
    }
    auto graph = disambig::graph::loadJsonLdGraph(document.value());
    if (!graph) {
        spdlog::error("Invalid graph: {}", graph.error().message);
        return kExitError;
    }

    auto store =
        disambig::metadata::makeSqliteCandidateStore(opts.dbPath, disambig::metadata::Schema::share());
    if (!store) {
        spdlog::error("Failed to open store {}: {}", opts.dbPath, store.error().message);
        return kExitError;
    }
    auto& candidates = *store.value();

    auto summary = disambig::normalize::normalizeIdentifiers(graph.value(), candidates.schema(),
                                                             config.value().maxUriLength);
    if (!summary) {
        spdlog::error("Identifier normalization failed: {}", summary.error().message);
        return kExitError;
    }
    spdlog::info("Identifiers: {} unchanged, {} rewritten, {} rejected",
                 summary.value().unchanged, summary.value().rewritten, summary.value().rejected);

    if (opts.onlyNormalize) {
        std::cout << graphToJson(graph.value()).dump(2) << std::endl;
        return 0;
    }

    disambig::disambiguation::Disambiguator disambiguator(graph.value(), candidates,
                                                          config.value());
    auto outcome = disambiguator.run();
    if (!outcome) {
        spdlog::error("Disambiguation failed: {}", outcome.error().message);
        return kExitError;
    }

    return std::visit(
        [](const auto& result) -> int {
            using T = std::decay_t<decltype(result)>;
            if constexpr (std::is_same_v<T, disambig::disambiguation::Resolved>) {
                nlohmann::json out = {{"matches", result.matches.toJson()}};
                std::cout << out.dump(2) << std::endl;
                return 0;
            } else {
                nlohmann::json out = {{"merge_required",
                                       {{"node", result.nodeId},
                                        {"relation", result.relationName},
                                        {"related_node", result.relatedNodeId},
                                        {"message", result.message},
                                        {"candidates", candidatesToJson(result.candidates)}}}};
                std::cout << out.dump(2) << std::endl;
                return kExitMergeRequired;
            }
        },
        outcome.value());
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        // Logs go to stderr; stdout carries the JSON result
        spdlog::set_default_logger(spdlog::stderr_color_mt("disambig"));
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        Options opts;
        CLI::App app{"Resolve a harvested graph against persisted records", "disambig-cli"};
        app.set_version_flag("--version", DISAMBIG_VERSION_STRING);
        app.add_option("--db", opts.dbPath, "SQLite store holding the persisted records")
            ->required();
        app.add_option("--graph", opts.graphPath, "JSON-LD document with the graph to resolve")
            ->required()
            ->check(CLI::ExistingFile);
        app.add_option("--config", opts.configPath, "Config file (default: XDG config dir)");
        app.add_option("--source", opts.sourceId, "Source id owning non-central taxonomies");
        app.add_flag("--plan-only-normalize", opts.onlyNormalize,
                     "Only normalize identifiers and print the resulting graph");
        app.add_flag("-v,--verbose", opts.verbose, "Enable debug logging");

        CLI11_PARSE(app, argc, argv);

        if (opts.verbose) {
            spdlog::set_level(spdlog::level::debug);
        }
        return run(opts);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return kExitError;
    }
}
