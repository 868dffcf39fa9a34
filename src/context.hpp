#pragma once
#include "config.hpp"
#include "http.hpp"
#include "graph_store.hpp"
#include "embedder.hpp"
#include "provider.hpp"
#include "nli.hpp"
#include "perspective.hpp"
#include "goal_parser.hpp"
#include "retriever.hpp"
#include "consistency_checker.hpp"
#include "reasoning_engine.hpp"
#include <memory>
#include <optional>
#include <string>

namespace memweave {

class BackendRegistry;

// Everything one process needs, built once at startup and handed to
// whoever runs operations. Members are declared in dependency order.
struct CoreContext {
    Config config;
    HttpClient* http = nullptr;  // not owned

    std::unique_ptr<GraphStore> store;
    std::unique_ptr<Embedder> embedder;
    std::unique_ptr<Provider> provider;
    std::unique_ptr<NliClassifier> nli;
    PerspectiveRules perspective;
    NamespaceLocks locks;

    std::unique_ptr<GoalParser> goal_parser;
    std::unique_ptr<HybridRetriever> retriever;
    std::unique_ptr<ConsistencyChecker> checker;
    std::unique_ptr<RelationReasoningEngine> engine;

    const std::string& default_namespace() const { return config.store.default_namespace; }
};

// Build collaborators through the registry and wire the core components.
// Unknown backends throw std::invalid_argument; an unusable store throws.
std::unique_ptr<CoreContext> create_context(const Config& config,
                                            const BackendRegistry& registry,
                                            HttpClient& http);

// Wire the core components over collaborators the caller already built.
std::unique_ptr<CoreContext> assemble_context(const Config& config, HttpClient& http,
                                              std::unique_ptr<GraphStore> store,
                                              std::unique_ptr<Embedder> embedder,
                                              std::unique_ptr<Provider> provider,
                                              std::unique_ptr<NliClassifier> nli);

// Read path: parse the query into a goal, embed it and retrieve.
// A failed query embedding degrades to keyword and graph stages.
RetrievalResult search_memories(CoreContext& ctx, const std::string& query,
                                GoalMode mode, const std::string& ns, uint32_t top_k = 0,
                                std::optional<MemoryType> scope = std::nullopt,
                                const std::atomic<bool>* cancel = nullptr);

// Write path: consistency check under the namespace lock.
CommitResult add_memory(CoreContext& ctx, const MemoryNode& candidate, const std::string& ns);

} // namespace memweave
