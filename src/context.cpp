#include "context.hpp"
#include "plugin.hpp"
#include <iostream>
#include <mutex>

namespace memweave {

std::unique_ptr<CoreContext> assemble_context(const Config& config, HttpClient& http,
                                              std::unique_ptr<GraphStore> store,
                                              std::unique_ptr<Embedder> embedder,
                                              std::unique_ptr<Provider> provider,
                                              std::unique_ptr<NliClassifier> nli) {
    auto ctx = std::make_unique<CoreContext>();
    ctx->config = config;
    ctx->http = &http;
    ctx->store = std::move(store);
    ctx->embedder = std::move(embedder);
    ctx->provider = std::move(provider);
    ctx->nli = std::move(nli);

    ctx->goal_parser = std::make_unique<GoalParser>(*ctx->provider, config.llm.model,
                                                    config.llm.temperature);
    ctx->retriever = std::make_unique<HybridRetriever>(*ctx->store, config.retriever,
                                                       ctx->embedder.get());
    ctx->checker = std::make_unique<ConsistencyChecker>(*ctx->store, *ctx->embedder,
                                                        *ctx->retriever, *ctx->nli,
                                                        config.checker, ctx->perspective);
    ctx->engine = std::make_unique<RelationReasoningEngine>(*ctx->store, *ctx->provider,
                                                            *ctx->embedder, config.reasoning,
                                                            config.llm.model,
                                                            config.llm.temperature);
    return ctx;
}

std::unique_ptr<CoreContext> create_context(const Config& config,
                                            const BackendRegistry& registry,
                                            HttpClient& http) {
    auto store = create_graph_store(config, registry);
    auto embedder = create_embedder(config, http, registry);
    auto provider = create_provider(config, http, registry);
    auto nli = create_nli_classifier(config, http, provider.get(), registry);
    return assemble_context(config, http, std::move(store), std::move(embedder),
                            std::move(provider), std::move(nli));
}

RetrievalResult search_memories(CoreContext& ctx, const std::string& query,
                                GoalMode mode, const std::string& ns, uint32_t top_k,
                                std::optional<MemoryType> scope,
                                const std::atomic<bool>* cancel) {
    ParsedTaskGoal goal = ctx.goal_parser->parse(query, mode);

    Embedding query_embedding;
    bool embed_failed = false;
    try {
        query_embedding = ctx.embedder->embed(query);
    } catch (const CollaboratorError& e) {
        std::cerr << "[retriever] Query embedding failed (ns=" << ns << ", op=search): "
                  << e.what() << "\n";
        embed_failed = true;
    }

    auto result = ctx.retriever->retrieve(goal, query_embedding, scope, top_k, ns, cancel);
    if (embed_failed) {
        result.errors.push_back("query embedding unavailable");
        if (result.status == RetrievalStatus::Ok || result.status == RetrievalStatus::NoMatches) {
            result.status = RetrievalStatus::Degraded;
            result.error = ErrorKind::CollaboratorUnavailable;
        }
    }
    return result;
}

CommitResult add_memory(CoreContext& ctx, const MemoryNode& candidate, const std::string& ns) {
    std::lock_guard<std::mutex> lock(ctx.locks.for_namespace(ns));
    return ctx.checker->check_and_commit(candidate, ns);
}

} // namespace memweave
