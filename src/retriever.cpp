#include "retriever.hpp"
#include "memory/vector.hpp"
#include "util.hpp"
#include <algorithm>
#include <iostream>
#include <unordered_map>
#include <unordered_set>

namespace memweave {

const char* retrieval_status_to_string(RetrievalStatus s) {
    switch (s) {
        case RetrievalStatus::Ok:          return "ok";
        case RetrievalStatus::NoMatches:   return "no_matches";
        case RetrievalStatus::Degraded:    return "degraded";
        case RetrievalStatus::Unavailable: return "unavailable";
        case RetrievalStatus::Cancelled:   return "cancelled";
    }
    return "ok";
}

namespace {

struct Candidate {
    MemoryNode node;
    bool has_sim = false;
    double sim = 0.0;            // normalized to [0,1]
    bool keyword = false;
    double keyword_fraction = 0.0;
    bool graph = false;
    double linked_score = 0.0;   // best fused score of a keyword node linking here
    double score = 0.0;
};

bool cancelled(const std::atomic<bool>* cancel) {
    return cancel && cancel->load();
}

bool in_scope(const MemoryNode& node, std::optional<MemoryType> scope) {
    return node.status == NodeStatus::Activated &&
           (!scope || node.memory_type == *scope);
}

// keys ∪ tags, case-insensitively deduplicated, order kept
std::vector<std::string> keyword_terms(const ParsedTaskGoal& goal) {
    std::vector<std::string> terms;
    std::unordered_set<std::string> seen;
    auto add = [&](const std::string& t) {
        std::string term = trim(t);
        if (term.empty()) return;
        if (seen.insert(to_lower(term)).second) terms.push_back(term);
    };
    for (const auto& k : goal.keys) add(k);
    for (const auto& t : goal.tags) add(t);
    return terms;
}

} // namespace

HybridRetriever::HybridRetriever(GraphStore& store, const RetrieverConfig& config,
                                 Embedder* embedder)
    : store_(store), config_(config), embedder_(embedder) {}

RetrievalResult HybridRetriever::retrieve(const ParsedTaskGoal& goal,
                                          const Embedding& query_embedding,
                                          std::optional<MemoryType> scope,
                                          uint32_t top_k,
                                          const std::string& ns,
                                          const std::atomic<bool>* cancel) {
    RetrievalResult result;
    if (top_k == 0) top_k = config_.top_k;
    const uint32_t pool = top_k * std::max<uint32_t>(1, config_.candidate_multiplier);

    uint32_t attempted = 0;
    uint32_t failed = 0;
    auto stage_failed = [&](const char* stage, const CollaboratorError& e) {
        failed++;
        result.error = e.kind();
        result.errors.push_back(std::string(stage) + ": " + e.what());
        std::cerr << "[retriever] " << stage << " stage failed (ns=" << ns << ", "
                  << error_kind_to_string(e.kind()) << "): " << e.what() << "\n";
    };
    auto finish_cancelled = [&]() {
        result.nodes.clear();
        result.status = RetrievalStatus::Cancelled;
        result.error = ErrorKind::Cancelled;
        return result;
    };

    std::unordered_map<std::string, Candidate> candidates;
    auto note_similarity = [&](MemoryNode node) {
        double sim = unit_similarity(node.score);
        auto& c = candidates[node.id];
        if (c.node.id.empty()) c.node = std::move(node);
        if (!c.has_sim || sim > c.sim) {
            c.sim = sim;
            c.has_sim = true;
        }
    };

    // Vector stage: query embedding plus embedded goal hints
    std::vector<Embedding> queries;
    if (!query_embedding.empty()) queries.push_back(query_embedding);
    if (embedder_ && !goal.memories.empty()) {
        attempted++;
        try {
            for (auto& v : embedder_->embed_batch(goal.memories)) {
                if (!v.empty()) queries.push_back(std::move(v));
            }
        } catch (const CollaboratorError& e) {
            stage_failed("hint embedding", e);
        }
    }
    if (!queries.empty()) {
        attempted++;
        try {
            for (const auto& q : queries) {
                for (auto& node : store_.vector_search(q, ns, scope, pool)) {
                    if (in_scope(node, scope)) note_similarity(std::move(node));
                }
            }
        } catch (const CollaboratorError& e) {
            stage_failed("vector", e);
        }
    }
    if (cancelled(cancel)) return finish_cancelled();

    // Keyword stage
    auto terms = keyword_terms(goal);
    if (!terms.empty()) {
        attempted++;
        try {
            for (auto& node : store_.keyword_search(terms, ns, scope, pool)) {
                if (!in_scope(node, scope)) continue;
                double fraction = node.score;
                auto& c = candidates[node.id];
                if (c.node.id.empty()) c.node = std::move(node);
                c.keyword = true;
                c.keyword_fraction = std::max(c.keyword_fraction, fraction);
            }
        } catch (const CollaboratorError& e) {
            stage_failed("keyword", e);
        }
    }
    if (cancelled(cancel)) return finish_cancelled();

    // Fusion for everything found so far
    const bool vector_signal = !queries.empty();
    for (auto& [id, c] : candidates) {
        if (!c.has_sim && vector_signal && !c.node.embedding.empty()) {
            double best = -1.0;
            for (const auto& q : queries) {
                if (q.size() != c.node.embedding.size()) continue;
                best = std::max(best, cosine_similarity(q, c.node.embedding));
            }
            c.sim = unit_similarity(best);
            c.has_sim = true;
        }
        double base = c.has_sim ? c.sim : (vector_signal ? 0.0 : c.keyword_fraction);
        c.score = config_.vector_weight * base + (c.keyword ? config_.keyword_boost : 0.0);
    }

    // Graph stage: one hop along RelatedTo / Aggregates from keyword matches
    bool expand = candidates.size() < top_k ||
                  (goal.goal_type == GoalType::Retrieval && !goal.keys.empty());
    std::vector<std::pair<std::string, double>> seeds;
    for (const auto& [id, c] : candidates) {
        if (c.keyword) seeds.emplace_back(id, c.score);
    }
    if (expand && !seeds.empty()) {
        attempted++;
        std::sort(seeds.begin(), seeds.end());
        const std::vector<RelationType> link_types = {RelationType::RelatedTo,
                                                      RelationType::Aggregates};
        try {
            for (const auto& [seed_id, seed_score] : seeds) {
                if (cancelled(cancel)) return finish_cancelled();
                for (auto& node : store_.traverse(seed_id, link_types, 1, ns)) {
                    if (!in_scope(node, scope)) continue;
                    auto& c = candidates[node.id];
                    if (c.node.id.empty()) {
                        c.node = std::move(node);
                        c.graph = true;
                    }
                    if (c.graph) c.linked_score = std::max(c.linked_score, seed_score);
                }
            }
        } catch (const CollaboratorError& e) {
            stage_failed("graph", e);
        }
        for (auto& [id, c] : candidates) {
            if (c.graph) c.score = c.linked_score - config_.traversal_penalty;
        }
    }
    if (cancelled(cancel)) return finish_cancelled();

    std::vector<MemoryNode> ranked;
    ranked.reserve(candidates.size());
    for (auto& [id, c] : candidates) {
        c.node.score = c.score;
        ranked.push_back(std::move(c.node));
    }
    std::sort(ranked.begin(), ranked.end(), [](const MemoryNode& a, const MemoryNode& b) {
        if (a.score != b.score) return a.score > b.score;
        if (a.updated_at != b.updated_at) return a.updated_at > b.updated_at;
        return a.id < b.id;
    });
    if (ranked.size() > top_k) ranked.resize(top_k);

    if (attempted > 0 && failed == attempted) {
        result.status = RetrievalStatus::Unavailable;
        return result;
    }
    result.nodes = std::move(ranked);
    if (failed > 0) {
        result.status = RetrievalStatus::Degraded;
    } else {
        result.status = result.nodes.empty() ? RetrievalStatus::NoMatches : RetrievalStatus::Ok;
    }
    return result;
}

} // namespace memweave
