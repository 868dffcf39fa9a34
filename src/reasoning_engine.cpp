#include "reasoning_engine.hpp"
#include "llm_json.hpp"
#include "prompt.hpp"
#include "util.hpp"
#include <algorithm>
#include <functional>
#include <iostream>
#include <map>
#include <numeric>
#include <thread>
#include <unordered_map>
#include <unordered_set>

using json = nlohmann::json;

namespace memweave {

const char* reasoning_status_to_string(ReasoningStatus s) {
    switch (s) {
        case ReasoningStatus::Ok:        return "ok";
        case ReasoningStatus::Partial:   return "partial";
        case ReasoningStatus::Failed:    return "failed";
        case ReasoningStatus::Cancelled: return "cancelled";
    }
    return "ok";
}

static bool cancelled(const std::atomic<bool>* cancel) {
    return cancel && cancel->load();
}

std::optional<PairRelation> parse_pair_relation(const std::string& llm_text) {
    auto parsed = parse_llm_json(llm_text);
    if (!parsed || !parsed.value->is_object()) return std::nullopt;
    const json& obj = *parsed.value;
    if (!obj.contains("relation") || !obj["relation"].is_string()) return std::nullopt;

    PairRelation out;
    std::string name = to_lower(trim(obj["relation"].get<std::string>()));
    if (name == "none" || name.empty()) return out;

    auto type = relation_type_from_string(name);
    if (!type || (*type != RelationType::Causes && *type != RelationType::Follows &&
                  *type != RelationType::RelatedTo)) {
        return std::nullopt;
    }
    out.relation = type;

    if (obj.contains("direction") && obj["direction"].is_string()) {
        std::string dir = replace_all(to_lower(obj["direction"].get<std::string>()), " ", "");
        if (dir == "b->a") out.anchor_first = false;
        else if (dir != "a->b") return std::nullopt;
    }
    out.confidence = 1.0;
    if (obj.contains("confidence")) {
        if (!obj["confidence"].is_number()) return std::nullopt;
        out.confidence = std::clamp(obj["confidence"].get<double>(), 0.0, 1.0);
    }
    return out;
}

std::vector<std::vector<std::string>> find_cause_chains(const std::vector<MemoryEdge>& causes,
                                                        const std::string& must_contain) {
    std::map<std::string, std::vector<std::string>> out_edges;
    for (const auto& e : causes) {
        if (e.relation_type != RelationType::Causes || e.source_id == e.target_id) continue;
        auto& targets = out_edges[e.source_id];
        if (std::find(targets.begin(), targets.end(), e.target_id) == targets.end()) {
            targets.push_back(e.target_id);
        }
    }
    for (auto& [id, targets] : out_edges) std::sort(targets.begin(), targets.end());

    std::vector<std::vector<std::string>> chains;
    std::vector<std::string> path;
    std::function<void(const std::string&)> walk = [&](const std::string& node) {
        path.push_back(node);
        size_t hops = path.size() - 1;
        if (hops >= 2 &&
            std::find(path.begin(), path.end(), must_contain) != path.end()) {
            chains.push_back(path);
        }
        if (hops < 3) {
            auto it = out_edges.find(node);
            if (it != out_edges.end()) {
                for (const auto& next : it->second) {
                    if (std::find(path.begin(), path.end(), next) != path.end()) continue;
                    walk(next);
                }
            }
        }
        path.pop_back();
    };
    for (const auto& [start, _] : out_edges) walk(start);
    return chains;
}

std::vector<const MemoryNode*> anchor_cluster(const MemoryNode& anchor,
                                              const std::vector<MemoryNode>& neighbors) {
    std::vector<const MemoryNode*> nodes{&anchor};
    for (const auto& n : neighbors) {
        if (n.node_type != "aggregate") nodes.push_back(&n);
    }
    if (anchor.node_type == "aggregate") return {&anchor};

    // union-find
    std::vector<size_t> parent(nodes.size());
    std::iota(parent.begin(), parent.end(), 0);
    std::function<size_t(size_t)> find = [&](size_t i) {
        while (parent[i] != i) {
            parent[i] = parent[parent[i]];
            i = parent[i];
        }
        return i;
    };
    for (size_t i = 0; i < nodes.size(); ++i) {
        for (size_t j = i + 1; j < nodes.size(); ++j) {
            bool same_key = !nodes[i]->key.empty() &&
                            to_lower(nodes[i]->key) == to_lower(nodes[j]->key);
            if (same_key || shared_tag_count(*nodes[i], *nodes[j]) >= 2) {
                parent[find(i)] = find(j);
            }
        }
    }

    std::vector<const MemoryNode*> cluster;
    size_t root = find(0);
    for (size_t i = 0; i < nodes.size(); ++i) {
        if (find(i) == root) cluster.push_back(nodes[i]);
    }
    return cluster;
}

RelationReasoningEngine::RelationReasoningEngine(GraphStore& store, Provider& provider,
                                                 Embedder& embedder,
                                                 const ReasoningConfig& config,
                                                 const std::string& model, double temperature)
    : store_(store), provider_(provider), embedder_(embedder), config_(config),
      model_(model), temperature_(temperature) {}

RelationReasoningEngine::PairOutcome
RelationReasoningEngine::classify_pair(const MemoryNode& anchor, const MemoryNode& neighbor) {
    PairOutcome outcome;
    std::string prompt = build_relation_prompt(anchor, neighbor);
    uint32_t attempts = std::max<uint32_t>(1, config_.max_attempts);
    for (uint32_t attempt = 0; attempt < attempts; ++attempt) {
        try {
            std::string reply = provider_.chat_simple(build_reasoning_system_prompt(), prompt,
                                                      model_, temperature_);
            auto relation = parse_pair_relation(reply);
            if (relation) {
                outcome.ok = true;
                outcome.relation = *relation;
                return outcome;
            }
            outcome.error = "malformed relation answer for " + neighbor.id;
        } catch (const CollaboratorError& e) {
            outcome.error = "relation call for " + neighbor.id + " failed: " + e.what();
        } catch (const std::exception& e) {
            outcome.error = "relation call for " + neighbor.id + " raised: " + e.what();
        }
    }
    return outcome;
}

std::vector<RelationReasoningEngine::PairOutcome>
RelationReasoningEngine::classify_all(const MemoryNode& anchor,
                                      const std::vector<MemoryNode>& neighbors,
                                      const std::atomic<bool>* cancel) {
    std::vector<PairOutcome> outcomes(neighbors.size());
    std::atomic<size_t> next{0};
    auto worker = [&]() {
        for (;;) {
            size_t i = next.fetch_add(1);
            if (i >= neighbors.size() || cancelled(cancel)) return;
            outcomes[i] = classify_pair(anchor, neighbors[i]);
        }
    };

    size_t threads = std::min<size_t>(std::max<uint32_t>(1, config_.parallelism),
                                      neighbors.size());
    if (threads <= 1) {
        worker();
        return outcomes;
    }
    std::vector<std::thread> pool;
    pool.reserve(threads);
    for (size_t t = 0; t < threads; ++t) pool.emplace_back(worker);
    for (auto& th : pool) th.join();
    return outcomes;
}

std::optional<MemoryNode> RelationReasoningEngine::draft_node(const std::string& prompt,
                                                              std::string& error) {
    uint32_t attempts = std::max<uint32_t>(1, config_.max_attempts);
    for (uint32_t attempt = 0; attempt < attempts; ++attempt) {
        try {
            std::string reply = provider_.chat_simple(build_reasoning_system_prompt(), prompt,
                                                      model_, temperature_);
            auto parsed = parse_llm_json(reply);
            if (!parsed || !parsed.value->is_object()) {
                error = "malformed answer: " + (parsed ? std::string("not an object")
                                                       : parsed.error);
                continue;
            }
            const json& obj = *parsed.value;
            if (!obj.contains("text") || !obj["text"].is_string() ||
                trim(obj["text"].get<std::string>()).empty()) {
                error = "answer has no text";
                continue;
            }
            MemoryNode node;
            node.text = trim(obj["text"].get<std::string>());
            if (obj.contains("key") && obj["key"].is_string()) {
                node.key = trim(obj["key"].get<std::string>());
            }
            if (obj.contains("tags") && obj["tags"].is_array()) {
                for (const auto& t : obj["tags"]) {
                    if (t.is_string() && !trim(t.get<std::string>()).empty()) {
                        node.tags.insert(trim(t.get<std::string>()));
                    }
                }
            }
            return node;
        } catch (const CollaboratorError& e) {
            error = e.what();
        } catch (const std::exception& e) {
            error = std::string("unexpected error: ") + e.what();
        }
    }
    return std::nullopt;
}

ReasoningResult RelationReasoningEngine::process_node(const MemoryNode& anchor,
                                                      const std::vector<std::string>& exclude_ids,
                                                      uint32_t top_k,
                                                      const std::string& ns,
                                                      const std::atomic<bool>* cancel) {
    ReasoningResult result;
    if (top_k == 0) top_k = config_.top_k;

    auto fail = [&](ErrorKind kind, const std::string& msg) {
        std::cerr << "[reasoning] " << msg << " (ns=" << ns << ", anchor=" << anchor.id << ")\n";
        result.status = ReasoningStatus::Failed;
        result.error = kind;
        result.errors.push_back(msg);
        return result;
    };
    auto discard = [&]() {
        ReasoningResult empty;
        empty.status = ReasoningStatus::Cancelled;
        empty.error = ErrorKind::Cancelled;
        return empty;
    };
    auto note_failure = [&](const std::string& msg) {
        std::cerr << "[reasoning] " << msg << " (ns=" << ns << ")\n";
        result.failures++;
        result.errors.push_back(msg);
    };

    // 1. Neighbors
    std::vector<MemoryNode> neighbors;
    try {
        if (!store_.get_node(anchor.id, ns)) {
            return fail(ErrorKind::NotFound, "anchor not in store");
        }
        Embedding query = anchor.embedding.empty() ? embedder_.embed(anchor.text)
                                                   : anchor.embedding;
        std::unordered_set<std::string> excluded(exclude_ids.begin(), exclude_ids.end());
        excluded.insert(anchor.id);
        auto found = store_.vector_search(query, ns, std::nullopt,
                                          top_k + static_cast<uint32_t>(excluded.size()));
        for (auto& node : found) {
            if (excluded.count(node.id)) continue;
            neighbors.push_back(std::move(node));
            if (neighbors.size() >= top_k) break;
        }
    } catch (const CollaboratorError& e) {
        return fail(e.kind(), std::string("neighbor lookup failed: ") + e.what());
    }
    if (cancelled(cancel)) return discard();
    if (neighbors.empty()) return result;

    // 2. Pairwise classification on the worker pool
    auto outcomes = classify_all(anchor, neighbors, cancel);
    if (cancelled(cancel)) return discard();

    std::vector<MemoryEdge> relations;
    std::vector<MemoryEdge> sequence;
    size_t pair_failures = 0;
    for (size_t i = 0; i < neighbors.size(); ++i) {
        const auto& outcome = outcomes[i];
        const auto& neighbor = neighbors[i];
        if (!outcome.ok) {
            pair_failures++;
            note_failure(outcome.error);
            continue;
        }
        const auto& rel = outcome.relation;
        if (!rel.relation) continue;

        if (*rel.relation != RelationType::Follows) {
            MemoryEdge edge;
            edge.source_id = rel.anchor_first ? anchor.id : neighbor.id;
            edge.target_id = rel.anchor_first ? neighbor.id : anchor.id;
            edge.relation_type = *rel.relation;
            edge.confidence = rel.confidence;
            relations.push_back(edge);
        }
        // 4. Sequence links for causal or temporal pairs, earlier -> later
        if ((*rel.relation == RelationType::Causes || *rel.relation == RelationType::Follows) &&
            anchor.updated_at != neighbor.updated_at) {
            bool anchor_earlier = anchor.updated_at < neighbor.updated_at;
            MemoryEdge link;
            link.source_id = anchor_earlier ? anchor.id : neighbor.id;
            link.target_id = anchor_earlier ? neighbor.id : anchor.id;
            link.relation_type = RelationType::Follows;
            link.confidence = rel.confidence;
            sequence.push_back(link);
        }
    }
    if (pair_failures == neighbors.size()) {
        result.status = ReasoningStatus::Failed;
        result.error = ErrorKind::CollaboratorUnavailable;
        return result;
    }

    // 3. Multi-hop inference over new and persisted Causes edges
    std::unordered_map<std::string, const MemoryNode*> members{{anchor.id, &anchor}};
    for (const auto& n : neighbors) members[n.id] = &n;

    std::map<std::pair<std::string, std::string>, double> cause_conf;
    try {
        for (const auto& [id, node] : members) {
            for (const auto& e : store_.edges(id, ns)) {
                if (e.relation_type != RelationType::Causes) continue;
                if (!members.count(e.source_id) || !members.count(e.target_id)) continue;
                auto& c = cause_conf[{e.source_id, e.target_id}];
                c = std::max(c, e.confidence);
            }
        }
    } catch (const CollaboratorError& e) {
        note_failure(std::string("persisted edge lookup failed: ") + e.what());
    }
    for (const auto& e : relations) {
        if (e.relation_type != RelationType::Causes) continue;
        auto& c = cause_conf[{e.source_id, e.target_id}];
        c = std::max(c, e.confidence);
    }
    std::vector<MemoryEdge> causes;
    for (const auto& [ends, conf] : cause_conf) {
        causes.push_back({ends.first, ends.second, RelationType::Causes, conf});
    }

    struct Artifact {
        MemoryNode node;
        std::vector<MemoryEdge> edges;
    };
    // Stored nodes of node_type that point at member_id with a type edge
    auto synthesized_over = [&](const std::string& member_id, RelationType type,
                                const std::string& node_type) {
        std::vector<MemoryNode> found;
        for (const auto& e : store_.edges(member_id, ns)) {
            if (e.relation_type != type || e.target_id != member_id) continue;
            auto node = store_.get_node(e.source_id, ns);
            if (node && node->node_type == node_type) found.push_back(std::move(*node));
        }
        return found;
    };
    std::vector<Artifact> inferred;
    const uint64_t now = epoch_seconds();

    for (const auto& chain : find_cause_chains(causes, anchor.id)) {
        if (cancelled(cancel)) return discard();
        std::vector<const MemoryNode*> chain_nodes;
        double confidence = 1.0;
        for (size_t i = 0; i < chain.size(); ++i) {
            chain_nodes.push_back(members.at(chain[i]));
            if (i + 1 < chain.size()) {
                confidence = std::min(confidence, cause_conf[{chain[i], chain[i + 1]}]);
            }
        }
        try {
            auto existing = synthesized_over(chain.front(), RelationType::RelatedTo, "inferred");
            bool covered = std::any_of(existing.begin(), existing.end(), [&](const MemoryNode& n) {
                return !n.sources.empty() && n.sources[0].node_ids == chain;
            });
            if (covered) continue;
        } catch (const CollaboratorError& e) {
            note_failure("inferred node lookup failed for chain starting at " + chain.front() +
                         ": " + e.what());
            continue;
        }
        std::string error;
        auto drafted = draft_node(build_inference_prompt(chain_nodes), error);
        if (!drafted) {
            note_failure("inference failed for chain starting at " + chain.front() + ": " + error);
            continue;
        }
        Artifact a;
        a.node = std::move(*drafted);
        a.node.id = generate_id();
        a.node.node_type = "inferred";
        a.node.memory_type = anchor.memory_type;
        a.node.confidence = confidence;
        a.node.background = "inferred from a chain of " + std::to_string(chain.size()) + " facts";
        a.node.created_at = now;
        a.node.updated_at = now;
        SourceRef src;
        src.type = "inferred";
        src.node_ids = chain;
        a.node.sources.push_back(std::move(src));
        for (const auto& id : chain) {
            a.edges.push_back({a.node.id, id, RelationType::RelatedTo, confidence});
        }
        inferred.push_back(std::move(a));
    }

    // 5. Aggregate for the anchor's cluster
    std::vector<Artifact> aggregates;
    auto cluster = anchor_cluster(anchor, neighbors);
    bool summarized = false;
    if (cluster.size() >= 2) {
        // A stored aggregate over every member already summarizes this cluster
        try {
            for (const auto& agg : synthesized_over(anchor.id, RelationType::Aggregates, "aggregate")) {
                std::unordered_set<std::string> covered;
                for (const auto& src : agg.sources) {
                    covered.insert(src.node_ids.begin(), src.node_ids.end());
                }
                if (std::all_of(cluster.begin(), cluster.end(), [&](const MemoryNode* m) {
                        return covered.count(m->id) > 0;
                    })) {
                    summarized = true;
                    break;
                }
            }
        } catch (const CollaboratorError& e) {
            note_failure(std::string("aggregate lookup failed: ") + e.what());
            summarized = true;
        }
    }
    if (cluster.size() >= 2 && !summarized) {
        if (cancelled(cancel)) return discard();
        std::string error;
        auto drafted = draft_node(build_aggregate_prompt(cluster), error);
        if (!drafted) {
            note_failure("aggregate summary failed: " + error);
        } else {
            Artifact a;
            a.node = std::move(*drafted);
            a.node.id = generate_id();
            a.node.node_type = "aggregate";
            a.node.memory_type = anchor.memory_type;
            a.node.background = "aggregate of " + std::to_string(cluster.size()) + " facts";
            a.node.created_at = now;
            a.node.updated_at = now;
            for (const auto* member : cluster) {
                SourceRef src;
                src.type = "aggregate";
                src.content = member->text;
                src.node_ids = {member->id};
                a.node.sources.push_back(std::move(src));
                a.edges.push_back({a.node.id, member->id, RelationType::Aggregates, 1.0});
            }
            aggregates.push_back(std::move(a));
        }
    }

    // Embeddings for every new node in one batch
    std::vector<std::string> texts;
    for (const auto& a : inferred) texts.push_back(a.node.text);
    for (const auto& a : aggregates) texts.push_back(a.node.text);
    if (!texts.empty()) {
        try {
            auto vectors = embedder_.embed_batch(texts);
            if (vectors.size() != texts.size()) {
                throw CollaboratorError(ErrorKind::MalformedResponse,
                                        "embedder returned wrong number of vectors");
            }
            size_t v = 0;
            for (auto& a : inferred) a.node.embedding = std::move(vectors[v++]);
            for (auto& a : aggregates) a.node.embedding = std::move(vectors[v++]);
        } catch (const CollaboratorError& e) {
            note_failure(std::string("embedding new nodes failed: ") + e.what());
            inferred.clear();
            aggregates.clear();
        }
    }

    if (cancelled(cancel)) return discard();

    // Commit phase
    try {
        for (const auto& e : relations) {
            if (store_.add_edge(e, ns)) result.relations.push_back(e);
            else note_failure("store rejected " + relation_type_to_string(e.relation_type) +
                              " edge " + e.source_id + " -> " + e.target_id);
        }
        for (const auto& e : sequence) {
            if (store_.add_edge(e, ns)) result.sequence_links.push_back(e);
            else note_failure("store rejected FOLLOWS edge " + e.source_id + " -> " + e.target_id);
        }
        for (auto& a : inferred) {
            if (store_.commit_artifact(a.node, a.edges, ns)) {
                result.inferred_nodes.push_back(std::move(a.node));
            } else {
                note_failure("store rejected inferred node " + a.node.id);
            }
        }
        for (auto& a : aggregates) {
            if (store_.commit_artifact(a.node, a.edges, ns)) {
                result.aggregate_nodes.push_back(std::move(a.node));
            } else {
                note_failure("store rejected aggregate node " + a.node.id);
            }
        }
    } catch (const CollaboratorError& e) {
        note_failure(std::string("store unavailable during commit: ") + e.what());
        result.error = e.kind();
    }

    if (result.failures > 0) result.status = ReasoningStatus::Partial;
    return result;
}

} // namespace memweave
