#pragma once
#include "memory.hpp"
#include "errors.hpp"
#include "config.hpp"
#include "graph_store.hpp"
#include "embedder.hpp"
#include "provider.hpp"
#include <atomic>
#include <optional>
#include <string>
#include <vector>

namespace memweave {

enum class ReasoningStatus {
    Ok,
    Partial,   // some pairs, chains, clusters or commits failed
    Failed,    // nothing could be computed (anchor missing, no neighbors lookup, ...)
    Cancelled  // cancelled before the commit phase; nothing was written
};

const char* reasoning_status_to_string(ReasoningStatus s);

// What process_node wrote. Only committed items are listed.
struct ReasoningResult {
    std::vector<MemoryEdge> relations;        // Causes / RelatedTo edges
    std::vector<MemoryNode> inferred_nodes;
    std::vector<MemoryEdge> sequence_links;   // Follows edges, earlier -> later
    std::vector<MemoryNode> aggregate_nodes;
    uint32_t failures = 0;
    std::vector<std::string> errors;
    ReasoningStatus status = ReasoningStatus::Ok;
    ErrorKind error = ErrorKind::None;
};

// LLM classification of one (anchor, neighbor) pair.
struct PairRelation {
    std::optional<RelationType> relation;  // nullopt = NONE
    bool anchor_first = true;              // "A->B"
    double confidence = 0.0;
};

// Parse a relation answer. Returns nullopt when the shape is wrong.
std::optional<PairRelation> parse_pair_relation(const std::string& llm_text);

// Causes graph over a small node set: every simple directed chain of 2-3
// edges that contains must_contain, as ordered node ids.
std::vector<std::vector<std::string>> find_cause_chains(const std::vector<MemoryEdge>& causes,
                                                        const std::string& must_contain);

// Nodes transitively sharing >=2 tags or the same non-empty key with the
// anchor (anchor first). Aggregate nodes never join a cluster.
std::vector<const MemoryNode*> anchor_cluster(const MemoryNode& anchor,
                                              const std::vector<MemoryNode>& neighbors);

// Mines causal and temporal links around one anchor node, infers new facts
// from Causes chains and summarizes the anchor's topic cluster.
//
// All computation happens before any write; a cancel raised before the
// commit phase discards everything.
class RelationReasoningEngine {
public:
    RelationReasoningEngine(GraphStore& store, Provider& provider, Embedder& embedder,
                            const ReasoningConfig& config, const std::string& model,
                            double temperature = 0.0);

    // top_k == 0 uses the configured default.
    ReasoningResult process_node(const MemoryNode& anchor,
                                 const std::vector<std::string>& exclude_ids,
                                 uint32_t top_k,
                                 const std::string& ns,
                                 const std::atomic<bool>* cancel = nullptr);

private:
    struct PairOutcome {
        bool ok = false;
        PairRelation relation;
        std::string error;
    };

    PairOutcome classify_pair(const MemoryNode& anchor, const MemoryNode& neighbor);
    std::vector<PairOutcome> classify_all(const MemoryNode& anchor,
                                          const std::vector<MemoryNode>& neighbors,
                                          const std::atomic<bool>* cancel);

    // LLM call returning a {"text","key","tags"} object, with bounded attempts.
    std::optional<MemoryNode> draft_node(const std::string& prompt, std::string& error);

    GraphStore& store_;
    Provider& provider_;
    Embedder& embedder_;
    ReasoningConfig config_;
    std::string model_;
    double temperature_;
};

} // namespace memweave
