#pragma once
#include "memory.hpp"
#include "errors.hpp"
#include "config.hpp"
#include "graph_store.hpp"
#include "embedder.hpp"
#include <atomic>
#include <optional>
#include <string>
#include <vector>

namespace memweave {

enum class RetrievalStatus {
    Ok,
    NoMatches,   // every stage ran, nothing found
    Degraded,    // at least one stage failed, results may be incomplete
    Unavailable, // every attempted stage failed, no results
    Cancelled    // cancel flag raised, partial results discarded
};

const char* retrieval_status_to_string(RetrievalStatus s);

struct RetrievalResult {
    std::vector<MemoryNode> nodes;       // best first, score set
    RetrievalStatus status = RetrievalStatus::NoMatches;
    ErrorKind error = ErrorKind::None;   // kind of the last stage failure
    std::vector<std::string> errors;     // one line per failed stage
};

// Executes a ParsedTaskGoal against the graph: vector, keyword and one-hop
// graph stages fused into one ranked list of Activated nodes.
//
// The embedder is optional; when attached, goal.memories hints are embedded
// and searched alongside the query embedding.
class HybridRetriever {
public:
    HybridRetriever(GraphStore& store, const RetrieverConfig& config,
                    Embedder* embedder = nullptr);

    // top_k == 0 uses the configured default. Never throws for collaborator
    // failures; they show up in the status.
    RetrievalResult retrieve(const ParsedTaskGoal& goal,
                             const Embedding& query_embedding,
                             std::optional<MemoryType> scope,
                             uint32_t top_k,
                             const std::string& ns,
                             const std::atomic<bool>* cancel = nullptr);

    const RetrieverConfig& config() const { return config_; }

private:
    GraphStore& store_;
    RetrieverConfig config_;
    Embedder* embedder_;
};

} // namespace memweave
