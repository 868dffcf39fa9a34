#pragma once
#include "memory.hpp"
#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <cstdint>

namespace memweave {

struct Config;

// Abstract memory graph backend. Every call is scoped to a namespace
// (tenant / cube). Implementations are internally synchronized.
//
// Invariant violations (dimension mismatch, missing edge endpoint, bad
// FOLLOWS ordering, ...) are reported by returning false and never modify
// state. An unreachable backend throws CollaboratorError.
class GraphStore {
public:
    virtual ~GraphStore() = default;

    virtual std::string backend_name() const = 0;

    // Insert a node. The first embedded node fixes the namespace dimension
    // unless the store was configured with one. Returns false on an
    // invariant violation or duplicate id.
    virtual bool add_node(const MemoryNode& node, const std::string& ns) = 0;

    virtual std::optional<MemoryNode> get_node(const std::string& id,
                                               const std::string& ns) = 0;

    // Replace an existing node (same id). Returns false if absent or invalid.
    virtual bool update_node(const MemoryNode& node, const std::string& ns) = 0;

    // Remove a node and every edge touching it. Explicit caller action only.
    virtual bool delete_node(const std::string& id, const std::string& ns) = 0;

    // Returns false when an endpoint is missing or the edge is invalid.
    virtual bool add_edge(const MemoryEdge& edge, const std::string& ns) = 0;

    // All edges with node_id as source or target.
    virtual std::vector<MemoryEdge> edges(const std::string& node_id,
                                          const std::string& ns) = 0;

    // Activated nodes closest to the query, best first. score = cosine [-1,1].
    virtual std::vector<MemoryNode> vector_search(const Embedding& query,
                                                  const std::string& ns,
                                                  std::optional<MemoryType> scope,
                                                  uint32_t k) = 0;

    // Activated nodes whose key/tags/text match any term (case-insensitive,
    // exact or substring). score = fraction of matched terms.
    virtual std::vector<MemoryNode> keyword_search(const std::vector<std::string>& terms,
                                                   const std::string& ns,
                                                   std::optional<MemoryType> scope,
                                                   uint32_t limit) = 0;

    // Breadth-first walk over edges of the given types, ignoring direction,
    // up to depth hops. The start node is not included.
    virtual std::vector<MemoryNode> traverse(const std::string& node_id,
                                             const std::vector<RelationType>& types,
                                             uint32_t depth,
                                             const std::string& ns);

    // Add one node plus its edges atomically: either all land or none.
    virtual bool commit_artifact(const MemoryNode& node,
                                 const std::vector<MemoryEdge>& edges,
                                 const std::string& ns) = 0;

    virtual uint32_t count(const std::string& ns) = 0;

    // Embedding dimension of the namespace (0 = not fixed yet).
    virtual uint32_t dimension(const std::string& ns) = 0;

    // Export nodes + edges of a namespace as a JSON document.
    virtual std::string snapshot_export(const std::string& ns) = 0;

    // Import a document produced by snapshot_export. Returns nodes imported.
    virtual uint32_t snapshot_import(const std::string& json_str,
                                     const std::string& ns) = 0;
};

class BackendRegistry;
std::unique_ptr<GraphStore> create_graph_store(const Config& config,
                                               const BackendRegistry& registry);

} // namespace memweave
