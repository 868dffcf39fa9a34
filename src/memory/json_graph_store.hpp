#pragma once
#include "../graph_store.hpp"
#include <mutex>
#include <string>
#include <vector>
#include <unordered_map>

namespace memweave {

// Graph store kept in memory and persisted as one JSON document.
// An empty path keeps everything in memory (used by tests and dry runs).
class JsonGraphStore : public GraphStore {
public:
    explicit JsonGraphStore(const std::string& path, uint32_t fixed_dimension = 0);

    std::string backend_name() const override { return "json"; }

    bool add_node(const MemoryNode& node, const std::string& ns) override;
    std::optional<MemoryNode> get_node(const std::string& id, const std::string& ns) override;
    bool update_node(const MemoryNode& node, const std::string& ns) override;
    bool delete_node(const std::string& id, const std::string& ns) override;
    bool add_edge(const MemoryEdge& edge, const std::string& ns) override;
    std::vector<MemoryEdge> edges(const std::string& node_id, const std::string& ns) override;

    std::vector<MemoryNode> vector_search(const Embedding& query, const std::string& ns,
                                          std::optional<MemoryType> scope,
                                          uint32_t k) override;
    std::vector<MemoryNode> keyword_search(const std::vector<std::string>& terms,
                                           const std::string& ns,
                                           std::optional<MemoryType> scope,
                                           uint32_t limit) override;

    bool commit_artifact(const MemoryNode& node, const std::vector<MemoryEdge>& edges,
                         const std::string& ns) override;

    uint32_t count(const std::string& ns) override;
    uint32_t dimension(const std::string& ns) override;

    std::string snapshot_export(const std::string& ns) override;
    uint32_t snapshot_import(const std::string& json_str, const std::string& ns) override;

private:
    struct Namespace {
        uint32_t dimension = 0;
        std::vector<MemoryNode> nodes;
        std::unordered_map<std::string, size_t> id_index; // id -> nodes index
        std::vector<MemoryEdge> edges;
    };

    void load();
    void save();
    static void rebuild_index(Namespace& space);
    Namespace& space(const std::string& ns);

    // Callers hold mutex_.
    bool insert_node_locked(Namespace& space, const MemoryNode& node);
    bool check_edge_locked(const Namespace& space, const MemoryEdge& edge) const;

    std::string path_;
    uint32_t fixed_dimension_;
    std::unordered_map<std::string, Namespace> spaces_;
    mutable std::mutex mutex_;
};

} // namespace memweave
