#pragma once
#include "../graph_store.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace memweave {

// SQLite-backed graph store: nodes with JSON metadata and an embedding BLOB,
// an FTS5 index over text/key/tags, typed edges, per-namespace dimension.
class SqliteGraphStore : public GraphStore {
public:
    explicit SqliteGraphStore(const std::string& path,
                              uint32_t fixed_dimension = 0,
                              int busy_timeout_ms = 5000);
    ~SqliteGraphStore() override;

    // Non-copyable
    SqliteGraphStore(const SqliteGraphStore&) = delete;
    SqliteGraphStore& operator=(const SqliteGraphStore&) = delete;

    std::string backend_name() const override { return "sqlite"; }

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
    void init_schema();
    bool exec(const char* sql);

    // Callers hold mutex_.
    uint32_t dimension_locked(const std::string& ns);
    bool set_dimension_locked(const std::string& ns, uint32_t dim);
    std::optional<MemoryNode> get_node_locked(const std::string& id, const std::string& ns);
    bool insert_node_locked(const MemoryNode& node, const std::string& ns);
    bool check_edge_locked(const MemoryEdge& edge, const std::string& ns);
    bool insert_edge_locked(const MemoryEdge& edge, const std::string& ns);

    sqlite3* db_ = nullptr;
    std::string path_;
    uint32_t fixed_dimension_;
    mutable std::mutex mutex_;
};

} // namespace memweave
