#include "sqlite_graph_store.hpp"
#include "node_json.hpp"
#include "vector.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <unordered_map>

namespace memweave {

// Preprocess keyword terms for FTS5: split on non-alphanumeric, skip
// single-char tokens, and OR-join the remainder so that any matching
// token produces results (FTS5 defaults to implicit AND).
static std::string build_fts_query(const std::vector<std::string>& terms) {
    std::string result;
    auto flush = [&result](std::string& token) {
        if (token.size() >= 2) {
            if (!result.empty()) result += " OR ";
            result += token;
        }
        token.clear();
    };
    for (const auto& term : terms) {
        std::string token;
        for (char c : term) {
            if (std::isalnum(static_cast<unsigned char>(c))) {
                token += c;
            } else {
                flush(token);
            }
        }
        flush(token);
    }
    return result;
}

static std::string join_tags(const std::set<std::string>& tags) {
    std::string out;
    for (const auto& t : tags) {
        if (!out.empty()) out += ' ';
        out += t;
    }
    return out;
}

// LIKE wildcards in a term match literally under ESCAPE '\'
static std::string escape_like(const std::string& term) {
    std::string out;
    out.reserve(term.size());
    for (char c : term) {
        if (c == '%' || c == '_' || c == '\\') out += '\\';
        out += c;
    }
    return out;
}

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

// Prepare or throw: a failed prepare means the database is unusable
// (locked past busy_timeout, corrupt, closed).
static void prepare(sqlite3* db, const std::string& sql, StmtGuard& g) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw CollaboratorError(ErrorKind::CollaboratorUnavailable,
                                std::string("sqlite: ") + sqlite3_errmsg(db));
    }
}

static std::string column_text(sqlite3_stmt* stmt, int col) {
    if (auto* v = sqlite3_column_text(stmt, col)) return reinterpret_cast<const char*>(v);
    return {};
}

// Read a node from a statement that selected id, text, metadata, embedding
// (columns 0-3).
static MemoryNode node_from_stmt(sqlite3_stmt* stmt) {
    MemoryNode node;
    node.id = column_text(stmt, 0);
    node.text = column_text(stmt, 1);
    try {
        auto meta = nlohmann::json::parse(column_text(stmt, 2));
        node_metadata_from_json(meta, node);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[store] Unreadable metadata for node " << node.id << ": "
                  << e.what() << "\n";
    }
    node.embedding = deserialize_vector(sqlite3_column_blob(stmt, 3),
                                        static_cast<size_t>(sqlite3_column_bytes(stmt, 3)));
    return node;
}

static constexpr const char* kNodeColumns = "id, text, metadata, embedding";

SqliteGraphStore::SqliteGraphStore(const std::string& path, uint32_t fixed_dimension,
                                   int busy_timeout_ms)
    : path_(path), fixed_dimension_(fixed_dimension) {
    // Ensure parent directory exists
    if (path_ != ":memory:") {
        auto parent = std::filesystem::path(path_).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw std::runtime_error("SqliteGraphStore: failed to open database: " + err);
    }

    sqlite3_busy_timeout(db_, busy_timeout_ms);
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA synchronous=NORMAL;");
    exec("PRAGMA temp_store=MEMORY;");
    exec("PRAGMA foreign_keys=ON;");
    // Allow FTS5 virtual table use inside triggers (required since SQLite 3.37)
    exec("PRAGMA trusted_schema=ON;");

    init_schema();
}

SqliteGraphStore::~SqliteGraphStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SqliteGraphStore::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::cerr << "[store] sqlite: " << (err ? err : "unknown error") << "\n";
        sqlite3_free(err);
        return false;
    }
    return true;
}

void SqliteGraphStore::init_schema() {
    exec("CREATE TABLE IF NOT EXISTS namespaces ("
         "  name      TEXT PRIMARY KEY,"
         "  dimension INTEGER NOT NULL"
         ");");

    exec("CREATE TABLE IF NOT EXISTS nodes ("
         "  namespace   TEXT NOT NULL,"
         "  id          TEXT NOT NULL,"
         "  text        TEXT NOT NULL,"
         "  key         TEXT NOT NULL,"
         "  tags        TEXT NOT NULL,"
         "  memory_type TEXT NOT NULL,"
         "  status      TEXT NOT NULL,"
         "  updated_at  INTEGER NOT NULL,"
         "  metadata    TEXT NOT NULL,"
         "  embedding   BLOB,"
         "  UNIQUE (namespace, id)"
         ");");

    // FTS5 virtual table (content table referencing nodes)
    exec("CREATE VIRTUAL TABLE IF NOT EXISTS nodes_fts "
         "USING fts5(text, key, tags, content=nodes, content_rowid=rowid);");

    // Triggers to keep FTS in sync with the nodes table
    exec("CREATE TRIGGER IF NOT EXISTS nodes_ai AFTER INSERT ON nodes BEGIN"
         "  INSERT INTO nodes_fts(rowid, text, key, tags)"
         "  VALUES (new.rowid, new.text, new.key, new.tags);"
         "END;");
    exec("CREATE TRIGGER IF NOT EXISTS nodes_ad AFTER DELETE ON nodes BEGIN"
         "  INSERT INTO nodes_fts(nodes_fts, rowid, text, key, tags)"
         "  VALUES ('delete', old.rowid, old.text, old.key, old.tags);"
         "END;");
    exec("CREATE TRIGGER IF NOT EXISTS nodes_au AFTER UPDATE ON nodes BEGIN"
         "  INSERT INTO nodes_fts(nodes_fts, rowid, text, key, tags)"
         "  VALUES ('delete', old.rowid, old.text, old.key, old.tags);"
         "  INSERT INTO nodes_fts(rowid, text, key, tags)"
         "  VALUES (new.rowid, new.text, new.key, new.tags);"
         "END;");

    exec("CREATE TABLE IF NOT EXISTS edges ("
         "  namespace     TEXT NOT NULL,"
         "  source_id     TEXT NOT NULL,"
         "  target_id     TEXT NOT NULL,"
         "  relation_type TEXT NOT NULL,"
         "  confidence    REAL NOT NULL,"
         "  PRIMARY KEY (namespace, source_id, target_id, relation_type)"
         ");");
    exec("CREATE INDEX IF NOT EXISTS edges_target ON edges(namespace, target_id);");
}

// ── Locked helpers ────────────────────────────────────────────

uint32_t SqliteGraphStore::dimension_locked(const std::string& ns) {
    StmtGuard g;
    prepare(db_, "SELECT dimension FROM namespaces WHERE name = ?;", g);
    sqlite3_bind_text(g.stmt, 1, ns.c_str(), -1, SQLITE_STATIC);
    if (sqlite3_step(g.stmt) == SQLITE_ROW) {
        return static_cast<uint32_t>(sqlite3_column_int(g.stmt, 0));
    }
    return fixed_dimension_;
}

bool SqliteGraphStore::set_dimension_locked(const std::string& ns, uint32_t dim) {
    StmtGuard g;
    prepare(db_, "INSERT OR IGNORE INTO namespaces (name, dimension) VALUES (?, ?);", g);
    sqlite3_bind_text(g.stmt, 1, ns.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int(g.stmt, 2, static_cast<int>(dim));
    return sqlite3_step(g.stmt) == SQLITE_DONE;
}

std::optional<MemoryNode> SqliteGraphStore::get_node_locked(const std::string& id,
                                                            const std::string& ns) {
    StmtGuard g;
    prepare(db_, std::string("SELECT ") + kNodeColumns +
                 " FROM nodes WHERE namespace = ? AND id = ?;", g);
    sqlite3_bind_text(g.stmt, 1, ns.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, id.c_str(), -1, SQLITE_STATIC);
    if (sqlite3_step(g.stmt) == SQLITE_ROW) {
        return node_from_stmt(g.stmt);
    }
    return std::nullopt;
}

bool SqliteGraphStore::insert_node_locked(const MemoryNode& node, const std::string& ns) {
    auto violation = validate_node(node);
    if (!violation.empty()) {
        std::cerr << "[store] Rejected node " << node.id << ": " << violation << "\n";
        return false;
    }
    if (node.embedding.empty()) {
        std::cerr << "[store] Rejected node " << node.id << ": missing embedding\n";
        return false;
    }
    uint32_t dim = dimension_locked(ns);
    if (dim != 0 && node.embedding.size() != dim) {
        std::cerr << "[store] Rejected node " << node.id << ": embedding dimension "
                  << node.embedding.size() << " != " << dim << "\n";
        return false;
    }
    if (dim == 0 || fixed_dimension_ == dim) {
        set_dimension_locked(ns, static_cast<uint32_t>(node.embedding.size()));
    }

    std::string meta = node_metadata_to_json(node).dump();
    std::string tags = join_tags(node.tags);
    std::string type = memory_type_to_string(node.memory_type);
    std::string status = node_status_to_string(node.status);

    StmtGuard g;
    prepare(db_,
        "INSERT INTO nodes (namespace, id, text, key, tags, memory_type, status,"
        " updated_at, metadata, embedding) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);", g);
    sqlite3_bind_text(g.stmt, 1, ns.c_str(),        -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, node.id.c_str(),   -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 3, node.text.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 4, node.key.c_str(),  -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 5, tags.c_str(),      -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 6, type.c_str(),      -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 7, status.c_str(),    -1, SQLITE_STATIC);
    sqlite3_bind_int64(g.stmt, 8, static_cast<int64_t>(node.updated_at));
    sqlite3_bind_text(g.stmt, 9, meta.c_str(),      -1, SQLITE_STATIC);
    sqlite3_bind_blob(g.stmt, 10, node.embedding.data(),
                      static_cast<int>(node.embedding.size() * sizeof(float)),
                      SQLITE_STATIC);
    // Duplicate (namespace, id) fails the UNIQUE constraint
    return sqlite3_step(g.stmt) == SQLITE_DONE;
}

bool SqliteGraphStore::check_edge_locked(const MemoryEdge& edge, const std::string& ns) {
    auto src = get_node_locked(edge.source_id, ns);
    auto dst = get_node_locked(edge.target_id, ns);
    if (!src || !dst) return false;
    auto violation = validate_edge(edge, *src, *dst);
    if (!violation.empty()) {
        std::cerr << "[store] Rejected edge " << edge.source_id << " -> "
                  << edge.target_id << ": " << violation << "\n";
        return false;
    }
    return true;
}

bool SqliteGraphStore::insert_edge_locked(const MemoryEdge& edge, const std::string& ns) {
    std::string type = relation_type_to_string(edge.relation_type);
    StmtGuard g;
    prepare(db_,
        "INSERT OR REPLACE INTO edges (namespace, source_id, target_id, relation_type,"
        " confidence) VALUES (?, ?, ?, ?, ?);", g);
    sqlite3_bind_text(g.stmt, 1, ns.c_str(),             -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, edge.source_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 3, edge.target_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 4, type.c_str(),           -1, SQLITE_STATIC);
    sqlite3_bind_double(g.stmt, 5, edge.confidence);
    return sqlite3_step(g.stmt) == SQLITE_DONE;
}

// ── Public API ────────────────────────────────────────────────

bool SqliteGraphStore::add_node(const MemoryNode& node, const std::string& ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!exec("BEGIN IMMEDIATE;")) {
        throw CollaboratorError(ErrorKind::CollaboratorUnavailable,
                                "sqlite: cannot begin transaction");
    }
    bool ok = false;
    try {
        ok = insert_node_locked(node, ns);
    } catch (const CollaboratorError&) {
        exec("ROLLBACK;");
        throw;
    }
    exec(ok ? "COMMIT;" : "ROLLBACK;");
    return ok;
}

std::optional<MemoryNode> SqliteGraphStore::get_node(const std::string& id,
                                                     const std::string& ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    return get_node_locked(id, ns);
}

bool SqliteGraphStore::update_node(const MemoryNode& node, const std::string& ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!validate_node(node).empty()) return false;
    if (node.embedding.size() != dimension_locked(ns)) return false;

    std::string meta = node_metadata_to_json(node).dump();
    std::string tags = join_tags(node.tags);
    std::string type = memory_type_to_string(node.memory_type);
    std::string status = node_status_to_string(node.status);

    StmtGuard g;
    prepare(db_,
        "UPDATE nodes SET text = ?, key = ?, tags = ?, memory_type = ?, status = ?,"
        " updated_at = ?, metadata = ?, embedding = ? WHERE namespace = ? AND id = ?;", g);
    sqlite3_bind_text(g.stmt, 1, node.text.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, node.key.c_str(),  -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 3, tags.c_str(),      -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 4, type.c_str(),      -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 5, status.c_str(),    -1, SQLITE_STATIC);
    sqlite3_bind_int64(g.stmt, 6, static_cast<int64_t>(node.updated_at));
    sqlite3_bind_text(g.stmt, 7, meta.c_str(),      -1, SQLITE_STATIC);
    sqlite3_bind_blob(g.stmt, 8, node.embedding.data(),
                      static_cast<int>(node.embedding.size() * sizeof(float)),
                      SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 9, ns.c_str(),        -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 10, node.id.c_str(),  -1, SQLITE_STATIC);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) return false;
    return sqlite3_changes(db_) > 0;
}

bool SqliteGraphStore::delete_node(const std::string& id, const std::string& ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!exec("BEGIN IMMEDIATE;")) {
        throw CollaboratorError(ErrorKind::CollaboratorUnavailable,
                                "sqlite: cannot begin transaction");
    }

    bool ok = false;
    try {
        StmtGuard lg;
        prepare(db_, "DELETE FROM edges WHERE namespace = ? AND (source_id = ? OR target_id = ?);", lg);
        sqlite3_bind_text(lg.stmt, 1, ns.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(lg.stmt, 2, id.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(lg.stmt, 3, id.c_str(), -1, SQLITE_STATIC);
        if (sqlite3_step(lg.stmt) == SQLITE_DONE) {
            StmtGuard g;
            prepare(db_, "DELETE FROM nodes WHERE namespace = ? AND id = ?;", g);
            sqlite3_bind_text(g.stmt, 1, ns.c_str(), -1, SQLITE_STATIC);
            sqlite3_bind_text(g.stmt, 2, id.c_str(), -1, SQLITE_STATIC);
            ok = sqlite3_step(g.stmt) == SQLITE_DONE && sqlite3_changes(db_) > 0;
        }
    } catch (const CollaboratorError&) {
        exec("ROLLBACK;");
        throw;
    }
    if (!ok) {
        exec("ROLLBACK;");
        return false;
    }
    return exec("COMMIT;");
}

bool SqliteGraphStore::add_edge(const MemoryEdge& edge, const std::string& ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!check_edge_locked(edge, ns)) return false;
    return insert_edge_locked(edge, ns);
}

std::vector<MemoryEdge> SqliteGraphStore::edges(const std::string& node_id,
                                                const std::string& ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    prepare(db_,
        "SELECT source_id, target_id, relation_type, confidence FROM edges"
        " WHERE namespace = ? AND (source_id = ? OR target_id = ?);", g);
    sqlite3_bind_text(g.stmt, 1, ns.c_str(),      -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, node_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 3, node_id.c_str(), -1, SQLITE_STATIC);

    std::vector<MemoryEdge> result;
    while (sqlite3_step(g.stmt) == SQLITE_ROW) {
        auto type = relation_type_from_string(column_text(g.stmt, 2));
        if (!type) continue;
        MemoryEdge edge;
        edge.source_id = column_text(g.stmt, 0);
        edge.target_id = column_text(g.stmt, 1);
        edge.relation_type = *type;
        edge.confidence = sqlite3_column_double(g.stmt, 3);
        result.push_back(std::move(edge));
    }
    return result;
}

std::vector<MemoryNode> SqliteGraphStore::vector_search(const Embedding& query,
                                                        const std::string& ns,
                                                        std::optional<MemoryType> scope,
                                                        uint32_t k) {
    if (query.empty() || k == 0) return {};
    std::lock_guard<std::mutex> lock(mutex_);

    // Brute-force cosine scan over the namespace
    std::string sql = std::string("SELECT ") + kNodeColumns +
                      " FROM nodes WHERE namespace = ? AND status = 'activated'";
    if (scope) sql += " AND memory_type = ?";
    sql += ";";

    StmtGuard g;
    prepare(db_, sql, g);
    sqlite3_bind_text(g.stmt, 1, ns.c_str(), -1, SQLITE_STATIC);
    std::string scope_str;
    if (scope) {
        scope_str = memory_type_to_string(*scope);
        sqlite3_bind_text(g.stmt, 2, scope_str.c_str(), -1, SQLITE_STATIC);
    }

    std::vector<MemoryNode> scored;
    while (sqlite3_step(g.stmt) == SQLITE_ROW) {
        auto node = node_from_stmt(g.stmt);
        if (node.embedding.size() != query.size()) continue;
        node.score = cosine_similarity(query, node.embedding);
        scored.push_back(std::move(node));
    }

    size_t n = std::min(static_cast<size_t>(k), scored.size());
    std::partial_sort(scored.begin(), scored.begin() + static_cast<ptrdiff_t>(n), scored.end(),
                      [](const MemoryNode& a, const MemoryNode& b) {
                          return a.score > b.score;
                      });
    scored.resize(n);
    return scored;
}

std::vector<MemoryNode> SqliteGraphStore::keyword_search(const std::vector<std::string>& terms,
                                                         const std::string& ns,
                                                         std::optional<MemoryType> scope,
                                                         uint32_t limit) {
    if (terms.empty() || limit == 0) return {};
    std::lock_guard<std::mutex> lock(mutex_);

    std::string scope_str = scope ? memory_type_to_string(*scope) : "";
    std::unordered_map<std::string, MemoryNode> candidates;

    auto collect = [&](const std::string& sql, const std::vector<std::string>& params) {
        StmtGuard g;
        prepare(db_, sql, g);
        int col = 1;
        for (const auto& p : params) {
            sqlite3_bind_text(g.stmt, col++, p.c_str(), -1, SQLITE_TRANSIENT);
        }
        while (sqlite3_step(g.stmt) == SQLITE_ROW) {
            auto node = node_from_stmt(g.stmt);
            candidates.emplace(node.id, std::move(node));
        }
    };

    // FTS5 token matches
    std::string fts_query = build_fts_query(terms);
    if (!fts_query.empty()) {
        std::string sql =
            "SELECT n.id, n.text, n.metadata, n.embedding"
            " FROM nodes_fts JOIN nodes AS n ON nodes_fts.rowid = n.rowid"
            " WHERE nodes_fts MATCH ? AND n.namespace = ? AND n.status = 'activated'";
        std::vector<std::string> params = {fts_query, ns};
        if (scope) {
            sql += " AND n.memory_type = ?";
            params.push_back(scope_str);
        }
        sql += ";";
        collect(sql, params);
    }

    // Substring matches FTS tokenization misses (partial words, CJK)
    {
        std::string sql = std::string("SELECT ") + kNodeColumns +
                          " FROM nodes WHERE namespace = ? AND status = 'activated'";
        std::vector<std::string> params = {ns};
        if (scope) {
            sql += " AND memory_type = ?";
            params.push_back(scope_str);
        }
        std::string clause;
        for (const auto& term : terms) {
            std::string t = trim(term);
            if (t.empty()) continue;
            if (!clause.empty()) clause += " OR ";
            clause += "text LIKE ? ESCAPE '\\' OR key LIKE ? ESCAPE '\\'"
                      " OR tags LIKE ? ESCAPE '\\'";
            std::string pat = "%" + escape_like(t) + "%";
            params.insert(params.end(), {pat, pat, pat});
        }
        if (!clause.empty()) {
            sql += " AND (" + clause + ");";
            collect(sql, params);
        }
    }

    std::vector<MemoryNode> results;
    results.reserve(candidates.size());
    for (auto& [id, node] : candidates) {
        double fraction = keyword_match_fraction(node, terms);
        if (fraction <= 0.0) continue;
        node.score = fraction;
        results.push_back(std::move(node));
    }
    std::sort(results.begin(), results.end(), [](const MemoryNode& a, const MemoryNode& b) {
        if (a.score != b.score) return a.score > b.score;
        if (a.updated_at != b.updated_at) return a.updated_at > b.updated_at;
        return a.id < b.id;
    });
    if (results.size() > limit) results.resize(limit);
    return results;
}

bool SqliteGraphStore::commit_artifact(const MemoryNode& node,
                                       const std::vector<MemoryEdge>& edges,
                                       const std::string& ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!exec("BEGIN IMMEDIATE;")) {
        throw CollaboratorError(ErrorKind::CollaboratorUnavailable,
                                "sqlite: cannot begin transaction");
    }

    bool ok = false;
    try {
        ok = insert_node_locked(node, ns);
        for (const auto& edge : edges) {
            if (!ok) break;
            ok = check_edge_locked(edge, ns) && insert_edge_locked(edge, ns);
        }
    } catch (const CollaboratorError&) {
        exec("ROLLBACK;");
        throw;
    }

    if (!ok) {
        exec("ROLLBACK;");
        return false;
    }
    return exec("COMMIT;");
}

uint32_t SqliteGraphStore::count(const std::string& ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    prepare(db_, "SELECT COUNT(*) FROM nodes WHERE namespace = ?;", g);
    sqlite3_bind_text(g.stmt, 1, ns.c_str(), -1, SQLITE_STATIC);
    if (sqlite3_step(g.stmt) == SQLITE_ROW) {
        return static_cast<uint32_t>(sqlite3_column_int(g.stmt, 0));
    }
    return 0;
}

uint32_t SqliteGraphStore::dimension(const std::string& ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    return dimension_locked(ns);
}

std::string SqliteGraphStore::snapshot_export(const std::string& ns) {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json nodes = nlohmann::json::array();
    {
        StmtGuard g;
        prepare(db_, std::string("SELECT ") + kNodeColumns +
                     " FROM nodes WHERE namespace = ? ORDER BY rowid ASC;", g);
        sqlite3_bind_text(g.stmt, 1, ns.c_str(), -1, SQLITE_STATIC);
        while (sqlite3_step(g.stmt) == SQLITE_ROW) {
            nodes.push_back(node_to_json(node_from_stmt(g.stmt)));
        }
    }

    nlohmann::json edges = nlohmann::json::array();
    {
        StmtGuard g;
        prepare(db_,
            "SELECT source_id, target_id, relation_type, confidence FROM edges"
            " WHERE namespace = ?;", g);
        sqlite3_bind_text(g.stmt, 1, ns.c_str(), -1, SQLITE_STATIC);
        while (sqlite3_step(g.stmt) == SQLITE_ROW) {
            edges.push_back({
                {"source", column_text(g.stmt, 0)},
                {"target", column_text(g.stmt, 1)},
                {"type", column_text(g.stmt, 2)},
                {"confidence", sqlite3_column_double(g.stmt, 3)}
            });
        }
    }

    nlohmann::json j = {{"nodes", nodes}, {"edges", edges}};
    return j.dump(2);
}

uint32_t SqliteGraphStore::snapshot_import(const std::string& json_str, const std::string& ns) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[store] Import failed for namespace " << ns << ": " << e.what() << "\n";
        return 0;
    }
    if (!j.is_object()) return 0;

    std::lock_guard<std::mutex> lock(mutex_);
    if (!exec("BEGIN IMMEDIATE;")) {
        throw CollaboratorError(ErrorKind::CollaboratorUnavailable,
                                "sqlite: cannot begin transaction");
    }

    uint32_t imported = 0;
    try {
        if (j.contains("nodes") && j["nodes"].is_array()) {
            for (const auto& item : j["nodes"]) {
                if (!item.is_object()) continue;
                try {
                    auto node = node_from_json(item);
                    if (node.id.empty()) node.id = generate_id();
                    if (insert_node_locked(node, ns)) imported++;
                } catch (const nlohmann::json::exception& e) {
                    std::cerr << "[store] Skipping malformed node in import: " << e.what() << "\n";
                }
            }
        }
        if (j.contains("edges") && j["edges"].is_array()) {
            for (const auto& item : j["edges"]) {
                if (!item.is_object()) continue;
                auto edge = edge_from_json(item);
                if (edge && check_edge_locked(*edge, ns)) insert_edge_locked(*edge, ns);
            }
        }
    } catch (const CollaboratorError&) {
        exec("ROLLBACK;");
        throw;
    }
    exec("COMMIT;");
    return imported;
}

} // namespace memweave
