#include "json_graph_store.hpp"
#include "node_json.hpp"
#include "vector.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>

namespace memweave {

JsonGraphStore::JsonGraphStore(const std::string& path, uint32_t fixed_dimension)
    : path_(path), fixed_dimension_(fixed_dimension) {
    load();
}

void JsonGraphStore::load() {
    if (path_.empty()) return;
    std::ifstream file(path_);
    if (!file.is_open()) return;

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        if (!j.contains("namespaces") || !j["namespaces"].is_object()) return;

        spaces_.clear();
        for (auto& [name, obj] : j["namespaces"].items()) {
            Namespace space;
            space.dimension = obj.value("dimension", 0u);
            if (obj.contains("nodes") && obj["nodes"].is_array()) {
                for (const auto& item : obj["nodes"]) {
                    space.nodes.push_back(node_from_json(item));
                }
            }
            if (obj.contains("edges") && obj["edges"].is_array()) {
                for (const auto& item : obj["edges"]) {
                    if (auto edge = edge_from_json(item)) space.edges.push_back(*edge);
                }
            }
            rebuild_index(space);
            spaces_[name] = std::move(space);
        }
    } catch (const nlohmann::json::exception& e) {
        // Corrupt file: start fresh, the next save overwrites it
        std::cerr << "[store] Ignoring unreadable " << path_ << ": " << e.what() << "\n";
        spaces_.clear();
    }
}

void JsonGraphStore::save() {
    if (path_.empty()) return;

    nlohmann::json namespaces = nlohmann::json::object();
    for (const auto& [name, space] : spaces_) {
        nlohmann::json nodes = nlohmann::json::array();
        for (const auto& node : space.nodes) nodes.push_back(node_to_json(node));
        nlohmann::json edges = nlohmann::json::array();
        for (const auto& edge : space.edges) edges.push_back(edge_to_json(edge));
        namespaces[name] = {
            {"dimension", space.dimension},
            {"nodes", nodes},
            {"edges", edges}
        };
    }
    nlohmann::json j = {{"namespaces", namespaces}};
    if (!atomic_write_file(path_, j.dump(2))) {
        std::cerr << "[store] Failed to write " << path_ << "\n";
    }
}

void JsonGraphStore::rebuild_index(Namespace& space) {
    space.id_index.clear();
    space.id_index.reserve(space.nodes.size());
    for (size_t i = 0; i < space.nodes.size(); ++i) {
        space.id_index[space.nodes[i].id] = i;
    }
}

JsonGraphStore::Namespace& JsonGraphStore::space(const std::string& ns) {
    auto it = spaces_.find(ns);
    if (it == spaces_.end()) {
        Namespace fresh;
        fresh.dimension = fixed_dimension_;
        it = spaces_.emplace(ns, std::move(fresh)).first;
    }
    return it->second;
}

bool JsonGraphStore::insert_node_locked(Namespace& space, const MemoryNode& node) {
    auto violation = validate_node(node);
    if (!violation.empty()) {
        std::cerr << "[store] Rejected node " << node.id << ": " << violation << "\n";
        return false;
    }
    if (space.id_index.count(node.id)) return false;
    if (node.embedding.empty()) {
        std::cerr << "[store] Rejected node " << node.id << ": missing embedding\n";
        return false;
    }
    if (space.dimension != 0 && node.embedding.size() != space.dimension) {
        std::cerr << "[store] Rejected node " << node.id << ": embedding dimension "
                  << node.embedding.size() << " != " << space.dimension << "\n";
        return false;
    }
    if (space.dimension == 0) {
        space.dimension = static_cast<uint32_t>(node.embedding.size());
    }
    space.id_index[node.id] = space.nodes.size();
    space.nodes.push_back(node);
    return true;
}

bool JsonGraphStore::check_edge_locked(const Namespace& space, const MemoryEdge& edge) const {
    auto src = space.id_index.find(edge.source_id);
    auto dst = space.id_index.find(edge.target_id);
    if (src == space.id_index.end() || dst == space.id_index.end()) return false;
    auto violation = validate_edge(edge, space.nodes[src->second], space.nodes[dst->second]);
    if (!violation.empty()) {
        std::cerr << "[store] Rejected edge " << edge.source_id << " -> "
                  << edge.target_id << ": " << violation << "\n";
        return false;
    }
    return true;
}

bool JsonGraphStore::add_node(const MemoryNode& node, const std::string& ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!insert_node_locked(space(ns), node)) return false;
    save();
    return true;
}

std::optional<MemoryNode> JsonGraphStore::get_node(const std::string& id,
                                                   const std::string& ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = spaces_.find(ns);
    if (it == spaces_.end()) return std::nullopt;
    auto idx = it->second.id_index.find(id);
    if (idx == it->second.id_index.end()) return std::nullopt;
    return it->second.nodes[idx->second];
}

bool JsonGraphStore::update_node(const MemoryNode& node, const std::string& ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = spaces_.find(ns);
    if (it == spaces_.end()) return false;
    auto& sp = it->second;
    auto idx = sp.id_index.find(node.id);
    if (idx == sp.id_index.end()) return false;
    if (!validate_node(node).empty()) return false;
    if (node.embedding.size() != sp.dimension) return false;
    sp.nodes[idx->second] = node;
    save();
    return true;
}

bool JsonGraphStore::delete_node(const std::string& id, const std::string& ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = spaces_.find(ns);
    if (it == spaces_.end()) return false;
    auto& sp = it->second;
    auto idx = sp.id_index.find(id);
    if (idx == sp.id_index.end()) return false;

    sp.nodes.erase(sp.nodes.begin() + static_cast<ptrdiff_t>(idx->second));
    sp.edges.erase(std::remove_if(sp.edges.begin(), sp.edges.end(),
        [&id](const MemoryEdge& e) { return e.source_id == id || e.target_id == id; }),
        sp.edges.end());
    rebuild_index(sp);
    save();
    return true;
}

bool JsonGraphStore::add_edge(const MemoryEdge& edge, const std::string& ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = spaces_.find(ns);
    if (it == spaces_.end()) return false;
    auto& sp = it->second;
    if (!check_edge_locked(sp, edge)) return false;

    // Upsert by (source, target, type)
    for (auto& existing : sp.edges) {
        if (existing.source_id == edge.source_id && existing.target_id == edge.target_id &&
            existing.relation_type == edge.relation_type) {
            existing.confidence = edge.confidence;
            save();
            return true;
        }
    }
    sp.edges.push_back(edge);
    save();
    return true;
}

std::vector<MemoryEdge> JsonGraphStore::edges(const std::string& node_id,
                                              const std::string& ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<MemoryEdge> result;
    auto it = spaces_.find(ns);
    if (it == spaces_.end()) return result;
    for (const auto& e : it->second.edges) {
        if (e.source_id == node_id || e.target_id == node_id) result.push_back(e);
    }
    return result;
}

std::vector<MemoryNode> JsonGraphStore::vector_search(const Embedding& query,
                                                      const std::string& ns,
                                                      std::optional<MemoryType> scope,
                                                      uint32_t k) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<MemoryNode> scored;
    auto it = spaces_.find(ns);
    if (it == spaces_.end() || query.empty() || k == 0) return scored;

    for (const auto& node : it->second.nodes) {
        if (node.status != NodeStatus::Activated) continue;
        if (scope && node.memory_type != *scope) continue;
        if (node.embedding.size() != query.size()) continue;
        MemoryNode copy = node;
        copy.score = cosine_similarity(query, node.embedding);
        scored.push_back(std::move(copy));
    }

    size_t n = std::min(static_cast<size_t>(k), scored.size());
    std::partial_sort(scored.begin(), scored.begin() + static_cast<ptrdiff_t>(n), scored.end(),
                      [](const MemoryNode& a, const MemoryNode& b) {
                          return a.score > b.score;
                      });
    scored.resize(n);
    return scored;
}

std::vector<MemoryNode> JsonGraphStore::keyword_search(const std::vector<std::string>& terms,
                                                       const std::string& ns,
                                                       std::optional<MemoryType> scope,
                                                       uint32_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<MemoryNode> results;
    auto it = spaces_.find(ns);
    if (it == spaces_.end() || terms.empty() || limit == 0) return results;

    for (const auto& node : it->second.nodes) {
        if (node.status != NodeStatus::Activated) continue;
        if (scope && node.memory_type != *scope) continue;
        double fraction = keyword_match_fraction(node, terms);
        if (fraction <= 0.0) continue;
        MemoryNode copy = node;
        copy.score = fraction;
        results.push_back(std::move(copy));
    }

    std::stable_sort(results.begin(), results.end(),
                     [](const MemoryNode& a, const MemoryNode& b) {
                         if (a.score != b.score) return a.score > b.score;
                         return a.updated_at > b.updated_at;
                     });
    if (results.size() > limit) results.resize(limit);
    return results;
}

bool JsonGraphStore::commit_artifact(const MemoryNode& node,
                                     const std::vector<MemoryEdge>& edges,
                                     const std::string& ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& sp = space(ns);

    // Work on a copy so a rejected edge leaves no trace of the node
    Namespace staged = sp;
    if (!insert_node_locked(staged, node)) return false;
    for (const auto& edge : edges) {
        if (!check_edge_locked(staged, edge)) return false;
        staged.edges.push_back(edge);
    }
    sp = std::move(staged);
    save();
    return true;
}

uint32_t JsonGraphStore::count(const std::string& ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = spaces_.find(ns);
    if (it == spaces_.end()) return 0;
    return static_cast<uint32_t>(it->second.nodes.size());
}

uint32_t JsonGraphStore::dimension(const std::string& ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = spaces_.find(ns);
    if (it == spaces_.end()) return fixed_dimension_;
    return it->second.dimension;
}

std::string JsonGraphStore::snapshot_export(const std::string& ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json nodes = nlohmann::json::array();
    nlohmann::json edges = nlohmann::json::array();
    auto it = spaces_.find(ns);
    if (it != spaces_.end()) {
        for (const auto& node : it->second.nodes) nodes.push_back(node_to_json(node));
        for (const auto& edge : it->second.edges) edges.push_back(edge_to_json(edge));
    }
    nlohmann::json j = {{"nodes", nodes}, {"edges", edges}};
    return j.dump(2);
}

uint32_t JsonGraphStore::snapshot_import(const std::string& json_str, const std::string& ns) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[store] Import failed for namespace " << ns << ": " << e.what() << "\n";
        return 0;
    }
    if (!j.is_object()) return 0;

    std::lock_guard<std::mutex> lock(mutex_);
    auto& sp = space(ns);
    uint32_t imported = 0;
    if (j.contains("nodes") && j["nodes"].is_array()) {
        for (const auto& item : j["nodes"]) {
            if (!item.is_object()) continue;
            try {
                auto node = node_from_json(item);
                if (node.id.empty()) node.id = generate_id();
                if (insert_node_locked(sp, node)) imported++;
            } catch (const nlohmann::json::exception& e) {
                std::cerr << "[store] Skipping malformed node in import: " << e.what() << "\n";
            }
        }
    }
    if (j.contains("edges") && j["edges"].is_array()) {
        for (const auto& item : j["edges"]) {
            if (!item.is_object()) continue;
            auto edge = edge_from_json(item);
            if (edge && check_edge_locked(sp, *edge)) sp.edges.push_back(*edge);
        }
    }
    save();
    return imported;
}

} // namespace memweave
