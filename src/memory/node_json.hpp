#pragma once
#include "../memory.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>

namespace memweave {

// Shared JSON <-> node/edge conversion used by JsonGraphStore, SqliteGraphStore
// and the snapshot export format.

inline nlohmann::json source_to_json(const SourceRef& src) {
    nlohmann::json item = {{"type", src.type}};
    if (!src.role.empty()) item["role"] = src.role;
    if (!src.lang.empty()) item["lang"] = src.lang;
    if (!src.content.empty()) item["content"] = src.content;
    if (!src.node_ids.empty()) item["node_ids"] = src.node_ids;
    return item;
}

inline SourceRef source_from_json(const nlohmann::json& item) {
    SourceRef src;
    src.type = item.value("type", "");
    src.role = item.value("role", "");
    src.lang = item.value("lang", "");
    src.content = item.value("content", "");
    if (item.contains("node_ids") && item["node_ids"].is_array()) {
        for (const auto& id : item["node_ids"]) {
            if (id.is_string()) src.node_ids.push_back(id.get<std::string>());
        }
    }
    return src;
}

// Metadata only: everything except id, text and embedding.
inline nlohmann::json node_metadata_to_json(const MemoryNode& node) {
    nlohmann::json meta = {
        {"memory_type", memory_type_to_string(node.memory_type)},
        {"key", node.key},
        {"tags", node.tags},
        {"confidence", node.confidence},
        {"background", node.background},
        {"type", node.node_type},
        {"status", node_status_to_string(node.status)},
        {"created_at", format_iso8601(node.created_at)},
        {"updated_at", format_iso8601(node.updated_at)}
    };
    nlohmann::json sources = nlohmann::json::array();
    for (const auto& s : node.sources) sources.push_back(source_to_json(s));
    meta["sources"] = sources;
    if (!node.conflict_with.empty()) meta["conflict_with"] = node.conflict_with;
    return meta;
}

inline void node_metadata_from_json(const nlohmann::json& meta, MemoryNode& node) {
    node.memory_type = memory_type_from_string(meta.value("memory_type", ""))
                           .value_or(MemoryType::LongTermMemory);
    node.key = meta.value("key", "");
    node.tags.clear();
    if (meta.contains("tags") && meta["tags"].is_array()) {
        for (const auto& t : meta["tags"]) {
            if (t.is_string()) node.tags.insert(t.get<std::string>());
        }
    }
    node.confidence = meta.value("confidence", 1.0);
    node.background = meta.value("background", "");
    node.node_type = meta.value("type", "fact");
    node.status = node_status_from_string(meta.value("status", ""))
                      .value_or(NodeStatus::Activated);
    node.conflict_with = meta.value("conflict_with", "");
    node.created_at = parse_iso8601(meta.value("created_at", ""));
    node.updated_at = parse_iso8601(meta.value("updated_at", ""));
    node.sources.clear();
    if (meta.contains("sources") && meta["sources"].is_array()) {
        for (const auto& s : meta["sources"]) {
            if (s.is_object()) node.sources.push_back(source_from_json(s));
        }
    }
}

inline nlohmann::json node_to_json(const MemoryNode& node, bool with_embedding = true) {
    nlohmann::json item = {
        {"id", node.id},
        {"memory", node.text},
        {"metadata", node_metadata_to_json(node)}
    };
    if (with_embedding) item["metadata"]["embedding"] = node.embedding;
    return item;
}

inline MemoryNode node_from_json(const nlohmann::json& item) {
    MemoryNode node;
    node.id = item.value("id", "");
    node.text = item.value("memory", "");
    if (item.contains("metadata") && item["metadata"].is_object()) {
        const auto& meta = item["metadata"];
        node_metadata_from_json(meta, node);
        if (meta.contains("embedding") && meta["embedding"].is_array()) {
            for (const auto& v : meta["embedding"]) {
                if (v.is_number()) node.embedding.push_back(v.get<float>());
            }
        }
    }
    return node;
}

inline nlohmann::json edge_to_json(const MemoryEdge& edge) {
    return {
        {"source", edge.source_id},
        {"target", edge.target_id},
        {"type", relation_type_to_string(edge.relation_type)},
        {"confidence", edge.confidence}
    };
}

inline std::optional<MemoryEdge> edge_from_json(const nlohmann::json& item) {
    auto type = relation_type_from_string(item.value("type", ""));
    if (!type) return std::nullopt;
    MemoryEdge edge;
    edge.source_id = item.value("source", "");
    edge.target_id = item.value("target", "");
    edge.relation_type = *type;
    edge.confidence = item.value("confidence", 1.0);
    if (edge.source_id.empty() || edge.target_id.empty()) return std::nullopt;
    return edge;
}

} // namespace memweave
