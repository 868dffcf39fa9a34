#include "memory.hpp"
#include "util.hpp"
#include <algorithm>

namespace memweave {

std::string memory_type_to_string(MemoryType t) {
    switch (t) {
        case MemoryType::WorkingMemory:  return "WorkingMemory";
        case MemoryType::LongTermMemory: return "LongTermMemory";
        case MemoryType::UserMemory:     return "UserMemory";
        case MemoryType::OuterMemory:    return "OuterMemory";
    }
    return "LongTermMemory";
}

std::optional<MemoryType> memory_type_from_string(const std::string& s) {
    if (s == "WorkingMemory")  return MemoryType::WorkingMemory;
    if (s == "LongTermMemory") return MemoryType::LongTermMemory;
    if (s == "UserMemory")     return MemoryType::UserMemory;
    if (s == "OuterMemory")    return MemoryType::OuterMemory;
    return std::nullopt;
}

std::string node_status_to_string(NodeStatus s) {
    switch (s) {
        case NodeStatus::Activated: return "activated";
        case NodeStatus::Archived:  return "archived";
        case NodeStatus::Merged:    return "merged";
    }
    return "activated";
}

std::optional<NodeStatus> node_status_from_string(const std::string& s) {
    auto lower = to_lower(s);
    if (lower == "activated") return NodeStatus::Activated;
    if (lower == "archived")  return NodeStatus::Archived;
    if (lower == "merged")    return NodeStatus::Merged;
    return std::nullopt;
}

std::string relation_type_to_string(RelationType r) {
    switch (r) {
        case RelationType::Causes:      return "CAUSE";
        case RelationType::Follows:     return "FOLLOWS";
        case RelationType::RelatedTo:   return "RELATE_TO";
        case RelationType::Aggregates:  return "AGGREGATE_TO";
        case RelationType::Contradicts: return "CONFLICT";
    }
    return "RELATE_TO";
}

std::optional<RelationType> relation_type_from_string(const std::string& s) {
    auto lower = to_lower(trim(s));
    if (lower == "cause" || lower == "causes")           return RelationType::Causes;
    if (lower == "follows" || lower == "follow")         return RelationType::Follows;
    if (lower == "relate_to" || lower == "relatedto" ||
        lower == "related_to" || lower == "related")     return RelationType::RelatedTo;
    if (lower == "aggregate_to" || lower == "aggregates" ||
        lower == "aggregate")                            return RelationType::Aggregates;
    if (lower == "conflict" || lower == "contradicts" ||
        lower == "contradiction")                        return RelationType::Contradicts;
    return std::nullopt;
}

std::string goal_type_to_string(GoalType g) {
    switch (g) {
        case GoalType::Retrieval: return "retrieval";
        case GoalType::Update:    return "update";
        case GoalType::Other:     return "other";
    }
    return "retrieval";
}

std::optional<GoalType> goal_type_from_string(const std::string& s) {
    auto lower = to_lower(trim(s));
    if (lower == "retrieval") return GoalType::Retrieval;
    if (lower == "update")    return GoalType::Update;
    if (lower == "other")     return GoalType::Other;
    return std::nullopt;
}

std::string nli_result_to_string(NliResult r) {
    switch (r) {
        case NliResult::Duplicate:     return "Duplicate";
        case NliResult::Contradiction: return "Contradiction";
        case NliResult::Unrelated:     return "Unrelated";
    }
    return "Unrelated";
}

std::optional<NliResult> nli_result_from_string(const std::string& s) {
    auto lower = to_lower(trim(s));
    if (lower == "duplicate")     return NliResult::Duplicate;
    if (lower == "contradiction") return NliResult::Contradiction;
    if (lower == "unrelated")     return NliResult::Unrelated;
    return std::nullopt;
}

std::string validate_node(const MemoryNode& node) {
    if (node.id.empty()) return "node id is empty";
    if (node.text.empty()) return "node text is empty";
    if (node.confidence < 0.0 || node.confidence > 1.0) {
        return "confidence out of range [0,1]";
    }
    if (node.status == NodeStatus::Merged) {
        bool has_successor = std::any_of(node.sources.begin(), node.sources.end(),
            [](const SourceRef& s) {
                return s.type == "merged_into" && !s.node_ids.empty();
            });
        if (!has_successor) return "merged node without merged_into source";
    }
    if (node.node_type == "aggregate" && node.sources.size() < 2) {
        return "aggregate node needs at least 2 sources";
    }
    return {};
}

std::string validate_edge(const MemoryEdge& edge,
                          const MemoryNode& source,
                          const MemoryNode& target) {
    if (edge.source_id == edge.target_id) return "self edge";
    if (edge.confidence < 0.0 || edge.confidence > 1.0) {
        return "edge confidence out of range [0,1]";
    }
    if (edge.relation_type == RelationType::Follows &&
        !(source.updated_at < target.updated_at)) {
        return "FOLLOWS edge must go from earlier to later updated_at";
    }
    if (edge.relation_type == RelationType::Aggregates &&
        (source.node_type != "aggregate" || source.sources.size() < 2)) {
        return "AGGREGATE_TO edge must start at an aggregate node with >=2 sources";
    }
    return {};
}

double keyword_match_fraction(const MemoryNode& node,
                              const std::vector<std::string>& terms) {
    if (terms.empty()) return 0.0;

    std::string key = to_lower(node.key);
    std::string text = to_lower(node.text);
    std::vector<std::string> tags;
    tags.reserve(node.tags.size());
    for (const auto& t : node.tags) tags.push_back(to_lower(t));

    size_t matched = 0;
    size_t counted = 0;
    for (const auto& raw : terms) {
        std::string term = to_lower(trim(raw));
        if (term.empty()) continue;
        counted++;
        bool hit = (!key.empty() && (key == term || key.find(term) != std::string::npos)) ||
                   text.find(term) != std::string::npos;
        if (!hit) {
            hit = std::any_of(tags.begin(), tags.end(), [&term](const std::string& tag) {
                return tag == term || tag.find(term) != std::string::npos;
            });
        }
        if (hit) matched++;
    }
    if (counted == 0) return 0.0;
    return static_cast<double>(matched) / static_cast<double>(counted);
}

size_t shared_tag_count(const MemoryNode& a, const MemoryNode& b) {
    size_t n = 0;
    for (const auto& t : a.tags) {
        if (b.tags.count(t)) n++;
    }
    return n;
}

const SourceRef* primary_chat_source(const MemoryNode& node) {
    for (const auto& s : node.sources) {
        if (!s.role.empty()) return &s;
    }
    return nullptr;
}

} // namespace memweave
