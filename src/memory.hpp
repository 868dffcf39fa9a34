#pragma once
#include <string>
#include <vector>
#include <set>
#include <optional>
#include <cstdint>

namespace memweave {

using Embedding = std::vector<float>;

enum class MemoryType { WorkingMemory, LongTermMemory, UserMemory, OuterMemory };

enum class NodeStatus { Activated, Archived, Merged };

enum class RelationType { Causes, Follows, RelatedTo, Aggregates, Contradicts };

enum class GoalType { Retrieval, Update, Other };

enum class NliResult { Duplicate, Contradiction, Unrelated };

// One provenance reference. Chat-derived facts carry role/lang/content;
// derived facts (inferred, aggregate, merged_into) carry node_ids.
struct SourceRef {
    std::string type;     // "chat", "doc", "inferred", "aggregate", "merged_into", ...
    std::string role;     // "user", "assistant" (chat sources)
    std::string lang;     // "en", "zh" (chat sources)
    std::string content;
    std::vector<std::string> node_ids;
};

struct MemoryNode {
    std::string id;
    std::string text;
    Embedding embedding;
    MemoryType memory_type = MemoryType::LongTermMemory;
    std::string key;
    std::set<std::string> tags;
    double confidence = 1.0;
    std::string background;
    std::string node_type = "fact"; // "fact", "inferred", "aggregate"
    std::vector<SourceRef> sources;
    NodeStatus status = NodeStatus::Activated;
    std::string conflict_with;       // id of the node a flagged write conflicts with
    uint64_t created_at = 0;
    uint64_t updated_at = 0;
    double score = 0.0;              // transient, set by searches
};

struct MemoryEdge {
    std::string source_id;
    std::string target_id;
    RelationType relation_type = RelationType::RelatedTo;
    double confidence = 1.0;
};

// Structured retrieval plan produced per query; never persisted.
struct ParsedTaskGoal {
    std::vector<std::string> memories;
    std::vector<std::string> keys;
    std::vector<std::string> tags;
    GoalType goal_type = GoalType::Retrieval;
    bool fallback = false; // true when the minimal fallback goal was used
};

// String conversions. *_from_string returns nullopt for unknown names.
std::string memory_type_to_string(MemoryType t);
std::optional<MemoryType> memory_type_from_string(const std::string& s);
std::string node_status_to_string(NodeStatus s);
std::optional<NodeStatus> node_status_from_string(const std::string& s);
std::string relation_type_to_string(RelationType r);
std::optional<RelationType> relation_type_from_string(const std::string& s);
std::string goal_type_to_string(GoalType g);
std::optional<GoalType> goal_type_from_string(const std::string& s);
std::string nli_result_to_string(NliResult r);
std::optional<NliResult> nli_result_from_string(const std::string& s);

// Node-local invariants: non-empty id and text, confidence in [0,1],
// Merged nodes name a successor, aggregates carry >=2 sources.
// Returns an empty string when valid, otherwise a description of the violation.
std::string validate_node(const MemoryNode& node);

// Edge invariants given both resolved endpoints.
std::string validate_edge(const MemoryEdge& edge,
                          const MemoryNode& source,
                          const MemoryNode& target);

// Fraction of terms (case-insensitive) matching the node's key, tags or text,
// exact or substring. 0 when terms is empty.
double keyword_match_fraction(const MemoryNode& node,
                              const std::vector<std::string>& terms);

// Number of tags shared by two nodes.
size_t shared_tag_count(const MemoryNode& a, const MemoryNode& b);

// The first chat source carrying a role, if any.
const SourceRef* primary_chat_source(const MemoryNode& node);

} // namespace memweave
