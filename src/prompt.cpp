#include "prompt.hpp"
#include "util.hpp"
#include <sstream>

namespace memweave {

static void write_node_line(std::ostringstream& ss, const MemoryNode& node) {
    ss << "[" << node.id << "] " << node.text;
    if (!node.key.empty()) ss << " (key: " << node.key << ")";
    if (!node.tags.empty()) {
        ss << " (tags: ";
        bool first = true;
        for (const auto& t : node.tags) {
            if (!first) ss << ", ";
            ss << t;
            first = false;
        }
        ss << ")";
    }
    if (node.updated_at != 0) ss << " (updated: " << format_iso8601(node.updated_at) << ")";
    ss << "\n";
}

std::string build_goal_system_prompt(GoalMode mode) {
    std::ostringstream ss;
    ss << "You turn a user's question or instruction into a memory retrieval plan.\n";
    if (mode == GoalMode::Fine) {
        ss << "Think about which stored facts would answer the task, and describe them.\n"
           << "Rules:\n"
           << "- \"memories\": 1-5 short declarative sentences describing facts worth retrieving. Required, never empty.\n"
           << "- \"keys\": short canonical topic labels or named entities (people, places, groups).\n"
           << "- \"tags\": broad categories such as \"event\", \"preference\", \"relationship\".\n"
           << "- \"goal_type\": \"retrieval\" to look facts up, \"update\" to change them, \"other\" otherwise.\n";
    } else {
        ss << "Be brief.\n";
    }
    ss << "Output ONLY a JSON object: "
       << "{\"memories\":[\"...\"],\"keys\":[\"...\"],\"tags\":[\"...\"],\"goal_type\":\"retrieval\"}\n";
    return ss.str();
}

std::string build_goal_prompt(const std::string& task, GoalMode mode) {
    std::ostringstream ss;
    if (mode == GoalMode::Fine) {
        ss << "Current date: " << timestamp_now() << "\n";
    }
    ss << "Task: " << task << "\n";
    return ss.str();
}

std::string build_goal_correction(const std::string& task,
                                  const std::string& previous_output,
                                  const std::string& validation_error) {
    std::ostringstream ss;
    ss << "Task: " << task << "\n\n"
       << "Your previous answer was rejected: " << validation_error << "\n"
       << "Previous answer:\n" << previous_output << "\n\n"
       << "Answer again with ONLY a JSON object of the form "
       << "{\"memories\":[string],\"keys\":[string],\"tags\":[string],"
       << "\"goal_type\":\"retrieval\"|\"update\"|\"other\"}. No prose, no code fences.\n";
    return ss.str();
}

std::string build_reasoning_system_prompt() {
    return "You analyse facts stored in a personal memory graph. "
           "Answer with ONLY the JSON requested, no prose.";
}

std::string build_relation_prompt(const MemoryNode& anchor, const MemoryNode& neighbor) {
    std::ostringstream ss;
    ss << "Classify the relation between fact A and fact B.\n\n"
       << "A: ";
    write_node_line(ss, anchor);
    ss << "B: ";
    write_node_line(ss, neighbor);
    ss << "\nRelation types:\n"
       << "- \"CAUSE\": one fact directly leads to the other.\n"
       << "- \"FOLLOWS\": one fact happens after the other in the same storyline.\n"
       << "- \"RELATE_TO\": same topic without causal or temporal order.\n"
       << "- \"NONE\": unrelated.\n"
       << "\"direction\" is \"A->B\" when A is the cause or comes first, \"B->A\" otherwise.\n"
       << "Output: {\"relation\":\"CAUSE|FOLLOWS|RELATE_TO|NONE\",\"direction\":\"A->B|B->A\","
       << "\"confidence\":0.0-1.0}\n";
    return ss.str();
}

std::string build_inference_prompt(const std::vector<const MemoryNode*>& chain) {
    std::ostringstream ss;
    ss << "Each fact below causes the next one:\n";
    for (size_t i = 0; i < chain.size(); ++i) {
        ss << (i + 1) << ". ";
        write_node_line(ss, *chain[i]);
    }
    ss << "\nState, in one sentence, the implication of the first fact on the last one. "
       << "Only use what the facts say.\n"
       << "Output: {\"text\":\"...\",\"key\":\"short topic label\",\"tags\":[\"...\"]}\n";
    return ss.str();
}

std::string build_aggregate_prompt(const std::vector<const MemoryNode*>& cluster) {
    std::ostringstream ss;
    ss << "The following facts share a topic:\n";
    for (const auto* node : cluster) {
        ss << "- ";
        write_node_line(ss, *node);
    }
    ss << "\nWrite one concise summary concept that covers all of them "
       << "without adding new information.\n"
       << "Output: {\"text\":\"...\",\"key\":\"short topic label\",\"tags\":[\"...\"]}\n";
    return ss.str();
}

std::string build_nli_prompt(const std::string& source, const std::vector<std::string>& targets) {
    std::ostringstream ss;
    ss << "Compare the source statement with each numbered target.\n"
       << "- \"Duplicate\": the target states the same fact.\n"
       << "- \"Contradiction\": both cannot be true at once.\n"
       << "- \"Unrelated\": anything else.\n\n"
       << "Source: " << source << "\n\nTargets:\n";
    for (size_t i = 0; i < targets.size(); ++i) {
        ss << i << ". " << targets[i] << "\n";
    }
    ss << "\nOutput a JSON array with exactly " << targets.size()
       << " labels in target order, e.g. [\"Duplicate\",\"Unrelated\"]\n";
    return ss.str();
}

} // namespace memweave
