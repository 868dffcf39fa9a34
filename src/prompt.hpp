#pragma once
#include "memory.hpp"
#include <string>
#include <vector>

namespace memweave {

enum class GoalMode { Fast, Fine };

// System prompt for goal parsing in the given mode.
std::string build_goal_system_prompt(GoalMode mode);

// User message for goal parsing.
std::string build_goal_prompt(const std::string& task, GoalMode mode);

// Follow-up after a response failed validation.
std::string build_goal_correction(const std::string& task,
                                  const std::string& previous_output,
                                  const std::string& validation_error);

// Pairwise relation classification between anchor and neighbor.
std::string build_relation_prompt(const MemoryNode& anchor, const MemoryNode& neighbor);

// One inferred fact from a Causes chain (ordered cause -> effect).
std::string build_inference_prompt(const std::vector<const MemoryNode*>& chain);

// One aggregate concept summarizing a cluster.
std::string build_aggregate_prompt(const std::vector<const MemoryNode*>& cluster);

// NLI classification of source against numbered targets.
std::string build_nli_prompt(const std::string& source, const std::vector<std::string>& targets);

// Shared system prompt for the JSON-only reasoning calls.
std::string build_reasoning_system_prompt();

} // namespace memweave
