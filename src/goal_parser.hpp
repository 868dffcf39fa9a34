#pragma once
#include "memory.hpp"
#include "prompt.hpp"
#include "provider.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace memweave {

// Result of validating one LLM answer: a goal or the reason it was rejected.
struct GoalParse {
    std::optional<ParsedTaskGoal> goal;
    std::string error;

    explicit operator bool() const { return goal.has_value(); }
};

// "fast" / "fine" (case-insensitive); anything else is nullopt.
std::optional<GoalMode> goal_mode_from_string(const std::string& s);

// Validate an LLM answer against the goal schema. In Fast mode missing
// fields default (memories to [task]); in Fine mode memories is required
// and must be non-empty.
GoalParse validate_goal(const std::string& llm_text, const std::string& task, GoalMode mode);

// Minimal plan used when the LLM cannot produce a valid one.
ParsedTaskGoal fallback_goal(const std::string& task);

// Turns a free-text task into a ParsedTaskGoal. Never throws: an invalid
// answer gets one corrective retry, then the fallback goal is returned.
class GoalParser {
public:
    GoalParser(Provider& provider, const std::string& model, double temperature = 0.0);

    ParsedTaskGoal parse(const std::string& task, GoalMode mode = GoalMode::Fast);

private:
    Provider& provider_;
    std::string model_;
    double temperature_;
};

} // namespace memweave
