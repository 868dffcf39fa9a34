#include "goal_parser.hpp"
#include "llm_json.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <iostream>

using json = nlohmann::json;

namespace memweave {

std::optional<GoalMode> goal_mode_from_string(const std::string& s) {
    std::string lower = to_lower(trim(s));
    if (lower == "fast") return GoalMode::Fast;
    if (lower == "fine") return GoalMode::Fine;
    return std::nullopt;
}

// Reads an optional array-of-strings field. Returns false (with error set)
// when the field is present but has the wrong shape.
static bool read_string_array(const json& obj, const char* field,
                              std::vector<std::string>& out, std::string& error) {
    if (!obj.contains(field) || obj[field].is_null()) return true;
    const auto& arr = obj[field];
    if (!arr.is_array()) {
        error = std::string("\"") + field + "\" must be an array of strings";
        return false;
    }
    for (const auto& item : arr) {
        if (!item.is_string()) {
            error = std::string("\"") + field + "\" must contain only strings";
            return false;
        }
        std::string value = trim(item.get<std::string>());
        if (!value.empty()) out.push_back(std::move(value));
    }
    return true;
}

GoalParse validate_goal(const std::string& llm_text, const std::string& task, GoalMode mode) {
    GoalParse result;
    auto parsed = parse_llm_json(llm_text);
    if (!parsed) {
        result.error = "not valid JSON: " + parsed.error;
        return result;
    }
    const json& obj = *parsed.value;
    if (!obj.is_object()) {
        result.error = "expected a JSON object";
        return result;
    }

    ParsedTaskGoal goal;
    if (!read_string_array(obj, "memories", goal.memories, result.error) ||
        !read_string_array(obj, "keys", goal.keys, result.error) ||
        !read_string_array(obj, "tags", goal.tags, result.error)) {
        return result;
    }

    if (obj.contains("goal_type") && !obj["goal_type"].is_null()) {
        std::optional<GoalType> type;
        if (obj["goal_type"].is_string()) {
            type = goal_type_from_string(obj["goal_type"].get<std::string>());
        }
        if (!type) {
            result.error = "\"goal_type\" must be one of retrieval, update, other";
            return result;
        }
        goal.goal_type = *type;
    }

    if (goal.memories.empty()) {
        if (mode == GoalMode::Fine) {
            result.error = "\"memories\" must be a non-empty array of strings";
            return result;
        }
        goal.memories.push_back(task);
    }

    result.goal = std::move(goal);
    return result;
}

ParsedTaskGoal fallback_goal(const std::string& task) {
    ParsedTaskGoal goal;
    goal.memories.push_back(task);
    goal.goal_type = GoalType::Retrieval;
    goal.fallback = true;
    return goal;
}

GoalParser::GoalParser(Provider& provider, const std::string& model, double temperature)
    : provider_(provider), model_(model), temperature_(temperature) {}

ParsedTaskGoal GoalParser::parse(const std::string& task, GoalMode mode) {
    std::vector<ChatMessage> messages = {
        {Role::System, build_goal_system_prompt(mode)},
        {Role::User, build_goal_prompt(task, mode)}
    };

    try {
        std::string reply = provider_.chat(messages, model_, temperature_).content;
        auto first = validate_goal(reply, task, mode);
        if (first) return std::move(*first.goal);

        std::cerr << "[goal_parser] Invalid goal (" << first.error << "), retrying\n";
        messages.back().content = build_goal_correction(task, reply, first.error);

        reply = provider_.chat(messages, model_, temperature_).content;
        auto second = validate_goal(reply, task, mode);
        if (second) return std::move(*second.goal);

        std::cerr << "[goal_parser] Invalid goal after retry (" << second.error
                  << "), using fallback\n";
    } catch (const CollaboratorError& e) {
        std::cerr << "[goal_parser] LLM unavailable (" << error_kind_to_string(e.kind())
                  << "): " << e.what() << ", using fallback\n";
    } catch (const std::exception& e) {
        std::cerr << "[goal_parser] LLM call raised: " << e.what() << ", using fallback\n";
    }
    return fallback_goal(task);
}

} // namespace memweave
