#include "llm_json.hpp"
#include "util.hpp"
#include <algorithm>

namespace memweave {

std::string extract_json_block(const std::string& text) {
    std::string s = text;

    // Prefer the body of a fenced block when present
    auto fence = s.find("```");
    if (fence != std::string::npos) {
        auto body_start = s.find('\n', fence);
        auto close = body_start == std::string::npos
            ? std::string::npos : s.find("```", body_start);
        if (body_start != std::string::npos) {
            s = s.substr(body_start + 1,
                         close == std::string::npos ? std::string::npos
                                                    : close - body_start - 1);
        }
    }

    auto obj = s.find('{');
    auto arr = s.find('[');
    size_t start = std::min(obj, arr);
    if (start == std::string::npos) return trim(s);

    char open = s[start];
    char close_ch = open == '{' ? '}' : ']';
    auto end = s.rfind(close_ch);
    if (end == std::string::npos || end < start) {
        // Truncated output: keep the tail for repair_json to close
        return trim(s.substr(start));
    }
    return s.substr(start, end - start + 1);
}

std::string repair_json(const std::string& json_str) {
    std::string s = json_str;

    // Balance braces (ignoring those inside string literals)
    int brace_count = 0;
    int bracket_count = 0;
    bool in_string = false;
    bool escaped = false;
    for (char c : s) {
        if (in_string) {
            if (escaped) escaped = false;
            else if (c == '\\') escaped = true;
            else if (c == '"') in_string = false;
            continue;
        }
        if (c == '"') in_string = true;
        else if (c == '{') brace_count++;
        else if (c == '}') brace_count--;
        else if (c == '[') bracket_count++;
        else if (c == ']') bracket_count--;
    }
    if (in_string) s += '"';

    // Append missing closing braces/brackets
    while (bracket_count > 0) {
        s += ']';
        bracket_count--;
    }
    while (brace_count > 0) {
        s += '}';
        brace_count--;
    }

    // Remove trailing commas before } or ]
    std::string result;
    result.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++) {
        if (s[i] == ',') {
            // Look ahead past whitespace for } or ]
            size_t j = i + 1;
            while (j < s.size() && (s[j] == ' ' || s[j] == '\t' || s[j] == '\n' || s[j] == '\r')) {
                j++;
            }
            if (j < s.size() && (s[j] == '}' || s[j] == ']')) {
                continue;
            }
        }
        result += s[i];
    }

    // Try to parse; if fails, return original
    if (nlohmann::json::accept(result)) return result;
    return json_str;
}

JsonParse parse_llm_json(const std::string& text) {
    JsonParse out;
    std::string block = extract_json_block(text);
    if (block.empty()) {
        out.error = "empty response";
        return out;
    }
    try {
        out.value = nlohmann::json::parse(repair_json(block));
    } catch (const nlohmann::json::exception& e) {
        out.error = std::string("invalid JSON: ") + e.what();
    }
    return out;
}

} // namespace memweave
