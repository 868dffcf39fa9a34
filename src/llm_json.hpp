#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace memweave {

// Pull the JSON payload out of LLM text: strips ``` fences and any prose
// around the first top-level object or array.
std::string extract_json_block(const std::string& text);

// Try to repair malformed JSON from LLM output: balances unclosed
// braces/brackets and drops trailing commas. Returns the input unchanged
// when the repaired text still does not parse.
std::string repair_json(const std::string& json_str);

// Result of parsing LLM output: either a value or a reason it failed.
struct JsonParse {
    std::optional<nlohmann::json> value;
    std::string error;

    explicit operator bool() const { return value.has_value(); }
};

// extract_json_block + repair_json + parse.
JsonParse parse_llm_json(const std::string& text);

} // namespace memweave
