#pragma once
#include <string>
#include <vector>
#include <unordered_map>

namespace memweave {

// One rewrite. {role} in the replacement expands to the language's display
// name for the speaker ("User", "用户", ...).
struct PerspectiveRule {
    std::string pattern;
    std::string replacement;
    bool whole_word = true;  // ASCII word boundaries, case-insensitive
};

struct LanguageRules {
    std::unordered_map<std::string, std::string> role_names; // "user" -> "User"
    std::vector<PerspectiveRule> rules;                       // applied in order
};

// Rewrites first-person chat text into third person so "I like apples" from
// the user compares against stored "User likes apples". Rewriting is
// deterministic and idempotent: replacements never produce a pattern.
class PerspectiveRules {
public:
    // Built-in English and Chinese tables.
    PerspectiveRules();

    // Add or replace the table for a language.
    void add_language(const std::string& lang, LanguageRules rules);

    bool has_language(const std::string& lang) const;

    // Unknown roles or languages leave the text unchanged. An empty lang is
    // detected from the text.
    std::string adjust(const std::string& text, const std::string& role,
                       const std::string& lang) const;

private:
    std::unordered_map<std::string, LanguageRules> languages_;
};

// "zh" when the text contains a CJK ideograph, else "en".
std::string detect_lang(const std::string& text);

} // namespace memweave
