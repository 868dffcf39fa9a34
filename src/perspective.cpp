#include "perspective.hpp"
#include "util.hpp"
#include <cctype>
#include <cstdint>

namespace memweave {

static bool is_word_byte(unsigned char c) {
    return std::isalnum(c) || c == '\'' || c == '_';
}

static std::string expand_role(const std::string& replacement, const std::string& role_name) {
    return replace_all(replacement, "{role}", role_name);
}

// Whole-word, case-insensitive replacement. Words are runs of ASCII
// alphanumerics plus apostrophes, so "I'm" is one word and "Mime" never
// matches "me". Multi-byte UTF-8 always separates words.
static std::string replace_words(const std::string& text, const std::string& pattern,
                                 const std::string& replacement) {
    std::string lowered_pattern = to_lower(pattern);
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (!is_word_byte(static_cast<unsigned char>(text[i]))) {
            out += text[i++];
            continue;
        }
        size_t start = i;
        while (i < text.size() && is_word_byte(static_cast<unsigned char>(text[i]))) ++i;
        std::string word = text.substr(start, i - start);
        out += to_lower(word) == lowered_pattern ? replacement : word;
    }
    return out;
}

PerspectiveRules::PerspectiveRules() {
    LanguageRules en;
    en.role_names = {{"user", "User"}, {"assistant", "Assistant"}};
    // Contractions before the bare pronoun; "I'm" must not become "User'm".
    en.rules = {
        {"I'm", "{role} is"},
        {"I've", "{role} has"},
        {"I'll", "{role} will"},
        {"I'd", "{role} would"},
        {"myself", "{role} himself"},
        {"mine", "{role}'s"},
        {"my", "{role}'s"},
        {"me", "{role}"},
        {"I", "{role}"},
    };
    languages_["en"] = std::move(en);

    LanguageRules zh;
    zh.role_names = {{"user", "用户"}, {"assistant", "助手"}};
    zh.rules = {
        {"我", "{role}", false},
    };
    languages_["zh"] = std::move(zh);
}

void PerspectiveRules::add_language(const std::string& lang, LanguageRules rules) {
    languages_[lang] = std::move(rules);
}

bool PerspectiveRules::has_language(const std::string& lang) const {
    return languages_.count(lang) > 0;
}

std::string PerspectiveRules::adjust(const std::string& text, const std::string& role,
                                     const std::string& lang) const {
    if (text.empty() || role.empty()) return text;
    auto it = languages_.find(lang.empty() ? detect_lang(text) : to_lower(lang));
    if (it == languages_.end()) return text;

    const auto& table = it->second;
    auto name = table.role_names.find(to_lower(role));
    if (name == table.role_names.end()) return text;

    std::string out = text;
    for (const auto& rule : table.rules) {
        std::string replacement = expand_role(rule.replacement, name->second);
        out = rule.whole_word ? replace_words(out, rule.pattern, replacement)
                              : replace_all(out, rule.pattern, replacement);
    }
    return out;
}

std::string detect_lang(const std::string& text) {
    for (size_t i = 0; i + 2 < text.size(); ++i) {
        auto b0 = static_cast<unsigned char>(text[i]);
        if ((b0 & 0xF0) != 0xE0) continue;
        auto b1 = static_cast<unsigned char>(text[i + 1]);
        auto b2 = static_cast<unsigned char>(text[i + 2]);
        if ((b1 & 0xC0) != 0x80 || (b2 & 0xC0) != 0x80) continue;
        uint32_t cp = ((b0 & 0x0Fu) << 12) | ((b1 & 0x3Fu) << 6) | (b2 & 0x3Fu);
        if (cp >= 0x4E00 && cp <= 0x9FFF) return "zh";
    }
    return "en";
}

} // namespace memweave
