#include <catch2/catch.hpp>
#include "perspective.hpp"

using namespace memweave;

TEST_CASE("PerspectiveRules: rewrites first person for the user", "[perspective]") {
    PerspectiveRules rules;
    auto out = rules.adjust("I went to the store myself", "user", "en");
    REQUIRE(out == "User went to the store User himself");
}

TEST_CASE("PerspectiveRules: contractions and possessives", "[perspective]") {
    PerspectiveRules rules;
    REQUIRE(rules.adjust("I'm tired", "user", "en") == "User is tired");
    REQUIRE(rules.adjust("I've been to Paris", "user", "en") == "User has been to Paris");
    REQUIRE(rules.adjust("my dog likes me", "user", "en") == "User's dog likes User");
    REQUIRE(rules.adjust("That book is mine", "user", "en") == "That book is User's");
}

TEST_CASE("PerspectiveRules: assistant role uses its own name", "[perspective]") {
    PerspectiveRules rules;
    REQUIRE(rules.adjust("I'll check my notes", "assistant", "en")
            == "Assistant will check Assistant's notes");
}

TEST_CASE("PerspectiveRules: matches whole words only", "[perspective]") {
    PerspectiveRules rules;
    REQUIRE(rules.adjust("Mime artists in Miami", "user", "en") == "Mime artists in Miami");
    REQUIRE(rules.adjust("Ice and mint", "user", "en") == "Ice and mint");
}

TEST_CASE("PerspectiveRules: rewriting is idempotent", "[perspective]") {
    PerspectiveRules rules;
    auto once = rules.adjust("I told my sister I'm moving myself", "user", "en");
    auto twice = rules.adjust(once, "user", "en");
    REQUIRE(once == twice);
}

TEST_CASE("PerspectiveRules: Chinese table", "[perspective]") {
    PerspectiveRules rules;
    REQUIRE(rules.adjust("我喜欢苹果", "user", "zh") == "用户喜欢苹果");
    REQUIRE(rules.adjust("我喜欢苹果", "assistant", "zh") == "助手喜欢苹果");
}

TEST_CASE("PerspectiveRules: empty language is detected", "[perspective]") {
    PerspectiveRules rules;
    REQUIRE(rules.adjust("我喜欢苹果", "user", "") == "用户喜欢苹果");
    REQUIRE(rules.adjust("I like apples", "user", "") == "User like apples");
}

TEST_CASE("PerspectiveRules: unknown role or language leaves text unchanged", "[perspective]") {
    PerspectiveRules rules;
    REQUIRE(rules.adjust("I like apples", "narrator", "en") == "I like apples");
    REQUIRE(rules.adjust("I like apples", "user", "fr") == "I like apples");
    REQUIRE(rules.adjust("I like apples", "", "en") == "I like apples");
    REQUIRE(rules.adjust("", "user", "en").empty());
}

TEST_CASE("PerspectiveRules: add_language registers a new table", "[perspective]") {
    PerspectiveRules rules;
    REQUIRE_FALSE(rules.has_language("de"));

    LanguageRules de;
    de.role_names = {{"user", "Nutzer"}};
    de.rules = {{"ich", "{role}"}, {"mein", "{role}s"}};
    rules.add_language("de", de);

    REQUIRE(rules.has_language("de"));
    REQUIRE(rules.adjust("Ich mag mein Fahrrad", "user", "de") == "Nutzer mag Nutzers Fahrrad");
}

TEST_CASE("detect_lang: CJK ideographs mean zh", "[perspective]") {
    REQUIRE(detect_lang("hello") == "en");
    REQUIRE(detect_lang("I like 苹果") == "zh");
    REQUIRE(detect_lang("café") == "en");
}
