#include <catch2/catch.hpp>
#include "mock_http_client.hpp"
#include "fakes.hpp"
#include "nli/http_nli.hpp"
#include "nli/llm_nli.hpp"
#include <nlohmann/json.hpp>

using namespace memweave;
using json = nlohmann::json;

// ════════════════════════════════════════════════════════════════
// HTTP NLI service
// ════════════════════════════════════════════════════════════════

TEST_CASE("HttpNliClient: empty targets makes no call", "[nli][http]") {
    MockHttpClient mock;
    HttpNliClient client(mock, "http://nli:32532");
    auto batch = client.compare_one_to_many("I like apples", {});
    REQUIRE(batch.results.empty());
    REQUIRE(batch.ok());
    REQUIRE(mock.call_count == 0);
}

TEST_CASE("HttpNliClient: posts source and targets", "[nli][http]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"results": ["Duplicate", "Contradiction", "Unrelated"]})"};

    HttpNliClient client(mock, "http://nli:32532/", 7);
    auto batch = client.compare_one_to_many(
        "I like apples", {"I like apples", "I dislike apples", "It is sunny"});

    REQUIRE(mock.last_url == "http://nli:32532/compare_one_to_many");
    REQUIRE(mock.last_timeout == 7);
    auto body = json::parse(mock.last_body);
    REQUIRE(body["source"] == "I like apples");
    REQUIRE(body["targets"].size() == 3);

    REQUIRE(batch.ok());
    REQUIRE(batch.results == std::vector<NliResult>{
        NliResult::Duplicate, NliResult::Contradiction, NliResult::Unrelated});
}

TEST_CASE("HttpNliClient: accepts a bare label array", "[nli][http]") {
    MockHttpClient mock;
    mock.next_response = {200, R"(["contradiction"])"};
    HttpNliClient client(mock, "http://nli");
    auto batch = client.compare_one_to_many("a", {"b"});
    REQUIRE(batch.ok());
    REQUIRE(batch.results[0] == NliResult::Contradiction);
}

TEST_CASE("HttpNliClient: service error yields unrelated batch", "[nli][http]") {
    MockHttpClient mock;
    mock.next_response = {500, "boom"};
    HttpNliClient client(mock, "http://nli");
    auto batch = client.compare_one_to_many("a", {"b", "c"});

    REQUIRE_FALSE(batch.ok());
    REQUIRE(batch.error == ErrorKind::CollaboratorUnavailable);
    REQUIRE(batch.results.size() == 2);
    REQUIRE(batch.results[0] == NliResult::Unrelated);
    REQUIRE(batch.results[1] == NliResult::Unrelated);
}

TEST_CASE("HttpNliClient: malformed responses", "[nli][http]") {
    MockHttpClient mock;
    HttpNliClient client(mock, "http://nli");

    SECTION("invalid JSON") {
        mock.next_response = {200, "{oops"};
    }
    SECTION("no result array") {
        mock.next_response = {200, R"({"labels": "Duplicate"})"};
    }

    auto batch = client.compare_one_to_many("a", {"b"});
    REQUIRE(batch.error == ErrorKind::MalformedResponse);
    REQUIRE(batch.results == std::vector<NliResult>{NliResult::Unrelated});
}

TEST_CASE("HttpNliClient: short or unknown labels fall back per entry", "[nli][http]") {
    MockHttpClient mock;
    mock.next_response = {200, R"(["Duplicate", "Maybe"])"};
    HttpNliClient client(mock, "http://nli");
    auto batch = client.compare_one_to_many("a", {"b", "c", "d"});

    REQUIRE(batch.error == ErrorKind::MalformedResponse);
    REQUIRE(batch.results.size() == 3);
    REQUIRE(batch.results[0] == NliResult::Duplicate);
    REQUIRE(batch.results[1] == NliResult::Unrelated);
    REQUIRE(batch.results[2] == NliResult::Unrelated);
}

// ════════════════════════════════════════════════════════════════
// LLM-backed NLI
// ════════════════════════════════════════════════════════════════

TEST_CASE("LlmNliClassifier: parses a label array", "[nli][llm]") {
    ScriptedProvider provider;
    provider.replies.push_back("```json\n[\"Duplicate\", \"Contradiction\"]\n```");

    LlmNliClassifier nli(provider, "gpt-4o-mini");
    auto batch = nli.compare_one_to_many("User likes apples",
                                         {"User likes apples", "User dislikes apples"});
    REQUIRE(batch.ok());
    REQUIRE(batch.results == std::vector<NliResult>{
        NliResult::Duplicate, NliResult::Contradiction});
    REQUIRE(provider.prompts.size() == 1);
    REQUIRE(provider.prompts[0].find("Source: User likes apples") != std::string::npos);
}

TEST_CASE("LlmNliClassifier: accepts a results object", "[nli][llm]") {
    ScriptedProvider provider;
    provider.replies.push_back(R"({"results": ["Unrelated"]})");
    LlmNliClassifier nli(provider, "m");
    auto batch = nli.compare_one_to_many("a", {"b"});
    REQUIRE(batch.ok());
    REQUIRE(batch.results[0] == NliResult::Unrelated);
}

TEST_CASE("LlmNliClassifier: wrong label count is malformed", "[nli][llm]") {
    ScriptedProvider provider;
    provider.replies.push_back(R"(["Duplicate"])");
    LlmNliClassifier nli(provider, "m");
    auto batch = nli.compare_one_to_many("a", {"b", "c"});
    REQUIRE(batch.error == ErrorKind::MalformedResponse);
    REQUIRE(batch.results.size() == 2);
    REQUIRE(batch.results[0] == NliResult::Unrelated);
}

TEST_CASE("LlmNliClassifier: provider failure is unavailable", "[nli][llm]") {
    ScriptedProvider provider;
    provider.fail = true;
    LlmNliClassifier nli(provider, "m");
    auto batch = nli.compare_one_to_many("a", {"b"});
    REQUIRE(batch.error == ErrorKind::CollaboratorUnavailable);
    REQUIRE(batch.results == std::vector<NliResult>{NliResult::Unrelated});
}

TEST_CASE("LlmNliClassifier: empty targets makes no call", "[nli][llm]") {
    ScriptedProvider provider;
    LlmNliClassifier nli(provider, "m");
    REQUIRE(nli.compare_one_to_many("a", {}).results.empty());
    REQUIRE(provider.call_count == 0);
    REQUIRE(nli.classifier_name() == "llm");
}
