#include <catch2/catch.hpp>
#include "consistency_checker.hpp"
#include "fakes.hpp"

using namespace memweave;

namespace {

bool has(const std::string& text, const std::string& part) {
    return to_lower(text).find(part) != std::string::npos;
}

// Duplicate when equal ignoring case; contradiction when exactly one side
// "dislikes" the same object.
NliResult likes_rule(const std::string& source, const std::string& target) {
    if (to_lower(source) == to_lower(target)) return NliResult::Duplicate;
    if (has(source, "apples") && has(target, "apples") &&
        has(source, "dislike") != has(target, "dislike")) {
        return NliResult::Contradiction;
    }
    return NliResult::Unrelated;
}

struct CheckerFixture {
    FlakyStore store;
    WordEmbedder emb;
    RuleNli nli;
    PerspectiveRules rules;
    CheckerConfig config;
    HybridRetriever retriever{store, RetrieverConfig{}};

    CheckerFixture() { nli.rule = likes_rule; }

    ConsistencyChecker checker() {
        return ConsistencyChecker(store, emb, retriever, nli, config, rules);
    }

    static MemoryNode fact(const std::string& text) {
        MemoryNode node;
        node.text = text;
        return node;
    }
};

} // namespace

TEST_CASE_METHOD(CheckerFixture, "ConsistencyChecker: new fact is committed", "[checker]") {
    auto c = checker();
    auto result = c.check_and_commit(fact("User likes apples"), "alice");

    REQUIRE(result.status == CommitStatus::Committed);
    REQUIRE_FALSE(result.degraded);
    REQUIRE_FALSE(result.node_id.empty());

    auto stored = store.get_node(result.node_id, "alice");
    REQUIRE(stored.has_value());
    REQUIRE(stored->status == NodeStatus::Activated);
    REQUIRE(stored->embedding.size() == 32);
    REQUIRE(stored->created_at > 0);
    REQUIRE(stored->updated_at == stored->created_at);
}

TEST_CASE_METHOD(CheckerFixture, "ConsistencyChecker: same fact twice is skipped", "[checker]") {
    auto c = checker();
    auto first = c.check_and_commit(fact("User likes apples"), "alice");
    auto second = c.check_and_commit(fact("User likes apples"), "alice");

    REQUIRE(first.status == CommitStatus::Committed);
    REQUIRE(second.status == CommitStatus::SkippedDuplicate);
    REQUIRE(second.existing_id == first.node_id);
    REQUIRE(second.node_id.empty());
    REQUIRE(store.count("alice") == 1);
}

TEST_CASE_METHOD(CheckerFixture, "ConsistencyChecker: contradiction is flagged, original untouched", "[checker]") {
    auto c = checker();
    auto first = c.check_and_commit(fact("User likes apples"), "alice");
    auto before = store.get_node(first.node_id, "alice");

    auto second = c.check_and_commit(fact("User dislikes apples"), "alice");
    REQUIRE(second.status == CommitStatus::Flagged);
    REQUIRE(second.existing_id == first.node_id);
    REQUIRE(second.message == "contradicts: User likes apples");

    auto flagged = store.get_node(second.node_id, "alice");
    REQUIRE(flagged.has_value());
    REQUIRE(flagged->conflict_with == first.node_id);
    REQUIRE(flagged->text == "User dislikes apples");

    auto after = store.get_node(first.node_id, "alice");
    REQUIRE(after->text == before->text);
    REQUIRE(after->updated_at == before->updated_at);
    REQUIRE(after->status == NodeStatus::Activated);

    auto edges = store.edges(first.node_id, "alice");
    REQUIRE(edges.size() == 1);
    REQUIRE(edges[0].source_id == second.node_id);
    REQUIRE(edges[0].relation_type == RelationType::Contradicts);
}

TEST_CASE_METHOD(CheckerFixture, "ConsistencyChecker: duplicate wins over contradiction", "[checker]") {
    auto c = checker();
    REQUIRE(c.check_and_commit(fact("User dislikes apples"), "alice").status
            == CommitStatus::Committed);
    auto dup = c.check_and_commit(fact("User likes apples"), "alice");
    REQUIRE(dup.status == CommitStatus::Flagged);

    // Both the duplicate and the contradicting node are neighbors now
    auto again = c.check_and_commit(fact("User likes apples"), "alice");
    REQUIRE(again.status == CommitStatus::SkippedDuplicate);
    REQUIRE(again.existing_id == dup.node_id);
}

TEST_CASE_METHOD(CheckerFixture, "ConsistencyChecker: compares third-person text", "[checker]") {
    auto c = checker();
    REQUIRE(c.check_and_commit(fact("User like apples"), "alice").status
            == CommitStatus::Committed);

    auto candidate = fact("I like apples");
    candidate.sources.push_back({"chat", "user", "en", "I like apples", {}});
    REQUIRE(c.adjusted_text(candidate) == "User like apples");

    auto result = c.check_and_commit(candidate, "alice");
    REQUIRE(nli.last_source == "User like apples");
    REQUIRE(result.status == CommitStatus::SkippedDuplicate);
}

TEST_CASE_METHOD(CheckerFixture, "ConsistencyChecker: first-person fact twice is skipped", "[checker]") {
    auto c = checker();
    auto candidate = fact("I like apples");
    candidate.sources.push_back({"chat", "user", "en", "I like apples", {}});

    auto first = c.check_and_commit(candidate, "alice");
    auto second = c.check_and_commit(candidate, "alice");

    REQUIRE(first.status == CommitStatus::Committed);
    REQUIRE(second.status == CommitStatus::SkippedDuplicate);
    REQUIRE(second.existing_id == first.node_id);
    REQUIRE(nli.last_targets == std::vector<std::string>{"User like apples"});
    REQUIRE(store.count("alice") == 1);
}

TEST_CASE_METHOD(CheckerFixture, "ConsistencyChecker: stored text keeps the original wording", "[checker]") {
    auto c = checker();
    auto candidate = fact("I moved to Berlin");
    candidate.sources.push_back({"chat", "user", "en", "I moved to Berlin", {}});
    auto result = c.check_and_commit(candidate, "alice");

    REQUIRE(result.status == CommitStatus::Committed);
    REQUIRE(store.get_node(result.node_id, "alice")->text == "I moved to Berlin");
}

TEST_CASE_METHOD(CheckerFixture, "ConsistencyChecker: duplicate merges new provenance", "[checker]") {
    auto c = checker();
    auto original = fact("User likes apples");
    original.sources.push_back({"chat", "user", "en", "first mention", {}});
    auto first = c.check_and_commit(original, "alice");

    auto repeat = fact("User likes apples");
    repeat.sources.push_back({"chat", "user", "en", "second mention", {}});
    auto second = c.check_and_commit(repeat, "alice");
    REQUIRE(second.status == CommitStatus::SkippedDuplicate);

    auto stored = store.get_node(first.node_id, "alice");
    REQUIRE(stored->sources.size() == 2);
    REQUIRE(stored->sources[1].content == "second mention");

    SECTION("merge disabled leaves sources alone") {
        config.merge_provenance = false;
        auto c2 = checker();
        auto third = fact("User likes apples");
        third.sources.push_back({"chat", "user", "en", "third mention", {}});
        REQUIRE(c2.check_and_commit(third, "alice").status == CommitStatus::SkippedDuplicate);
        REQUIRE(store.get_node(first.node_id, "alice")->sources.size() == 2);
    }
}

TEST_CASE_METHOD(CheckerFixture, "ConsistencyChecker: namespaces do not see each other", "[checker]") {
    auto c = checker();
    REQUIRE(c.check_and_commit(fact("User likes apples"), "alice").status
            == CommitStatus::Committed);
    REQUIRE(c.check_and_commit(fact("User likes apples"), "bob").status
            == CommitStatus::Committed);
}

TEST_CASE_METHOD(CheckerFixture, "ConsistencyChecker: invalid candidate is rejected", "[checker]") {
    auto c = checker();
    auto bad = fact("");
    auto result = c.check_and_commit(bad, "alice");
    REQUIRE(result.status == CommitStatus::Rejected);
    REQUIRE(result.error == ErrorKind::InvariantViolation);

    auto out_of_range = fact("User likes apples");
    out_of_range.confidence = 1.5;
    REQUIRE(c.check_and_commit(out_of_range, "alice").error == ErrorKind::InvariantViolation);
    REQUIRE(store.count("alice") == 0);
}

TEST_CASE_METHOD(CheckerFixture, "ConsistencyChecker: wrong embedding dimension is rejected", "[checker]") {
    auto c = checker();
    REQUIRE(c.check_and_commit(fact("User likes apples"), "alice").status
            == CommitStatus::Committed);

    auto odd = fact("User owns a bike");
    odd.embedding = Embedding(8, 0.5f);
    auto result = c.check_and_commit(odd, "alice");
    REQUIRE(result.status == CommitStatus::Rejected);
    REQUIRE(result.error == ErrorKind::InvariantViolation);
}

TEST_CASE_METHOD(CheckerFixture, "ConsistencyChecker: embedder down without embedding", "[checker]") {
    emb.fail = true;
    auto c = checker();
    auto result = c.check_and_commit(fact("User likes apples"), "alice");
    REQUIRE(result.status == CommitStatus::Rejected);
    REQUIRE(result.error == ErrorKind::CollaboratorUnavailable);
    REQUIRE(store.count("alice") == 0);
}

TEST_CASE_METHOD(CheckerFixture, "ConsistencyChecker: NLI failure", "[checker]") {
    auto c0 = checker();
    REQUIRE(c0.check_and_commit(fact("User likes apples"), "alice").status
            == CommitStatus::Committed);
    nli.fail = true;

    SECTION("fail-open commits degraded") {
        config.fail_open = true;
        auto c = checker();
        auto result = c.check_and_commit(fact("User likes apples"), "alice");
        REQUIRE(result.status == CommitStatus::Committed);
        REQUIRE(result.degraded);
        REQUIRE(store.count("alice") == 2);
    }
    SECTION("fail-closed rejects") {
        config.fail_open = false;
        auto c = checker();
        auto result = c.check_and_commit(fact("User likes apples"), "alice");
        REQUIRE(result.status == CommitStatus::Rejected);
        REQUIRE(result.error == ErrorKind::CollaboratorUnavailable);
        REQUIRE(store.count("alice") == 1);
    }
}

TEST_CASE_METHOD(CheckerFixture, "ConsistencyChecker: neighbor retrieval unavailable", "[checker]") {
    store.fail_vector = true;

    SECTION("fail-open commits degraded") {
        auto c = checker();
        auto result = c.check_and_commit(fact("User likes apples"), "alice");
        REQUIRE(result.status == CommitStatus::Committed);
        REQUIRE(result.degraded);
        REQUIRE(result.error == ErrorKind::CollaboratorUnavailable);
    }
    SECTION("fail-closed rejects") {
        config.fail_open = false;
        auto c = checker();
        auto result = c.check_and_commit(fact("User likes apples"), "alice");
        REQUIRE(result.status == CommitStatus::Rejected);
        REQUIRE(store.count("alice") == 0);
    }
}

TEST_CASE_METHOD(CheckerFixture, "ConsistencyChecker: store write failure", "[checker]") {
    store.fail_writes = true;
    auto c = checker();
    auto result = c.check_and_commit(fact("User likes apples"), "alice");
    REQUIRE(result.status == CommitStatus::Rejected);
    REQUIRE(result.error == ErrorKind::CollaboratorUnavailable);
}

TEST_CASE_METHOD(CheckerFixture, "ConsistencyChecker: cancelled before writing", "[checker]") {
    std::atomic<bool> cancel{true};
    auto c = checker();
    auto result = c.check_and_commit(fact("User likes apples"), "alice", &cancel);
    REQUIRE(result.status == CommitStatus::Rejected);
    REQUIRE(result.error == ErrorKind::Cancelled);
    REQUIRE(store.count("alice") == 0);
}

TEST_CASE("NamespaceLocks: one mutex per namespace", "[checker]") {
    NamespaceLocks locks;
    auto& a1 = locks.for_namespace("alice");
    auto& a2 = locks.for_namespace("alice");
    auto& b = locks.for_namespace("bob");
    REQUIRE(&a1 == &a2);
    REQUIRE(&a1 != &b);
}

TEST_CASE("commit_status_to_string", "[checker]") {
    REQUIRE(std::string(commit_status_to_string(CommitStatus::SkippedDuplicate))
            == "skipped_duplicate");
    REQUIRE(std::string(commit_status_to_string(CommitStatus::Flagged)) == "flagged");
}
