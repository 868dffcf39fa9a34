#include <catch2/catch.hpp>
#include "context.hpp"
#include "plugin.hpp"
#include "fakes.hpp"
#include "mock_http_client.hpp"
#include <algorithm>
#include <set>

using namespace memweave;

namespace {

const char* kGroupGoal = R"({
    "memories": ["Caroline went to the LGBTQ support group"],
    "keys": ["Caroline"],
    "tags": ["support group"],
    "goal_type": "retrieval"
})";

struct ConversationFixture {
    MockHttpClient http;
    WordEmbedder* embedder = nullptr;
    ScriptedProvider* provider = nullptr;
    RuleNli* nli = nullptr;
    std::unique_ptr<CoreContext> ctx;

    ConversationFixture() {
        auto emb = std::make_unique<WordEmbedder>(128);
        auto prov = std::make_unique<ScriptedProvider>();
        auto rule = std::make_unique<RuleNli>();
        embedder = emb.get();
        provider = prov.get();
        nli = rule.get();
        provider->responder = [](const std::string&, const std::string&) {
            return std::string(kGroupGoal);
        };

        Config config;
        ctx = assemble_context(config, http, std::make_unique<FlakyStore>(), std::move(emb),
                               std::move(prov), std::move(rule));
    }

    CommitResult remember(const std::string& text, const std::string& key = "",
                          std::set<std::string> tags = {}) {
        MemoryNode node;
        node.text = text;
        node.key = key;
        node.tags = std::move(tags);
        node.sources.push_back({"locomo", "user", "en", text, {}});
        return add_memory(*ctx, node, ctx->default_namespace());
    }
};

bool contains_id(const RetrievalResult& result, const std::string& id) {
    return std::any_of(result.nodes.begin(), result.nodes.end(),
                       [&](const MemoryNode& n) { return n.id == id; });
}

} // namespace

TEST_CASE_METHOD(ConversationFixture, "End to end: remembered fact is found again", "[e2e]") {
    auto group = remember("Caroline went to the LGBTQ support group", "Caroline",
                          {"event", "support group"});
    auto adoption = remember("Caroline is researching adoption agencies", "Caroline");
    auto painting = remember("Melanie painted a sunrise last year", "Melanie");
    REQUIRE(group.status == CommitStatus::Committed);
    REQUIRE(adoption.status == CommitStatus::Committed);
    REQUIRE(painting.status == CommitStatus::Committed);

    auto result = search_memories(*ctx, "When did Caroline go to the support group?",
                                  GoalMode::Fast, ctx->default_namespace());
    REQUIRE(result.status == RetrievalStatus::Ok);
    REQUIRE_FALSE(result.nodes.empty());
    REQUIRE(result.nodes[0].id == group.node_id);
    REQUIRE(result.nodes.size() <= ctx->config.retriever.top_k);
    REQUIRE(provider->call_count == 1);
}

TEST_CASE_METHOD(ConversationFixture, "End to end: both support group facts rank on top", "[e2e]") {
    auto joined = remember("Caroline joined the LGBTQ support group in 2023.", "Caroline");
    auto weekly = remember("She attended the weekly LGBTQ support group meetings every Friday.");
    remember("Melanie painted a sunrise last year", "Melanie");
    remember("The trains run late on Sundays");

    auto result = search_memories(*ctx, "When did Caroline go to the LGBTQ support group?",
                                  GoalMode::Fast, ctx->default_namespace(), 5);
    REQUIRE(result.status == RetrievalStatus::Ok);
    REQUIRE(result.nodes[0].id == joined.node_id);
    REQUIRE(contains_id(result, weekly.node_id));
}

TEST_CASE_METHOD(ConversationFixture, "End to end: repeated fact is stored once", "[e2e]") {
    auto first = remember("Caroline went to the LGBTQ support group");
    auto second = remember("Caroline went to the LGBTQ support group");

    REQUIRE(first.status == CommitStatus::Committed);
    REQUIRE(second.status == CommitStatus::SkippedDuplicate);
    REQUIRE(second.existing_id == first.node_id);
    REQUIRE(ctx->store->count(ctx->default_namespace()) == 1);

    auto stored = ctx->store->get_node(first.node_id, ctx->default_namespace());
    REQUIRE(stored->sources.size() == 2);
}

TEST_CASE_METHOD(ConversationFixture, "End to end: contradiction is kept and flagged", "[e2e]") {
    nli->rule = [](const std::string& source, const std::string& target) {
        bool s_not = source.find(" not ") != std::string::npos;
        bool t_not = target.find(" not ") != std::string::npos;
        return s_not != t_not ? NliResult::Contradiction : NliResult::Unrelated;
    };

    auto first = remember("Caroline is going to the support group");
    auto second = remember("Caroline is not going to the support group");

    REQUIRE(second.status == CommitStatus::Flagged);
    REQUIRE(second.existing_id == first.node_id);
    REQUIRE(ctx->store->count(ctx->default_namespace()) == 2);
    auto flagged = ctx->store->get_node(second.node_id, ctx->default_namespace());
    REQUIRE(flagged->conflict_with == first.node_id);
}

TEST_CASE_METHOD(ConversationFixture, "End to end: embedder outage degrades search", "[e2e]") {
    auto group = remember("Caroline went to the LGBTQ support group", "Caroline",
                          {"support group"});
    REQUIRE(group.status == CommitStatus::Committed);

    embedder->fail = true;
    auto result = search_memories(*ctx, "When did Caroline go to the support group?",
                                  GoalMode::Fast, ctx->default_namespace());

    REQUIRE(result.status == RetrievalStatus::Degraded);
    REQUIRE(result.error == ErrorKind::CollaboratorUnavailable);
    REQUIRE(std::find(result.errors.begin(), result.errors.end(),
                      "query embedding unavailable") != result.errors.end());
    REQUIRE(contains_id(result, group.node_id));

    // Writes need an embedding and are refused while the embedder is down
    auto refused = remember("Melanie painted a sunrise");
    REQUIRE(refused.status == CommitStatus::Rejected);
}

TEST_CASE_METHOD(ConversationFixture, "End to end: namespaces are isolated", "[e2e]") {
    REQUIRE(remember("Caroline went to the LGBTQ support group", "Caroline").status
            == CommitStatus::Committed);

    auto result = search_memories(*ctx, "When did Caroline go to the support group?",
                                  GoalMode::Fast, "someone-else");
    REQUIRE(result.status == RetrievalStatus::NoMatches);
    REQUIRE(result.nodes.empty());
}

TEST_CASE_METHOD(ConversationFixture, "End to end: unparseable goal still searches", "[e2e]") {
    auto group = remember("Caroline went to the LGBTQ support group");
    provider->responder = [](const std::string&, const std::string&) {
        return std::string("Sorry, I cannot help with that.");
    };

    auto result = search_memories(*ctx, "Caroline went to the LGBTQ support group",
                                  GoalMode::Fine, ctx->default_namespace());
    REQUIRE(provider->call_count == 2);
    REQUIRE(result.status == RetrievalStatus::Ok);
    REQUIRE(result.nodes[0].id == group.node_id);
}

TEST_CASE("End to end: context from a registry", "[e2e]") {
    auto registry = BackendRegistry::with_builtins();
    registry.register_provider("scripted", [](const Config&, HttpClient&) {
        return std::make_unique<ScriptedProvider>();
    });
    registry.register_embedder("word", [](const Config&, HttpClient&) {
        return std::make_unique<WordEmbedder>();
    });
    registry.register_nli("rule", [](const Config&, HttpClient&, Provider*) {
        return std::make_unique<RuleNli>();
    });

    Config config;
    config.store.backend = "json";
    config.store.path = ":memory:";
    config.llm.provider = "scripted";
    config.embeddings.provider = "word";
    config.nli.backend = "rule";

    MockHttpClient http;
    auto ctx = create_context(config, registry, http);
    REQUIRE(ctx->store->backend_name() == "json");
    REQUIRE(ctx->embedder->embedder_name() == "word");
    REQUIRE(ctx->provider->provider_name() == "reliable");
    REQUIRE(ctx->nli->classifier_name() == "rule");

    MemoryNode node;
    node.text = "Melanie painted a sunrise";
    REQUIRE(add_memory(*ctx, node, ctx->default_namespace()).status == CommitStatus::Committed);
    REQUIRE(http.call_count == 0);

    config.nli.backend = "missing";
    REQUIRE_THROWS_AS(create_context(config, registry, http), std::invalid_argument);
}
