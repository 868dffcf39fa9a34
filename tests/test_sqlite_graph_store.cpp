#include <catch2/catch.hpp>
#include "memory/sqlite_graph_store.hpp"
#include "fakes.hpp"
#include <atomic>
#include <cstdio>
#include <thread>
#include <unistd.h>

using namespace memweave;
using Catch::Matchers::WithinAbs;

namespace {

// Unique database per fixture, removed with its WAL side files.
struct SqliteStoreFixture {
    std::string path;
    WordEmbedder emb;

    SqliteStoreFixture() {
        static int counter = 0;
        path = "/tmp/memweave_sqlite_store_" + std::to_string(getpid()) + "_" +
               std::to_string(counter++) + ".db";
        remove_files();
    }
    ~SqliteStoreFixture() { remove_files(); }

    void remove_files() {
        std::remove(path.c_str());
        std::remove((path + "-wal").c_str());
        std::remove((path + "-shm").c_str());
    }
};

} // namespace

TEST_CASE_METHOD(SqliteStoreFixture, "SqliteGraphStore: add and get node", "[sqlite_store]") {
    SqliteGraphStore store(path);
    auto node = make_node(emb, "n1", "User likes apples");
    node.key = "fruit";
    node.tags = {"food", "preference"};
    node.memory_type = MemoryType::UserMemory;
    node.sources.push_back({"chat", "user", "en", "I like apples", {}});

    REQUIRE(store.add_node(node, "alice"));
    auto got = store.get_node("n1", "alice");
    REQUIRE(got.has_value());
    REQUIRE(got->text == "User likes apples");
    REQUIRE(got->key == "fruit");
    REQUIRE(got->tags.size() == 2);
    REQUIRE(got->memory_type == MemoryType::UserMemory);
    REQUIRE(got->embedding == node.embedding);
    REQUIRE(got->sources.size() == 1);
    REQUIRE(got->sources[0].role == "user");
    REQUIRE(got->updated_at == 1000);
    REQUIRE(store.count("alice") == 1);
    REQUIRE(store.backend_name() == "sqlite");
}

TEST_CASE_METHOD(SqliteStoreFixture, "SqliteGraphStore: namespaces are isolated", "[sqlite_store]") {
    SqliteGraphStore store(path);
    REQUIRE(store.add_node(make_node(emb, "n1", "User likes apples"), "alice"));
    REQUIRE(store.add_node(make_node(emb, "n1", "User likes trains"), "bob"));

    REQUIRE(store.get_node("n1", "alice")->text == "User likes apples");
    REQUIRE(store.get_node("n1", "bob")->text == "User likes trains");
    REQUIRE(store.keyword_search({"apples"}, "bob", std::nullopt, 5).empty());
}

TEST_CASE_METHOD(SqliteStoreFixture, "SqliteGraphStore: duplicate id is rejected", "[sqlite_store]") {
    SqliteGraphStore store(path);
    REQUIRE(store.add_node(make_node(emb, "n1", "first"), "ns"));
    REQUIRE_FALSE(store.add_node(make_node(emb, "n1", "second"), "ns"));
    REQUIRE(store.count("ns") == 1);
}

TEST_CASE_METHOD(SqliteStoreFixture, "SqliteGraphStore: dimension is fixed per namespace", "[sqlite_store]") {
    SqliteGraphStore store(path);
    WordEmbedder small(8);

    REQUIRE(store.dimension("ns") == 0);
    REQUIRE(store.add_node(make_node(emb, "n1", "User likes apples"), "ns"));
    REQUIRE(store.dimension("ns") == 32);
    REQUIRE_FALSE(store.add_node(make_node(small, "n2", "User likes pears"), "ns"));
    REQUIRE(store.add_node(make_node(small, "n2", "User likes pears"), "other"));
    REQUIRE(store.dimension("other") == 8);
}

TEST_CASE_METHOD(SqliteStoreFixture, "SqliteGraphStore: configured dimension", "[sqlite_store]") {
    SqliteGraphStore store(path, 16);
    REQUIRE(store.dimension("ns") == 16);
    REQUIRE_FALSE(store.add_node(make_node(emb, "n1", "User likes apples"), "ns"));
    WordEmbedder sixteen(16);
    REQUIRE(store.add_node(make_node(sixteen, "n1", "User likes apples"), "ns"));
}

TEST_CASE_METHOD(SqliteStoreFixture, "SqliteGraphStore: vector search ranks by cosine", "[sqlite_store]") {
    SqliteGraphStore store(path);
    REQUIRE(store.add_node(make_node(emb, "a", "apples and pears"), "ns"));
    REQUIRE(store.add_node(make_node(emb, "b", "trains and buses"), "ns"));

    auto results = store.vector_search(emb.vectorize("apples and pears"), "ns",
                                       std::nullopt, 1);
    REQUIRE(results.size() == 1);
    REQUIRE(results[0].id == "a");
    REQUIRE_THAT(results[0].score, WithinAbs(1.0, 1e-5));
}

TEST_CASE_METHOD(SqliteStoreFixture, "SqliteGraphStore: keyword search uses tokens and substrings", "[sqlite_store]") {
    SqliteGraphStore store(path);
    auto group = make_node(emb, "g", "Caroline went to the LGBTQ support group");
    group.key = "support group";
    auto paint = make_node(emb, "p", "Melanie painted a sunrise");
    paint.tags = {"painting"};
    REQUIRE(store.add_node(group, "ns"));
    REQUIRE(store.add_node(paint, "ns"));

    auto token = store.keyword_search({"caroline"}, "ns", std::nullopt, 5);
    REQUIRE(token.size() == 1);
    REQUIRE(token[0].id == "g");

    // "paint" is only a prefix of the stored words
    auto partial = store.keyword_search({"paint"}, "ns", std::nullopt, 5);
    REQUIRE(partial.size() == 1);
    REQUIRE(partial[0].id == "p");

    auto mixed = store.keyword_search({"support group", "sunrise"}, "ns", std::nullopt, 5);
    REQUIRE(mixed.size() == 2);
    REQUIRE_THAT(mixed[0].score, WithinAbs(0.5, 1e-9));
}

TEST_CASE_METHOD(SqliteStoreFixture, "SqliteGraphStore: keyword wildcards match literally", "[sqlite_store]") {
    SqliteGraphStore store(path);
    REQUIRE(store.add_node(make_node(emb, "apples", "bought 1000 apples"), "ns"));
    REQUIRE(store.add_node(make_node(emb, "sale", "got a 50% discount"), "ns"));
    REQUIRE(store.add_node(make_node(emb, "file", "renamed my_notes.txt"), "ns"));
    REQUIRE(store.add_node(make_node(emb, "path", "saved to C:\\temp"), "ns"));

    REQUIRE(store.keyword_search({"100%"}, "ns", std::nullopt, 5).empty());

    auto percent = store.keyword_search({"50%"}, "ns", std::nullopt, 5);
    REQUIRE(percent.size() == 1);
    REQUIRE(percent[0].id == "sale");

    auto underscore = store.keyword_search({"my_n"}, "ns", std::nullopt, 5);
    REQUIRE(underscore.size() == 1);
    REQUIRE(underscore[0].id == "file");
    REQUIRE(store.keyword_search({"1_00"}, "ns", std::nullopt, 5).empty());

    auto backslash = store.keyword_search({":\\te"}, "ns", std::nullopt, 5);
    REQUIRE(backslash.size() == 1);
    REQUIRE(backslash[0].id == "path");
}

TEST_CASE_METHOD(SqliteStoreFixture, "SqliteGraphStore: keyword search matches CJK substrings", "[sqlite_store]") {
    SqliteGraphStore store(path);
    REQUIRE(store.add_node(make_node(emb, "z", "用户喜欢苹果"), "ns"));
    auto results = store.keyword_search({"苹果"}, "ns", std::nullopt, 5);
    REQUIRE(results.size() == 1);
    REQUIRE(results[0].id == "z");
}

TEST_CASE_METHOD(SqliteStoreFixture, "SqliteGraphStore: keyword ties break by recency", "[sqlite_store]") {
    SqliteGraphStore store(path);
    REQUIRE(store.add_node(make_node(emb, "old", "went hiking", 100), "ns"));
    REQUIRE(store.add_node(make_node(emb, "new", "went hiking again", 200), "ns"));

    auto results = store.keyword_search({"hiking"}, "ns", std::nullopt, 5);
    REQUIRE(results.size() == 2);
    REQUIRE(results[0].id == "new");
    REQUIRE(results[1].id == "old");
}

TEST_CASE_METHOD(SqliteStoreFixture, "SqliteGraphStore: searches skip archived and respect scope", "[sqlite_store]") {
    SqliteGraphStore store(path);
    auto archived = make_node(emb, "a", "User likes apples");
    archived.status = NodeStatus::Archived;
    auto working = make_node(emb, "w", "User likes apples now");
    working.memory_type = MemoryType::WorkingMemory;
    REQUIRE(store.add_node(archived, "ns"));
    REQUIRE(store.add_node(working, "ns"));

    auto all = store.keyword_search({"apples"}, "ns", std::nullopt, 5);
    REQUIRE(all.size() == 1);
    REQUIRE(all[0].id == "w");
    REQUIRE(store.vector_search(emb.vectorize("apples"), "ns",
                                MemoryType::UserMemory, 5).empty());
}

TEST_CASE_METHOD(SqliteStoreFixture, "SqliteGraphStore: update keeps the search index current", "[sqlite_store]") {
    SqliteGraphStore store(path);
    auto node = make_node(emb, "n1", "User likes apples");
    REQUIRE(store.add_node(node, "ns"));

    node.text = "User likes oranges";
    node.embedding = emb.vectorize(node.text);
    REQUIRE(store.update_node(node, "ns"));

    REQUIRE(store.keyword_search({"apples"}, "ns", std::nullopt, 5).empty());
    REQUIRE(store.keyword_search({"oranges"}, "ns", std::nullopt, 5).size() == 1);

    auto missing = make_node(emb, "zz", "nothing");
    REQUIRE_FALSE(store.update_node(missing, "ns"));
}

TEST_CASE_METHOD(SqliteStoreFixture, "SqliteGraphStore: edge invariants", "[sqlite_store]") {
    SqliteGraphStore store(path);
    REQUIRE(store.add_node(make_node(emb, "early", "woke up", 100), "ns"));
    REQUIRE(store.add_node(make_node(emb, "late", "had breakfast", 200), "ns"));

    REQUIRE_FALSE(store.add_edge({"early", "missing", RelationType::Causes, 1.0}, "ns"));
    REQUIRE_FALSE(store.add_edge({"late", "early", RelationType::Follows, 1.0}, "ns"));
    REQUIRE_FALSE(store.add_edge({"early", "early", RelationType::RelatedTo, 1.0}, "ns"));
    REQUIRE(store.add_edge({"early", "late", RelationType::Follows, 1.0}, "ns"));
    REQUIRE(store.add_edge({"early", "late", RelationType::Causes, 0.6}, "ns"));

    auto edges = store.edges("late", "ns");
    REQUIRE(edges.size() == 2);
}

TEST_CASE_METHOD(SqliteStoreFixture, "SqliteGraphStore: delete removes touching edges", "[sqlite_store]") {
    SqliteGraphStore store(path);
    REQUIRE(store.add_node(make_node(emb, "a", "rain"), "ns"));
    REQUIRE(store.add_node(make_node(emb, "b", "wet streets"), "ns"));
    REQUIRE(store.add_edge({"a", "b", RelationType::Causes, 0.8}, "ns"));

    REQUIRE(store.delete_node("a", "ns"));
    REQUIRE(store.edges("b", "ns").empty());
    REQUIRE(store.keyword_search({"rain"}, "ns", std::nullopt, 5).empty());
    REQUIRE_FALSE(store.delete_node("a", "ns"));
}

TEST_CASE_METHOD(SqliteStoreFixture, "SqliteGraphStore: failed delete leaves the graph usable", "[sqlite_store]") {
    SqliteGraphStore store(path);
    REQUIRE(store.add_node(make_node(emb, "a", "rain"), "ns"));
    REQUIRE(store.add_node(make_node(emb, "b", "wet streets"), "ns"));
    REQUIRE(store.add_edge({"a", "b", RelationType::Causes, 0.8}, "ns"));

    REQUIRE_FALSE(store.delete_node("missing", "ns"));
    REQUIRE_FALSE(store.delete_node("a", "other"));
    REQUIRE(store.edges("a", "ns").size() == 1);

    // No transaction is left open behind the failed deletes
    REQUIRE(store.add_node(make_node(emb, "c", "umbrellas sold out"), "ns"));
    REQUIRE(store.delete_node("b", "ns"));
    REQUIRE(store.edges("a", "ns").empty());
    REQUIRE(store.count("ns") == 2);

    SqliteGraphStore reopened(path);
    REQUIRE(reopened.count("ns") == 2);
    REQUIRE_FALSE(reopened.get_node("b", "ns").has_value());
}

TEST_CASE_METHOD(SqliteStoreFixture, "SqliteGraphStore: commit_artifact rolls back on a bad edge", "[sqlite_store]") {
    SqliteGraphStore store(path);
    REQUIRE(store.add_node(make_node(emb, "a", "rain"), "ns"));

    auto node = make_node(emb, "x", "rain makes streets wet");
    std::vector<MemoryEdge> bad = {
        {"x", "a", RelationType::RelatedTo, 1.0},
        {"x", "missing", RelationType::RelatedTo, 1.0}
    };
    REQUIRE_FALSE(store.commit_artifact(node, bad, "ns"));
    REQUIRE_FALSE(store.get_node("x", "ns").has_value());
    REQUIRE(store.edges("a", "ns").empty());

    REQUIRE(store.commit_artifact(node, {{"x", "a", RelationType::RelatedTo, 1.0}}, "ns"));
    REQUIRE(store.edges("a", "ns").size() == 1);
}

TEST_CASE_METHOD(SqliteStoreFixture, "SqliteGraphStore: aggregate node with members", "[sqlite_store]") {
    SqliteGraphStore store(path);
    REQUIRE(store.add_node(make_node(emb, "a", "went hiking"), "ns"));
    REQUIRE(store.add_node(make_node(emb, "b", "went camping"), "ns"));

    auto agg = make_node(emb, "agg", "Outdoor activities");
    agg.node_type = "aggregate";
    agg.sources.push_back({"aggregate", "", "", "", {"a"}});
    agg.sources.push_back({"aggregate", "", "", "", {"b"}});
    REQUIRE(store.commit_artifact(agg, {
        {"agg", "a", RelationType::Aggregates, 1.0},
        {"agg", "b", RelationType::Aggregates, 1.0}
    }, "ns"));

    auto members = store.traverse("agg", {RelationType::Aggregates}, 1, "ns");
    REQUIRE(members.size() == 2);
}

TEST_CASE_METHOD(SqliteStoreFixture, "SqliteGraphStore: persists across reopen", "[sqlite_store]") {
    {
        SqliteGraphStore store(path);
        REQUIRE(store.add_node(make_node(emb, "a", "rain", 100), "ns"));
        REQUIRE(store.add_node(make_node(emb, "b", "wet streets", 200), "ns"));
        REQUIRE(store.add_edge({"a", "b", RelationType::Causes, 0.7}, "ns"));
    }
    SqliteGraphStore reopened(path);
    REQUIRE(reopened.count("ns") == 2);
    REQUIRE(reopened.dimension("ns") == 32);
    REQUIRE(reopened.edges("a", "ns").size() == 1);
    REQUIRE(reopened.keyword_search({"streets"}, "ns", std::nullopt, 5).size() == 1);
}

TEST_CASE_METHOD(SqliteStoreFixture, "SqliteGraphStore: snapshot round trip into another namespace", "[sqlite_store]") {
    SqliteGraphStore store(path);
    REQUIRE(store.add_node(make_node(emb, "a", "rain", 100), "ns"));
    REQUIRE(store.add_node(make_node(emb, "b", "wet streets", 200), "ns"));
    REQUIRE(store.add_edge({"a", "b", RelationType::Follows, 1.0}, "ns"));

    std::string doc = store.snapshot_export("ns");
    REQUIRE(store.snapshot_import(doc, "copy") == 2);
    REQUIRE(store.count("copy") == 2);
    auto edges = store.edges("a", "copy");
    REQUIRE(edges.size() == 1);
    REQUIRE(edges[0].relation_type == RelationType::Follows);

    REQUIRE(store.snapshot_import("{broken", "copy") == 0);
}

TEST_CASE_METHOD(SqliteStoreFixture, "SqliteGraphStore: concurrent writers", "[sqlite_store]") {
    SqliteGraphStore store(path);
    std::atomic<int> added{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < 10; ++i) {
                std::string id = "t" + std::to_string(t) + "_" + std::to_string(i);
                MemoryNode node;
                node.id = id;
                node.text = "fact " + id;
                node.embedding = Embedding(32, 0.5f);
                if (store.add_node(node, "ns")) added++;
            }
        });
    }
    for (auto& th : threads) th.join();
    REQUIRE(added == 40);
    REQUIRE(store.count("ns") == 40);
}
