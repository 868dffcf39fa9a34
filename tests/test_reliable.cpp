#include <catch2/catch.hpp>
#include "providers/reliable.hpp"
#include "errors.hpp"
#include <stdexcept>

using namespace memweave;

// ── Mock provider for testing retry logic ────────────────────────

class FlakyProvider : public Provider {
public:
    int fail_count;     // how many calls should throw before succeeding
    int call_count = 0;
    std::string name;
    ErrorKind kind = ErrorKind::CollaboratorUnavailable;

    FlakyProvider(const std::string& name, int fail_count)
        : fail_count(fail_count), name(name) {}

    ChatResponse chat(const std::vector<ChatMessage>&,
                      const std::string&,
                      double) override {
        call_count++;
        if (call_count <= fail_count) {
            throw CollaboratorError(kind,
                                    name + " failed attempt " + std::to_string(call_count));
        }
        ChatResponse resp;
        resp.content = "response from " + name;
        return resp;
    }

    std::string provider_name() const override { return name; }
};

static std::vector<ChatMessage> one_message() {
    return {{Role::User, "hello"}};
}

// ── Constructor ──────────────────────────────────────────────────

TEST_CASE("ReliableProvider: requires at least one provider", "[reliable]") {
    std::vector<std::unique_ptr<Provider>> empty;
    REQUIRE_THROWS_AS(
        ReliableProvider(std::move(empty)),
        std::invalid_argument
    );
}

// ── Successful first try ─────────────────────────────────────────

TEST_CASE("ReliableProvider: succeeds on first try", "[reliable]") {
    std::vector<std::unique_ptr<Provider>> providers;
    auto p = std::make_unique<FlakyProvider>("p1", 0);
    auto* raw = p.get();
    providers.push_back(std::move(p));

    ReliableProvider reliable(std::move(providers));
    auto resp = reliable.chat(one_message(), "model", 0.0);
    REQUIRE(resp.content == "response from p1");
    REQUIRE(raw->call_count == 1);
}

// ── Retry ────────────────────────────────────────────────────────

TEST_CASE("ReliableProvider: retries on failure then succeeds", "[reliable]") {
    std::vector<std::unique_ptr<Provider>> providers;
    auto p = std::make_unique<FlakyProvider>("p1", 2);
    auto* raw = p.get();
    providers.push_back(std::move(p));

    ReliableProvider reliable(std::move(providers), 3);
    auto resp = reliable.chat(one_message(), "model", 0.0);
    REQUIRE(resp.content == "response from p1");
    REQUIRE(raw->call_count == 3);
}

TEST_CASE("ReliableProvider: zero retries still tries once", "[reliable]") {
    std::vector<std::unique_ptr<Provider>> providers;
    auto p = std::make_unique<FlakyProvider>("p1", 5);
    auto* raw = p.get();
    providers.push_back(std::move(p));

    ReliableProvider reliable(std::move(providers), 0);
    REQUIRE_THROWS_AS(reliable.chat(one_message(), "model", 0.0), CollaboratorError);
    REQUIRE(raw->call_count == 1);
}

// ── Fallback ─────────────────────────────────────────────────────

TEST_CASE("ReliableProvider: falls back to second provider", "[reliable]") {
    std::vector<std::unique_ptr<Provider>> providers;
    auto p1 = std::make_unique<FlakyProvider>("p1", 100);
    auto p2 = std::make_unique<FlakyProvider>("p2", 0);
    auto* raw1 = p1.get();
    auto* raw2 = p2.get();
    providers.push_back(std::move(p1));
    providers.push_back(std::move(p2));

    ReliableProvider reliable(std::move(providers), 2);
    auto resp = reliable.chat(one_message(), "model", 0.0);
    REQUIRE(resp.content == "response from p2");
    REQUIRE(raw1->call_count == 2);
    REQUIRE(raw2->call_count == 1);
}

TEST_CASE("ReliableProvider: malformed reply skips remaining retries", "[reliable]") {
    std::vector<std::unique_ptr<Provider>> providers;
    auto p1 = std::make_unique<FlakyProvider>("p1", 100);
    p1->kind = ErrorKind::MalformedResponse;
    auto p2 = std::make_unique<FlakyProvider>("p2", 0);
    auto* raw1 = p1.get();
    providers.push_back(std::move(p1));
    providers.push_back(std::move(p2));

    ReliableProvider reliable(std::move(providers), 3);
    REQUIRE(reliable.chat(one_message(), "model", 0.0).content == "response from p2");
    REQUIRE(raw1->call_count == 1);
}

// ── All fail ─────────────────────────────────────────────────────

TEST_CASE("ReliableProvider: throws unavailable when all providers fail", "[reliable]") {
    std::vector<std::unique_ptr<Provider>> providers;
    providers.push_back(std::make_unique<FlakyProvider>("p1", 100));
    providers.push_back(std::make_unique<FlakyProvider>("p2", 100));

    ReliableProvider reliable(std::move(providers), 1);
    try {
        reliable.chat(one_message(), "model", 0.0);
        FAIL("expected CollaboratorError");
    } catch (const CollaboratorError& e) {
        REQUIRE(e.kind() == ErrorKind::CollaboratorUnavailable);
        REQUIRE(std::string(e.what()).find("p2 failed attempt 1") != std::string::npos);
    }
}

TEST_CASE("ReliableProvider: chat_simple retries and succeeds", "[reliable]") {
    std::vector<std::unique_ptr<Provider>> providers;
    providers.push_back(std::make_unique<FlakyProvider>("p1", 1));

    ReliableProvider reliable(std::move(providers), 2);
    REQUIRE(reliable.chat_simple("sys", "msg", "model", 0.0) == "response from p1");
}

TEST_CASE("ReliableProvider: provider_name is reliable", "[reliable]") {
    std::vector<std::unique_ptr<Provider>> providers;
    providers.push_back(std::make_unique<FlakyProvider>("p1", 0));
    ReliableProvider reliable(std::move(providers));
    REQUIRE(reliable.provider_name() == "reliable");
}
