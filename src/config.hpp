#pragma once
#include <string>
#include <cstdint>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace memweave {

struct ProviderEntry {
    std::string api_key;
    std::string base_url;
};

// Language-model collaborator used by the goal parser, the reasoning engine
// and the "llm" NLI backend.
struct LlmConfig {
    std::string provider = "openai";
    std::string model = "gpt-4o-mini";
    double temperature = 0.0;
    uint32_t max_retries = 2;    // attempts per provider in ReliableProvider
    uint32_t timeout = 60;       // seconds per HTTP call
    std::string goal_mode = "fast"; // default Goal Parser mode: "fast" or "fine"
};

struct EmbeddingConfig {
    std::string provider = "openai"; // "openai" or "ollama"
    std::string model;               // empty = provider default
    std::string base_url;            // empty = provider default
    std::string api_key;             // empty = providers.<provider>.api_key
    uint32_t timeout = 30;
    uint32_t dimension = 0;          // 0 = fixed by the first write per namespace
};

struct StoreConfig {
    std::string backend = "sqlite";  // "sqlite" or "json"
    std::string path;                // empty = ~/.memweave/memory.db (or .json)
    std::string default_namespace = "default";
    uint32_t busy_timeout_ms = 5000;
};

struct NliConfig {
    std::string backend = "http";    // "http" or "llm"
    std::string base_url = "http://localhost:32532";
    uint32_t timeout = 10;
};

struct RetrieverConfig {
    double vector_weight = 1.0;
    double keyword_boost = 0.15;     // additive, never multiplicative
    double traversal_penalty = 0.1;
    uint32_t candidate_multiplier = 3;
    uint32_t top_k = 5;
};

struct CheckerConfig {
    uint32_t top_k = 5;
    bool fail_open = true;           // commit (degraded) when a collaborator fails
    bool merge_provenance = true;    // append candidate sources to the duplicate
};

struct ReasoningConfig {
    uint32_t top_k = 5;
    uint32_t parallelism = 4;        // concurrent pair classifications
    uint32_t max_attempts = 2;       // per pair / chain / cluster LLM call
};

struct Config {
    std::unordered_map<std::string, ProviderEntry> providers;

    LlmConfig llm;
    EmbeddingConfig embeddings;
    StoreConfig store;
    NliConfig nli;
    RetrieverConfig retriever;
    CheckerConfig checker;
    ReasoningConfig reasoning;

    // Load from ~/.memweave/config.json + env vars
    static Config load();

    // Load from an explicit file + env vars. When write_back is set, missing
    // defaults are merged into the file.
    static Config load_from(const std::string& path, bool write_back);

    // Parse a config JSON document (no env overrides, no file I/O)
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Get API key for a provider name
    std::string api_key_for(const std::string& provider) const;

    // Get base URL for a provider name (empty = use provider default)
    std::string base_url_for(const std::string& provider) const;

    // Store path with the backend-specific default applied
    std::string resolved_store_path() const;
};

} // namespace memweave
