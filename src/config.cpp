#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace memweave {

nlohmann::json Config::defaults_json() {
    return {
        {"providers", {
            {"openai", {{"api_key", ""}, {"base_url", ""}}},
            {"ollama", {{"base_url", "http://localhost:11434"}}}
        }},
        {"llm", {
            {"provider", "openai"},
            {"model", "gpt-4o-mini"},
            {"temperature", 0.0},
            {"max_retries", 2},
            {"timeout", 60},
            {"goal_mode", "fast"}
        }},
        {"embeddings", {
            {"provider", "openai"},
            {"model", ""},
            {"base_url", ""},
            {"timeout", 30},
            {"dimension", 0}
        }},
        {"store", {
            {"backend", "sqlite"},
            {"path", ""},
            {"namespace", "default"},
            {"busy_timeout_ms", 5000}
        }},
        {"nli", {
            {"backend", "http"},
            {"base_url", "http://localhost:32532"},
            {"timeout", 10}
        }},
        {"retriever", {
            {"vector_weight", 1.0},
            {"keyword_boost", 0.15},
            {"traversal_penalty", 0.1},
            {"candidate_multiplier", 3},
            {"top_k", 5}
        }},
        {"checker", {
            {"top_k", 5},
            {"fail_open", true},
            {"merge_provenance", true}
        }},
        {"reasoning", {
            {"top_k", 5},
            {"parallelism", 4},
            {"max_attempts", 2}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                     const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

// ── Typed field readers (wrong-typed values keep the default) ──

static void read(const nlohmann::json& obj, const char* name, std::string& out) {
    if (obj.contains(name) && obj[name].is_string()) out = obj[name].get<std::string>();
}

static void read(const nlohmann::json& obj, const char* name, uint32_t& out) {
    if (obj.contains(name) && obj[name].is_number_integer() && obj[name].get<int64_t>() >= 0)
        out = obj[name].get<uint32_t>();
}

static void read(const nlohmann::json& obj, const char* name, double& out) {
    if (obj.contains(name) && obj[name].is_number()) out = obj[name].get<double>();
}

static void read(const nlohmann::json& obj, const char* name, bool& out) {
    if (obj.contains(name) && obj[name].is_boolean()) out = obj[name].get<bool>();
}

static const nlohmann::json& section(const nlohmann::json& j, const char* name) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (j.contains(name) && j[name].is_object()) return j[name];
    return empty;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    for (auto& [name, obj] : section(j, "providers").items()) {
        if (!obj.is_object()) continue;
        ProviderEntry entry;
        read(obj, "api_key", entry.api_key);
        read(obj, "base_url", entry.base_url);
        cfg.providers[name] = std::move(entry);
    }

    const auto& llm = section(j, "llm");
    read(llm, "provider", cfg.llm.provider);
    read(llm, "model", cfg.llm.model);
    read(llm, "temperature", cfg.llm.temperature);
    read(llm, "max_retries", cfg.llm.max_retries);
    read(llm, "timeout", cfg.llm.timeout);
    read(llm, "goal_mode", cfg.llm.goal_mode);

    const auto& emb = section(j, "embeddings");
    read(emb, "provider", cfg.embeddings.provider);
    read(emb, "model", cfg.embeddings.model);
    read(emb, "base_url", cfg.embeddings.base_url);
    read(emb, "api_key", cfg.embeddings.api_key);
    read(emb, "timeout", cfg.embeddings.timeout);
    read(emb, "dimension", cfg.embeddings.dimension);

    const auto& store = section(j, "store");
    read(store, "backend", cfg.store.backend);
    read(store, "path", cfg.store.path);
    read(store, "namespace", cfg.store.default_namespace);
    read(store, "busy_timeout_ms", cfg.store.busy_timeout_ms);

    const auto& nli = section(j, "nli");
    read(nli, "backend", cfg.nli.backend);
    read(nli, "base_url", cfg.nli.base_url);
    read(nli, "timeout", cfg.nli.timeout);

    const auto& ret = section(j, "retriever");
    read(ret, "vector_weight", cfg.retriever.vector_weight);
    read(ret, "keyword_boost", cfg.retriever.keyword_boost);
    read(ret, "traversal_penalty", cfg.retriever.traversal_penalty);
    read(ret, "candidate_multiplier", cfg.retriever.candidate_multiplier);
    read(ret, "top_k", cfg.retriever.top_k);

    const auto& chk = section(j, "checker");
    read(chk, "top_k", cfg.checker.top_k);
    read(chk, "fail_open", cfg.checker.fail_open);
    read(chk, "merge_provenance", cfg.checker.merge_provenance);

    const auto& rsn = section(j, "reasoning");
    read(rsn, "top_k", cfg.reasoning.top_k);
    read(rsn, "parallelism", cfg.reasoning.parallelism);
    read(rsn, "max_attempts", cfg.reasoning.max_attempts);

    if (cfg.reasoning.parallelism == 0) cfg.reasoning.parallelism = 1;
    if (cfg.reasoning.max_attempts == 0) cfg.reasoning.max_attempts = 1;
    if (cfg.retriever.candidate_multiplier == 0) cfg.retriever.candidate_multiplier = 1;

    return cfg;
}

static void apply_env_overrides(Config& cfg) {
    // Environment variables always override config file
    if (const char* v = std::getenv("OPENAI_API_KEY"))
        cfg.providers["openai"].api_key = v;
    if (const char* v = std::getenv("OPENAI_BASE_URL"))
        cfg.providers["openai"].base_url = v;
    if (const char* v = std::getenv("OLLAMA_BASE_URL"))
        cfg.providers["ollama"].base_url = v;
    if (const char* v = std::getenv("MEMWEAVE_LLM_PROVIDER"))
        cfg.llm.provider = v;
    if (const char* v = std::getenv("MEMWEAVE_LLM_MODEL"))
        cfg.llm.model = v;
    if (const char* v = std::getenv("MEMWEAVE_STORE_PATH"))
        cfg.store.path = v;
    if (const char* v = std::getenv("MEMWEAVE_NLI_URL"))
        cfg.nli.base_url = v;
}

Config Config::load_from(const std::string& path, bool write_back) {
    nlohmann::json j;

    std::ifstream file(path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (write_back && j != original) {
                if (atomic_write_file(path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: " << path << "\n";
                }
            }
        } catch (const nlohmann::json::exception& e) {
            // Config file is malformed: fall back to defaults
            std::cerr << "[config] Ignoring malformed " << path << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (write_back && atomic_write_file(path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << path << "\n";
        }
    }

    Config cfg = from_json(j);
    apply_env_overrides(cfg);
    return cfg;
}

Config Config::load() {
    return load_from(expand_home("~/.memweave/config.json"), true);
}

std::string Config::api_key_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.api_key;
    return {};
}

std::string Config::base_url_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.base_url;
    return {};
}

std::string Config::resolved_store_path() const {
    if (!store.path.empty()) return expand_home(store.path);
    if (store.backend == "json") return expand_home("~/.memweave/memory.json");
    return expand_home("~/.memweave/memory.db");
}

} // namespace memweave
