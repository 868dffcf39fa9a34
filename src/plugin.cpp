#include "plugin.hpp"
#include "memory/sqlite_graph_store.hpp"
#include "memory/json_graph_store.hpp"
#include "providers/openai.hpp"
#include "providers/ollama.hpp"
#include "embedders/http_embedder.hpp"
#include "nli/http_nli.hpp"
#include "nli/llm_nli.hpp"
#include <stdexcept>
#include <algorithm>

namespace memweave {

template <typename Map>
static std::vector<std::string> sorted_names(const Map& map) {
    std::vector<std::string> names;
    names.reserve(map.size());
    for (const auto& [name, _] : map) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

BackendRegistry BackendRegistry::with_builtins() {
    BackendRegistry registry;
    register_builtin_backends(registry);
    return registry;
}

BackendRegistry::BackendRegistry(BackendRegistry&& other) noexcept {
    std::lock_guard<std::mutex> lock(other.mutex_);
    stores_ = std::move(other.stores_);
    providers_ = std::move(other.providers_);
    embedders_ = std::move(other.embedders_);
    nlis_ = std::move(other.nlis_);
}

void BackendRegistry::register_store(const std::string& name, StoreFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    stores_[name] = std::move(factory);
}

void BackendRegistry::register_provider(const std::string& name, ProviderFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    providers_[name] = std::move(factory);
}

void BackendRegistry::register_embedder(const std::string& name, EmbedderFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    embedders_[name] = std::move(factory);
}

void BackendRegistry::register_nli(const std::string& name, NliFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    nlis_[name] = std::move(factory);
}

std::unique_ptr<GraphStore> BackendRegistry::create_store(const std::string& name,
                                                          const Config& config) const {
    StoreFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = stores_.find(name);
        if (it == stores_.end()) {
            throw std::invalid_argument("Unknown store backend: " + name);
        }
        factory = it->second;
    }
    return factory(config);
}

std::unique_ptr<Provider> BackendRegistry::create_provider(const std::string& name,
                                                           const Config& config,
                                                           HttpClient& http) const {
    ProviderFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = providers_.find(name);
        if (it == providers_.end()) {
            throw std::invalid_argument("Unknown provider: " + name);
        }
        factory = it->second;
    }
    return factory(config, http);
}

std::unique_ptr<Embedder> BackendRegistry::create_embedder(const std::string& name,
                                                           const Config& config,
                                                           HttpClient& http) const {
    EmbedderFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = embedders_.find(name);
        if (it == embedders_.end()) {
            throw std::invalid_argument("Unknown embedder: " + name);
        }
        factory = it->second;
    }
    return factory(config, http);
}

std::unique_ptr<NliClassifier> BackendRegistry::create_nli(const std::string& name,
                                                           const Config& config,
                                                           HttpClient& http,
                                                           Provider* provider) const {
    NliFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = nlis_.find(name);
        if (it == nlis_.end()) {
            throw std::invalid_argument("Unknown NLI backend: " + name);
        }
        factory = it->second;
    }
    return factory(config, http, provider);
}

bool BackendRegistry::has_store(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stores_.count(name) > 0;
}

bool BackendRegistry::has_provider(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return providers_.count(name) > 0;
}

bool BackendRegistry::has_embedder(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return embedders_.count(name) > 0;
}

bool BackendRegistry::has_nli(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nlis_.count(name) > 0;
}

std::vector<std::string> BackendRegistry::store_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sorted_names(stores_);
}

std::vector<std::string> BackendRegistry::provider_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sorted_names(providers_);
}

std::vector<std::string> BackendRegistry::embedder_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sorted_names(embedders_);
}

std::vector<std::string> BackendRegistry::nli_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sorted_names(nlis_);
}

void register_builtin_backends(BackendRegistry& registry) {
    registry.register_store("sqlite", [](const Config& config) {
        return std::make_unique<SqliteGraphStore>(config.resolved_store_path(),
                                                  config.embeddings.dimension,
                                                  static_cast<int>(config.store.busy_timeout_ms));
    });
    // "json" with store.path == ":memory:" stays in memory.
    registry.register_store("json", [](const Config& config) {
        std::string path = config.store.path == ":memory:" ? std::string()
                                                            : config.resolved_store_path();
        return std::make_unique<JsonGraphStore>(path, config.embeddings.dimension);
    });

    registry.register_provider("openai", [](const Config& config, HttpClient& http) {
        return std::make_unique<OpenAIProvider>(config.api_key_for("openai"), http,
                                                config.base_url_for("openai"),
                                                static_cast<long>(config.llm.timeout));
    });
    registry.register_provider("ollama", [](const Config& config, HttpClient& http) {
        return std::make_unique<OllamaProvider>(http, config.base_url_for("ollama"),
                                                static_cast<long>(config.llm.timeout));
    });

    registry.register_embedder("openai", [](const Config& config, HttpClient& http) {
        const auto& e = config.embeddings;
        std::string key = e.api_key.empty() ? config.api_key_for("openai") : e.api_key;
        std::string url = e.base_url.empty() ? config.base_url_for("openai") : e.base_url;
        return create_openai_embedder(key, http, url, e.model, static_cast<long>(e.timeout));
    });
    registry.register_embedder("ollama", [](const Config& config, HttpClient& http) {
        const auto& e = config.embeddings;
        std::string url = e.base_url.empty() ? config.base_url_for("ollama") : e.base_url;
        return create_ollama_embedder(http, url, e.model, static_cast<long>(e.timeout));
    });

    registry.register_nli("http", [](const Config& config, HttpClient& http, Provider*) {
        return std::make_unique<HttpNliClient>(http, config.nli.base_url,
                                               static_cast<long>(config.nli.timeout));
    });
    registry.register_nli("llm", [](const Config& config, HttpClient&, Provider* provider)
                                      -> std::unique_ptr<NliClassifier> {
        if (!provider) {
            throw std::invalid_argument("NLI backend 'llm' needs a language model provider");
        }
        return std::make_unique<LlmNliClassifier>(*provider, config.llm.model);
    });
}

} // namespace memweave
