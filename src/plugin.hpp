#pragma once
#include "graph_store.hpp"
#include "provider.hpp"
#include "embedder.hpp"
#include "nli.hpp"
#include "http.hpp"
#include "config.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <mutex>

namespace memweave {

// Factory function types
using StoreFactory = std::function<std::unique_ptr<GraphStore>(const Config& config)>;

using ProviderFactory = std::function<std::unique_ptr<Provider>(
    const Config& config, HttpClient& http)>;

using EmbedderFactory = std::function<std::unique_ptr<Embedder>(
    const Config& config, HttpClient& http)>;

// provider is null when no language model is configured.
using NliFactory = std::function<std::unique_ptr<NliClassifier>(
    const Config& config, HttpClient& http, Provider* provider)>;

// Name -> factory table for every pluggable backend. Built explicitly and
// passed to whoever needs it; there is no process-wide instance.
// All methods are thread-safe.
class BackendRegistry {
public:
    BackendRegistry() = default;

    // Registry pre-populated with register_builtin_backends().
    static BackendRegistry with_builtins();

    BackendRegistry(BackendRegistry&& other) noexcept;
    BackendRegistry& operator=(BackendRegistry&&) = delete;
    BackendRegistry(const BackendRegistry&) = delete;
    BackendRegistry& operator=(const BackendRegistry&) = delete;

    // Registration (a later registration under the same name wins)
    void register_store(const std::string& name, StoreFactory factory);
    void register_provider(const std::string& name, ProviderFactory factory);
    void register_embedder(const std::string& name, EmbedderFactory factory);
    void register_nli(const std::string& name, NliFactory factory);

    // Creation. Unknown names throw std::invalid_argument.
    std::unique_ptr<GraphStore> create_store(const std::string& name,
                                             const Config& config) const;
    std::unique_ptr<Provider> create_provider(const std::string& name,
                                              const Config& config,
                                              HttpClient& http) const;
    std::unique_ptr<Embedder> create_embedder(const std::string& name,
                                              const Config& config,
                                              HttpClient& http) const;
    std::unique_ptr<NliClassifier> create_nli(const std::string& name,
                                              const Config& config,
                                              HttpClient& http,
                                              Provider* provider) const;

    // Query
    bool has_store(const std::string& name) const;
    bool has_provider(const std::string& name) const;
    bool has_embedder(const std::string& name) const;
    bool has_nli(const std::string& name) const;
    std::vector<std::string> store_names() const;
    std::vector<std::string> provider_names() const;
    std::vector<std::string> embedder_names() const;
    std::vector<std::string> nli_names() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, StoreFactory> stores_;
    std::unordered_map<std::string, ProviderFactory> providers_;
    std::unordered_map<std::string, EmbedderFactory> embedders_;
    std::unordered_map<std::string, NliFactory> nlis_;
};

// Stores "sqlite" and "json", providers and embedders "openai" and "ollama",
// NLI backends "http" and "llm".
void register_builtin_backends(BackendRegistry& registry);

} // namespace memweave
