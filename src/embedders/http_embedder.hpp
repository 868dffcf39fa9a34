#pragma once
#include "../embedder.hpp"
#include "../http.hpp"
#include <string>

namespace memweave {

// Unified HTTP-based embedder. Supports OpenAI-compatible and Ollama APIs
// by parameterizing the endpoint, auth, and response JSON paths.
class HttpEmbedder : public Embedder {
public:
    struct Config {
        std::string name;           // e.g. "openai", "ollama"
        std::string api_key;        // empty = no Authorization header
        std::string base_url;       // e.g. "https://api.openai.com/v1"
        std::string model;          // e.g. "text-embedding-3-small"
        std::string endpoint;       // URL path, e.g. "/embeddings"
        std::string list_path;      // JSON pointer to the result array, e.g. "/data"
        std::string item_path;      // JSON pointer inside each item, "" = item is the vector
        uint32_t default_dims = 0;  // fallback until first response
        long timeout_seconds = 30;
    };

    HttpEmbedder(Config config, HttpClient& http);

    std::vector<Embedding> embed_batch(const std::vector<std::string>& texts) override;
    uint32_t dimensions() const override { return dimensions_; }
    std::string embedder_name() const override { return config_.name; }

private:
    Config config_;
    HttpClient& http_;
    uint32_t dimensions_;
};

std::unique_ptr<Embedder> create_openai_embedder(
    const std::string& api_key, HttpClient& http,
    const std::string& base_url, const std::string& model, long timeout_seconds = 30);

std::unique_ptr<Embedder> create_ollama_embedder(
    HttpClient& http, const std::string& base_url, const std::string& model,
    long timeout_seconds = 30);

} // namespace memweave
