#include "http_embedder.hpp"
#include "../errors.hpp"
#include <nlohmann/json.hpp>

namespace memweave {

HttpEmbedder::HttpEmbedder(Config config, HttpClient& http)
    : config_(std::move(config))
    , http_(http)
    , dimensions_(config_.default_dims)
{}

std::vector<Embedding> HttpEmbedder::embed_batch(const std::vector<std::string>& texts) {
    if (texts.empty()) return {};

    nlohmann::json body = {
        {"model", config_.model},
        {"input", texts}
    };

    std::vector<Header> headers = {
        {"Content-Type", "application/json"}
    };
    if (!config_.api_key.empty()) {
        headers.push_back({"Authorization", "Bearer " + config_.api_key});
    }

    auto response = http_.post(
        config_.base_url + config_.endpoint, body.dump(), headers, config_.timeout_seconds);
    if (response.status_code != 200) {
        throw CollaboratorError(ErrorKind::CollaboratorUnavailable,
                                config_.name + " embeddings HTTP " +
                                std::to_string(response.status_code) + ": " + response.body);
    }

    std::vector<Embedding> result;
    try {
        auto j = nlohmann::json::parse(response.body);
        const auto& list = j.at(nlohmann::json::json_pointer(config_.list_path));
        if (!list.is_array()) {
            throw CollaboratorError(ErrorKind::MalformedResponse,
                                    config_.name + " embeddings: result is not an array");
        }
        result.resize(list.size());
        for (size_t i = 0; i < list.size(); ++i) {
            const auto& item = list[i];
            // OpenAI items carry their input position; honour it when present
            size_t slot = i;
            if (item.is_object() && item.contains("index") && item["index"].is_number_unsigned()) {
                slot = item["index"].get<size_t>();
            }
            if (slot >= result.size()) slot = i;
            const auto& arr = config_.item_path.empty()
                ? item : item.at(nlohmann::json::json_pointer(config_.item_path));
            Embedding vec;
            vec.reserve(arr.size());
            for (const auto& val : arr) {
                vec.push_back(val.get<float>());
            }
            result[slot] = std::move(vec);
        }
    } catch (const nlohmann::json::exception& e) {
        throw CollaboratorError(ErrorKind::MalformedResponse,
                                config_.name + " embeddings: " + e.what());
    }

    if (result.size() != texts.size()) {
        throw CollaboratorError(ErrorKind::MalformedResponse,
                                config_.name + " embeddings: expected " +
                                std::to_string(texts.size()) + " vectors, got " +
                                std::to_string(result.size()));
    }
    if (!result.empty()) dimensions_ = static_cast<uint32_t>(result.front().size());
    return result;
}

std::unique_ptr<Embedder> create_openai_embedder(
    const std::string& api_key, HttpClient& http,
    const std::string& base_url, const std::string& model, long timeout_seconds) {
    HttpEmbedder::Config cfg;
    cfg.name = "openai";
    cfg.api_key = api_key;
    cfg.base_url = base_url.empty() ? "https://api.openai.com/v1" : base_url;
    cfg.model = model.empty() ? "text-embedding-3-small" : model;
    cfg.endpoint = "/embeddings";
    cfg.list_path = "/data";
    cfg.item_path = "/embedding";
    cfg.default_dims = 1536;
    cfg.timeout_seconds = timeout_seconds;
    return std::make_unique<HttpEmbedder>(std::move(cfg), http);
}

std::unique_ptr<Embedder> create_ollama_embedder(
    HttpClient& http, const std::string& base_url, const std::string& model,
    long timeout_seconds) {
    HttpEmbedder::Config cfg;
    cfg.name = "ollama";
    cfg.base_url = base_url.empty() ? "http://localhost:11434" : base_url;
    cfg.model = model.empty() ? "nomic-embed-text" : model;
    cfg.endpoint = "/api/embed";
    cfg.list_path = "/embeddings";
    cfg.item_path = "";
    cfg.default_dims = 768;
    cfg.timeout_seconds = timeout_seconds;
    return std::make_unique<HttpEmbedder>(std::move(cfg), http);
}

} // namespace memweave
