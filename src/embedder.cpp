#include "embedder.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "plugin.hpp"

namespace memweave {

Embedding Embedder::embed(const std::string& text) {
    auto vectors = embed_batch({text});
    if (vectors.size() != 1) {
        throw CollaboratorError(ErrorKind::MalformedResponse,
                                embedder_name() + ": expected 1 embedding, got " +
                                std::to_string(vectors.size()));
    }
    return std::move(vectors.front());
}

std::unique_ptr<Embedder> create_embedder(const Config& config, HttpClient& http,
                                          const BackendRegistry& registry) {
    return registry.create_embedder(config.embeddings.provider, config, http);
}

} // namespace memweave
