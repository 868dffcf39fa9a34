#pragma once
#include "memory.hpp"
#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace memweave {

class HttpClient;      // forward declare
class BackendRegistry; // forward declare
struct Config;         // forward declare

// Abstract embedding provider interface.
// Failures throw CollaboratorError (CollaboratorUnavailable or MalformedResponse).
class Embedder {
public:
    virtual ~Embedder() = default;

    // One vector per input text, same order.
    virtual std::vector<Embedding> embed_batch(const std::vector<std::string>& texts) = 0;

    // Compute embedding vector for a single text
    virtual Embedding embed(const std::string& text);

    // Dimensionality of the embedding vectors (0 = unknown until first call)
    virtual uint32_t dimensions() const = 0;

    // Human-readable name (e.g. "openai", "ollama")
    virtual std::string embedder_name() const = 0;
};

// Create the configured embedder through the registry.
std::unique_ptr<Embedder> create_embedder(const Config& config, HttpClient& http,
                                          const BackendRegistry& registry);

} // namespace memweave
