#pragma once
#include "../provider.hpp"
#include <string>
#include <vector>
#include <memory>

namespace memweave {

// Wraps multiple providers with bounded retry/fallback logic.
// Throws CollaboratorError(CollaboratorUnavailable) once every attempt failed.
class ReliableProvider : public Provider {
public:
    explicit ReliableProvider(std::vector<std::unique_ptr<Provider>> providers,
                              uint32_t max_retries = 3);

    ChatResponse chat(const std::vector<ChatMessage>& messages,
                      const std::string& model,
                      double temperature) override;

    std::string provider_name() const override { return "reliable"; }

private:
    std::vector<std::unique_ptr<Provider>> providers_;
    uint32_t max_retries_;
};

} // namespace memweave
