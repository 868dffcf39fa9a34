#pragma once
#include "../provider.hpp"
#include "../http.hpp"
#include <string>

namespace memweave {

class OllamaProvider : public Provider {
public:
    OllamaProvider(HttpClient& http, const std::string& base_url, long timeout_seconds = 60);

    ChatResponse chat(const std::vector<ChatMessage>& messages,
                      const std::string& model,
                      double temperature) override;

    std::string provider_name() const override { return "ollama"; }

private:
    HttpClient& http_;
    std::string base_url_;
    long timeout_seconds_;
};

} // namespace memweave
