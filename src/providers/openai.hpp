#pragma once
#include "../provider.hpp"
#include "../http.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace memweave {

// OpenAI-compatible Chat Completions provider. Also serves any server that
// speaks the same API (vLLM, LM Studio, ...) through base_url.
class OpenAIProvider : public Provider {
public:
    OpenAIProvider(const std::string& api_key, HttpClient& http,
                   const std::string& base_url, long timeout_seconds = 60);

    ChatResponse chat(const std::vector<ChatMessage>& messages,
                      const std::string& model,
                      double temperature) override;

    std::string provider_name() const override { return "openai"; }

protected:
    nlohmann::json build_request(const std::vector<ChatMessage>& messages,
                                 const std::string& model,
                                 double temperature) const;
    std::vector<Header> build_headers() const;

private:
    std::string api_key_;
    HttpClient& http_;
    std::string base_url_;
    long timeout_seconds_;
};

} // namespace memweave
