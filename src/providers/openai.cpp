#include "openai.hpp"
#include "../errors.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace memweave {

namespace {

// Token counts are informational; anything but a non-negative integer reads as 0.
uint32_t count_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number_integer() || it->get<int64_t>() < 0) return 0;
    return static_cast<uint32_t>(it->get<uint64_t>());
}

} // namespace

OpenAIProvider::OpenAIProvider(const std::string& api_key, HttpClient& http,
                               const std::string& base_url, long timeout_seconds)
    : api_key_(api_key), http_(http),
      base_url_(base_url.empty() ? "https://api.openai.com/v1" : base_url),
      timeout_seconds_(timeout_seconds) {}

json OpenAIProvider::build_request(const std::vector<ChatMessage>& messages,
                                   const std::string& model,
                                   double temperature) const {
    json request;
    request["model"] = model;
    request["temperature"] = temperature;

    json msgs = json::array();
    for (const auto& msg : messages) {
        msgs.push_back({
            {"role", role_to_string(msg.role)},
            {"content", msg.content}
        });
    }
    request["messages"] = msgs;
    return request;
}

std::vector<Header> OpenAIProvider::build_headers() const {
    std::vector<Header> headers = {
        {"Content-Type", "application/json"}
    };
    if (!api_key_.empty()) {
        headers.push_back({"Authorization", "Bearer " + api_key_});
    }
    return headers;
}

ChatResponse OpenAIProvider::chat(const std::vector<ChatMessage>& messages,
                                  const std::string& model,
                                  double temperature) {
    json request = build_request(messages, model, temperature);

    std::string url = base_url_ + "/chat/completions";
    auto response = http_.post(url, request.dump(), build_headers(), timeout_seconds_);

    if (response.status_code < 200 || response.status_code >= 300) {
        throw CollaboratorError(ErrorKind::CollaboratorUnavailable,
            provider_name() + " API error (HTTP " +
            std::to_string(response.status_code) + "): " + response.body);
    }

    json resp;
    try {
        resp = json::parse(response.body);
    } catch (const json::exception& e) {
        throw CollaboratorError(ErrorKind::MalformedResponse,
                                provider_name() + " returned invalid JSON: " + e.what());
    }

    if (!resp.is_object()) {
        throw CollaboratorError(ErrorKind::MalformedResponse,
                                provider_name() + " returned a non-object reply");
    }

    ChatResponse result;
    auto model_it = resp.find("model");
    result.model = model_it != resp.end() && model_it->is_string()
        ? model_it->get<std::string>() : model;

    if (resp.contains("choices") && resp["choices"].is_array() && !resp["choices"].empty()) {
        const auto& choice = resp["choices"][0];
        if (choice.contains("message")) {
            const auto& message = choice["message"];
            if (message.contains("content") && message["content"].is_string()) {
                result.content = message["content"].get<std::string>();
            }
        }
    }

    if (resp.contains("usage") && resp["usage"].is_object()) {
        const auto& usage = resp["usage"];
        result.usage.prompt_tokens = count_field(usage, "prompt_tokens");
        result.usage.completion_tokens = count_field(usage, "completion_tokens");
        result.usage.total_tokens = count_field(usage, "total_tokens");
    }

    return result;
}

} // namespace memweave
