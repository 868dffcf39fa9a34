#include "ollama.hpp"
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

OllamaProvider::OllamaProvider(HttpClient& http, const std::string& base_url,
                               long timeout_seconds)
    : http_(http),
      base_url_(base_url.empty() ? "http://localhost:11434" : base_url),
      timeout_seconds_(timeout_seconds) {}

ChatResponse OllamaProvider::chat(const std::vector<ChatMessage>& messages,
                                  const std::string& model,
                                  double temperature) {
    json request;
    request["model"] = model;
    request["stream"] = false;
    request["options"] = {{"temperature", temperature}};

    json msgs = json::array();
    for (const auto& msg : messages) {
        msgs.push_back({
            {"role", role_to_string(msg.role)},
            {"content", msg.content}
        });
    }
    request["messages"] = msgs;

    std::string url = base_url_ + "/api/chat";
    std::vector<Header> headers = {
        {"Content-Type", "application/json"}
    };

    auto response = http_.post(url, request.dump(), headers, timeout_seconds_);

    if (response.status_code < 200 || response.status_code >= 300) {
        throw CollaboratorError(ErrorKind::CollaboratorUnavailable,
            "Ollama API error (HTTP " + std::to_string(response.status_code) + "): " +
            response.body);
    }

    json resp;
    try {
        resp = json::parse(response.body);
    } catch (const json::exception& e) {
        throw CollaboratorError(ErrorKind::MalformedResponse,
                                std::string("Ollama returned invalid JSON: ") + e.what());
    }

    if (!resp.is_object()) {
        throw CollaboratorError(ErrorKind::MalformedResponse,
                                std::string("Ollama returned a non-object reply"));
    }

    ChatResponse result;
    auto model_it = resp.find("model");
    result.model = model_it != resp.end() && model_it->is_string()
        ? model_it->get<std::string>() : model;

    if (resp.contains("message") && resp["message"].is_object() &&
        resp["message"].contains("content") &&
        resp["message"]["content"].is_string()) {
        result.content = resp["message"]["content"].get<std::string>();
    }

    result.usage.prompt_tokens = count_field(resp, "prompt_eval_count");
    result.usage.completion_tokens = count_field(resp, "eval_count");
    result.usage.total_tokens = result.usage.prompt_tokens + result.usage.completion_tokens;

    return result;
}

} // namespace memweave
