#pragma once
#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace memweave {

enum class Role { System, User, Assistant };

inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "user";
}

struct ChatMessage {
    Role role;
    std::string content;
};

struct TokenUsage {
    uint32_t prompt_tokens = 0;
    uint32_t completion_tokens = 0;
    uint32_t total_tokens = 0;
};

struct ChatResponse {
    std::string content;
    TokenUsage usage;
    std::string model;
};

// Abstract base class for LLM providers (prompt in, text out).
// Failures throw CollaboratorError.
class Provider {
public:
    virtual ~Provider() = default;

    virtual ChatResponse chat(const std::vector<ChatMessage>& messages,
                              const std::string& model,
                              double temperature) = 0;

    // System prompt + one user message, returns the reply text.
    virtual std::string chat_simple(const std::string& system_prompt,
                                    const std::string& message,
                                    const std::string& model,
                                    double temperature);

    virtual std::string provider_name() const = 0;
};

class HttpClient;      // forward declaration
class BackendRegistry; // forward declaration
struct Config;

// Create the configured provider through the registry, wrapped in a
// ReliableProvider with the configured retry budget.
std::unique_ptr<Provider> create_provider(const Config& config, HttpClient& http,
                                          const BackendRegistry& registry);

} // namespace memweave
