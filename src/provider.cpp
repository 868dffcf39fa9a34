#include "provider.hpp"
#include "providers/reliable.hpp"
#include "config.hpp"
#include "plugin.hpp"

namespace memweave {

std::string Provider::chat_simple(const std::string& system_prompt,
                                  const std::string& message,
                                  const std::string& model,
                                  double temperature) {
    std::vector<ChatMessage> messages;
    if (!system_prompt.empty()) {
        messages.push_back({Role::System, system_prompt});
    }
    messages.push_back({Role::User, message});
    return chat(messages, model, temperature).content;
}

std::unique_ptr<Provider> create_provider(const Config& config, HttpClient& http,
                                          const BackendRegistry& registry) {
    std::vector<std::unique_ptr<Provider>> providers;
    providers.push_back(registry.create_provider(config.llm.provider, config, http));
    return std::make_unique<ReliableProvider>(std::move(providers), config.llm.max_retries);
}

} // namespace memweave
