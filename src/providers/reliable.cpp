#include "reliable.hpp"
#include "../errors.hpp"
#include <iostream>
#include <stdexcept>

namespace memweave {

ReliableProvider::ReliableProvider(std::vector<std::unique_ptr<Provider>> providers,
                                   uint32_t max_retries)
    : providers_(std::move(providers)), max_retries_(max_retries == 0 ? 1 : max_retries) {
    if (providers_.empty()) {
        throw std::invalid_argument("ReliableProvider requires at least one provider");
    }
}

ChatResponse ReliableProvider::chat(const std::vector<ChatMessage>& messages,
                                    const std::string& model,
                                    double temperature) {
    std::string last_error;
    for (const auto& provider : providers_) {
        for (uint32_t attempt = 1; attempt <= max_retries_; ++attempt) {
            try {
                return provider->chat(messages, model, temperature);
            } catch (const CollaboratorError& e) {
                last_error = e.what();
                std::cerr << "[reliable] " << provider->provider_name() << " attempt "
                          << attempt << "/" << max_retries_ << " failed ("
                          << error_kind_to_string(e.kind()) << "): " << last_error << '\n';
                // A malformed reply will not fix itself; move to the next provider
                if (e.kind() == ErrorKind::MalformedResponse) break;
            }
        }
    }
    throw CollaboratorError(ErrorKind::CollaboratorUnavailable,
                            "All providers failed. Last error: " + last_error);
}

} // namespace memweave
