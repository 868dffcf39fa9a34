#include "nli.hpp"
#include "config.hpp"
#include "plugin.hpp"

namespace memweave {

NliBatch unrelated_batch(size_t n, ErrorKind error, const std::string& message) {
    NliBatch batch;
    batch.results.assign(n, NliResult::Unrelated);
    batch.error = error;
    batch.error_message = message;
    return batch;
}

std::unique_ptr<NliClassifier> create_nli_classifier(const Config& config, HttpClient& http,
                                                     Provider* provider,
                                                     const BackendRegistry& registry) {
    return registry.create_nli(config.nli.backend, config, http, provider);
}

} // namespace memweave
