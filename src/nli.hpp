#pragma once
#include "memory.hpp"
#include "errors.hpp"
#include <memory>
#include <string>
#include <vector>

namespace memweave {

class HttpClient;
class Provider;
class BackendRegistry;
struct Config;

// Per-target labels plus the error that forced any fallback values.
// results always has the same length and order as the targets.
struct NliBatch {
    std::vector<NliResult> results;
    ErrorKind error = ErrorKind::None;
    std::string error_message;

    bool ok() const { return error == ErrorKind::None; }
};

// Natural-language-inference classifier. Never throws: entries that could
// not be classified come back as Unrelated with the error set.
class NliClassifier {
public:
    virtual ~NliClassifier() = default;

    // Empty targets returns an empty batch without any remote call.
    virtual NliBatch compare_one_to_many(const std::string& source,
                                         const std::vector<std::string>& targets) = 0;

    virtual std::string classifier_name() const = 0;
};

// Batch of Unrelated labels carrying the given error.
NliBatch unrelated_batch(size_t n, ErrorKind error, const std::string& message);

// Create the configured NLI backend through the registry. The provider is
// only used by LLM-backed classifiers and may be null otherwise.
std::unique_ptr<NliClassifier> create_nli_classifier(const Config& config, HttpClient& http,
                                                     Provider* provider,
                                                     const BackendRegistry& registry);

} // namespace memweave
