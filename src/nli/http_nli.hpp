#pragma once
#include "../nli.hpp"
#include "../http.hpp"
#include <string>

namespace memweave {

// Client for a remote NLI service:
//   POST {base_url}/compare_one_to_many  {"source": "...", "targets": ["..."]}
// answered by ["Duplicate", ...] or {"results": [...]}.
class HttpNliClient : public NliClassifier {
public:
    HttpNliClient(HttpClient& http, const std::string& base_url, long timeout_seconds = 10);

    NliBatch compare_one_to_many(const std::string& source,
                                 const std::vector<std::string>& targets) override;

    std::string classifier_name() const override { return "http"; }

private:
    HttpClient& http_;
    std::string base_url_;
    long timeout_seconds_;
};

} // namespace memweave
