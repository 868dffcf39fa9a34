#include "http_nli.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

namespace memweave {

HttpNliClient::HttpNliClient(HttpClient& http, const std::string& base_url,
                             long timeout_seconds)
    : http_(http), base_url_(base_url), timeout_seconds_(timeout_seconds) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

NliBatch HttpNliClient::compare_one_to_many(const std::string& source,
                                            const std::vector<std::string>& targets) {
    if (targets.empty()) return {};

    nlohmann::json body = {
        {"source", source},
        {"targets", targets}
    };
    std::vector<Header> headers = {
        {"Content-Type", "application/json"}
    };

    auto response = http_.post(base_url_ + "/compare_one_to_many", body.dump(),
                               headers, timeout_seconds_);
    if (response.status_code != 200) {
        std::string msg = "NLI service HTTP " + std::to_string(response.status_code) +
                          ": " + response.body;
        std::cerr << "[nli] " << msg << "\n";
        return unrelated_batch(targets.size(), ErrorKind::CollaboratorUnavailable, msg);
    }

    nlohmann::json labels;
    try {
        auto j = nlohmann::json::parse(response.body);
        labels = j.is_object() ? j.value("results", nlohmann::json()) : j;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[nli] Invalid response: " << e.what() << "\n";
        return unrelated_batch(targets.size(), ErrorKind::MalformedResponse, e.what());
    }
    if (!labels.is_array()) {
        std::cerr << "[nli] Response has no result array\n";
        return unrelated_batch(targets.size(), ErrorKind::MalformedResponse,
                               "response has no result array");
    }

    NliBatch batch;
    batch.results.reserve(targets.size());
    for (size_t i = 0; i < targets.size(); ++i) {
        std::optional<NliResult> label;
        if (i < labels.size() && labels[i].is_string()) {
            label = nli_result_from_string(labels[i].get<std::string>());
        }
        if (!label) {
            batch.error = ErrorKind::MalformedResponse;
            batch.error_message = "missing or unknown label at index " + std::to_string(i);
        }
        batch.results.push_back(label.value_or(NliResult::Unrelated));
    }
    if (!batch.ok()) std::cerr << "[nli] " << batch.error_message << "\n";
    return batch;
}

} // namespace memweave
