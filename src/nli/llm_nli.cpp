#include "llm_nli.hpp"
#include "../llm_json.hpp"
#include "../prompt.hpp"
#include <iostream>

namespace memweave {

LlmNliClassifier::LlmNliClassifier(Provider& provider, const std::string& model,
                                   double temperature)
    : provider_(provider), model_(model), temperature_(temperature) {}

NliBatch LlmNliClassifier::compare_one_to_many(const std::string& source,
                                               const std::vector<std::string>& targets) {
    if (targets.empty()) return {};

    std::string reply;
    try {
        reply = provider_.chat_simple(build_reasoning_system_prompt(),
                                      build_nli_prompt(source, targets),
                                      model_, temperature_);
    } catch (const CollaboratorError& e) {
        std::cerr << "[nli] LLM call failed: " << e.what() << "\n";
        return unrelated_batch(targets.size(), e.kind(), e.what());
    } catch (const std::exception& e) {
        std::cerr << "[nli] LLM call raised: " << e.what() << "\n";
        return unrelated_batch(targets.size(), ErrorKind::MalformedResponse, e.what());
    }

    auto parsed = parse_llm_json(reply);
    if (!parsed) {
        std::cerr << "[nli] Unparseable LLM reply: " << parsed.error << "\n";
        return unrelated_batch(targets.size(), ErrorKind::MalformedResponse, parsed.error);
    }
    const auto& j = *parsed.value;
    const nlohmann::json* labels = &j;
    if (j.is_object() && j.contains("results")) labels = &j["results"];
    if (!labels->is_array() || labels->size() != targets.size()) {
        std::cerr << "[nli] LLM reply does not hold " << targets.size() << " labels\n";
        return unrelated_batch(targets.size(), ErrorKind::MalformedResponse,
                               "expected " + std::to_string(targets.size()) + " labels");
    }

    NliBatch batch;
    batch.results.reserve(targets.size());
    for (size_t i = 0; i < targets.size(); ++i) {
        std::optional<NliResult> label;
        if ((*labels)[i].is_string()) {
            label = nli_result_from_string((*labels)[i].get<std::string>());
        }
        if (!label) {
            batch.error = ErrorKind::MalformedResponse;
            batch.error_message = "unknown label at index " + std::to_string(i);
        }
        batch.results.push_back(label.value_or(NliResult::Unrelated));
    }
    return batch;
}

} // namespace memweave
