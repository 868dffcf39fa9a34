#pragma once
#include "../nli.hpp"
#include "../provider.hpp"
#include <string>

namespace memweave {

// NLI through the language model: one prompt per batch, the reply is a JSON
// array of labels in target order.
class LlmNliClassifier : public NliClassifier {
public:
    LlmNliClassifier(Provider& provider, const std::string& model, double temperature = 0.0);

    NliBatch compare_one_to_many(const std::string& source,
                                 const std::vector<std::string>& targets) override;

    std::string classifier_name() const override { return "llm"; }

private:
    Provider& provider_;
    std::string model_;
    double temperature_;
};

} // namespace memweave
