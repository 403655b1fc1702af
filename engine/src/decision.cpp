#include "decision.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>

namespace textclf {

std::vector<double> softmax(const std::vector<double>& logits) {
    if (logits.empty()) return {};
    const double max = *std::max_element(logits.begin(), logits.end());
    std::vector<double> p(logits.size());
    double sum = 0.0;
    for (std::size_t i = 0; i < logits.size(); ++i) {
        p[i] = std::exp(logits[i] - max);
        sum += p[i];
    }
    for (auto& x : p) x /= sum;
    return p;
}

std::size_t argmax(const std::vector<double>& values) {
    std::size_t best = 0;
    for (std::size_t i = 1; i < values.size(); ++i) {
        if (values[i] > values[best]) best = i;
    }
    return best;
}

Prediction decide(const std::vector<std::string>& classes, const std::vector<double>& logits) {
    if (classes.empty()) {
        throw ConfigurationError("cannot decide over an empty class list");
    }
    if (classes.size() != logits.size()) {
        throw ConfigurationError("got " + std::to_string(logits.size()) + " logits for " +
                                 std::to_string(classes.size()) + " classes");
    }

    const std::vector<double> probs = softmax(logits);
    const std::size_t best = argmax(probs);

    Prediction out;
    out.label = classes[best];
    out.confidence = probs[best];
    for (std::size_t i = 0; i < classes.size(); ++i) {
        out.probabilities[classes[i]] = probs[i];
    }
    out.logits = logits;
    return out;
}

std::vector<std::pair<std::string, double>> sortedProbabilities(const Prediction& p) {
    std::vector<std::pair<std::string, double>> out(p.probabilities.begin(), p.probabilities.end());
    std::stable_sort(out.begin(), out.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    return out;
}

} // namespace textclf
