#include "tfidf_vectorizer.hpp"
#include "errors.hpp"
#include <cmath>
#include <map>

namespace textclf {

TfidfVectorizer::TfidfVectorizer(Vocabulary vocabulary, std::vector<double> idf)
    : vocab_(std::move(vocabulary)), idf_(std::move(idf)) {
    if (vocab_.empty()) {
        throw ConfigurationError("TF-IDF vocabulary is empty");
    }
    if (vocab_.size() != idf_.size()) {
        throw ArtifactError("idf_weights has " + std::to_string(idf_.size()) +
                            " entries but vocabulary has " + std::to_string(vocab_.size()));
    }

    // every index in [0, size) exactly once
    std::vector<bool> seen(idf_.size(), false);
    for (const auto& [token, idx] : vocab_) {
        if (idx >= idf_.size()) {
            throw ArtifactError("vocabulary index " + std::to_string(idx) + " for '" + token +
                                "' is out of range");
        }
        if (seen[idx]) {
            throw ArtifactError("vocabulary index " + std::to_string(idx) + " is used twice");
        }
        seen[idx] = true;
    }
}

std::vector<double> TfidfVectorizer::transform(const std::vector<std::string>& tokens) const {
    // ordered by index so the norm is summed in CSR column order
    std::map<std::size_t, double> counts;
    for (const auto& t : tokens) {
        auto it = vocab_.find(t);
        if (it != vocab_.end()) counts[it->second] += 1.0;
    }

    std::vector<double> v(idf_.size(), 0.0);
    double sq = 0.0;
    for (const auto& [idx, tf] : counts) {
        const double val = tf * idf_[idx];
        v[idx] = val;
        sq += val * val;
    }

    const double norm = std::sqrt(sq);
    if (norm > 0.0) {
        for (const auto& kv : counts) v[kv.first] /= norm;
    }
    return v;
}

double l2Norm(const std::vector<double>& v) {
    double sq = 0.0;
    for (double x : v) sq += x * x;
    return std::sqrt(sq);
}

} // namespace textclf
