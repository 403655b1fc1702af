#include "linear_scorer.hpp"
#include "errors.hpp"
#include <string>

namespace textclf {

LinearScorer::LinearScorer(Matrix coefficients, std::vector<double> intercepts,
                           std::size_t num_classes, std::size_t num_features)
    : coef_(std::move(coefficients)), intercept_(std::move(intercepts)),
      num_classes_(num_classes), num_features_(num_features) {
    if (coef_.empty()) {
        throw ConfigurationError("coefficient matrix has no rows");
    }
    if (num_features_ == 0) {
        throw ConfigurationError("coefficient matrix has no columns");
    }
    if (coef_.size() != num_classes_ && !binary()) {
        throw ArtifactError("coefficients have " + std::to_string(coef_.size()) +
                            " rows but there are " + std::to_string(num_classes_) + " classes");
    }
    if (intercept_.size() != coef_.size()) {
        throw ArtifactError("intercepts have " + std::to_string(intercept_.size()) +
                            " entries but coefficients have " + std::to_string(coef_.size()) + " rows");
    }
    for (std::size_t r = 0; r < coef_.size(); ++r) {
        if (coef_[r].size() != num_features_) {
            throw ArtifactError("coefficient row " + std::to_string(r) + " has " +
                                std::to_string(coef_[r].size()) + " columns, expected " +
                                std::to_string(num_features_));
        }
    }
}

std::vector<double> LinearScorer::logits(const std::vector<double>& x) const {
    if (x.size() != num_features_) {
        throw ConfigurationError("feature vector has " + std::to_string(x.size()) +
                                 " entries, model expects " + std::to_string(num_features_));
    }

    std::vector<double> z;
    z.reserve(num_classes_);
    if (binary()) z.push_back(0.0);
    for (std::size_t c = 0; c < coef_.size(); ++c) {
        const auto& row = coef_[c];
        double dot = 0.0;
        for (std::size_t j = 0; j < num_features_; ++j) {
            dot += row[j] * x[j];
        }
        z.push_back(dot + intercept_[c]);
    }
    return z;
}

} // namespace textclf
