#pragma once
#include <cstddef>
#include <vector>

namespace textclf {

using Matrix = std::vector<std::vector<double>>;

// logit[c] = dot(coef[c], x) + intercept[c].
// A single row for two classes is the binary case and scores as [0, z].
class LinearScorer {
public:
    LinearScorer(Matrix coefficients, std::vector<double> intercepts,
                 std::size_t num_classes, std::size_t num_features);

    std::size_t numClasses() const { return num_classes_; }
    std::size_t numFeatures() const { return num_features_; }
    bool binary() const { return coef_.size() == 1 && num_classes_ == 2; }

    std::vector<double> logits(const std::vector<double>& x) const;

private:
    Matrix coef_;
    std::vector<double> intercept_;
    std::size_t num_classes_;
    std::size_t num_features_;
};

} // namespace textclf
