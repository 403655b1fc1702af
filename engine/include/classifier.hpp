#pragma once
#include "decision.hpp"
#include "feature_encoder.hpp"
#include "heuristic_overlay.hpp"
#include "model_loader.hpp"
#include "tokenizer.hpp"
#include <memory>
#include <string>
#include <vector>

namespace textclf {

// Immutable after construction; classify() may run on any number of threads.
class TextClassifier {
public:
    TextClassifier(std::string name, std::shared_ptr<const TextModel> model,
                   HeuristicOverlay overlay = {}, TokenizerOptions tokenizer = {});

    const std::string& name() const { return name_; }
    const TextModel& model() const { return *model_; }
    const Tokenizer& tokenizer() const { return tokenizer_; }
    const HeuristicOverlay& overlay() const { return overlay_; }

    std::vector<double> vectorize(const std::string& text) const;
    std::vector<double> logits(const std::string& text) const;   // before the overlay
    Prediction classify(const std::string& text) const;

private:
    std::string name_;
    std::shared_ptr<const TextModel> model_;
    HeuristicOverlay overlay_;
    Tokenizer tokenizer_;
};

class FeatureClassifier {
public:
    // Empty layout means inferLayout() over the artifact's feature names.
    FeatureClassifier(std::string name, std::shared_ptr<const FeatureModel> model,
                      std::vector<FeatureSpec> layout = {});

    const std::string& name() const { return name_; }
    const FeatureModel& model() const { return *model_; }
    const FeatureEncoder& encoder() const { return encoder_; }

    Prediction classifyFeatures(const FeatureTuple& in) const;

private:
    std::string name_;
    std::shared_ptr<const FeatureModel> model_;
    FeatureEncoder encoder_;
};

} // namespace textclf
