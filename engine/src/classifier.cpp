#include "classifier.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <algorithm>

namespace textclf {

TextClassifier::TextClassifier(std::string name, std::shared_ptr<const TextModel> model,
                               HeuristicOverlay overlay, TokenizerOptions tokenizer)
    : name_(std::move(name)), model_(std::move(model)), overlay_(std::move(overlay)),
      tokenizer_(tokenizer) {
    if (!model_) {
        throw ConfigurationError("classifier '" + name_ + "' has no model");
    }
    for (const auto& c : overlay_.unknownClasses(model_->classes)) {
        Log::write(LogLevel::Warn, "classifier '%s': overlay rule targets unknown class '%s', ignored",
                   name_.c_str(), c.c_str());
    }
}

std::vector<double> TextClassifier::vectorize(const std::string& text) const {
    return model_->vectorizer.transform(tokenizer_.ngrams(text));
}

std::vector<double> TextClassifier::logits(const std::string& text) const {
    return model_->scorer.logits(vectorize(text));
}

Prediction TextClassifier::classify(const std::string& text) const {
    const std::vector<double> x = vectorize(text);
    const std::vector<double> raw = model_->scorer.logits(x);

    std::vector<double> adjusted = raw;
    std::vector<OverlayHit> hits = overlay_.apply(text, model_->classes, adjusted);

    Prediction p = decide(model_->classes, adjusted);
    p.raw_logits = raw;
    p.overlay_hits = std::move(hits);

    if (std::all_of(x.begin(), x.end(), [](double v) { return v == 0.0; })) {
        p.diagnostics.push_back("no in-vocabulary terms, intercepts decide");
        Log::write(LogLevel::Debug, "classifier '%s': no known terms in input", name_.c_str());
    }
    return p;
}

static FeatureEncoder makeEncoder(const std::string& name,
                                  const std::shared_ptr<const FeatureModel>& model,
                                  std::vector<FeatureSpec> layout) {
    if (!model) {
        throw ConfigurationError("classifier '" + name + "' has no model");
    }
    if (layout.empty()) {
        layout = inferLayout(model->features, model->encoders);
    }
    if (layout.size() != model->features.size()) {
        throw ConfigurationError("classifier '" + name + "': layout has " +
                                 std::to_string(layout.size()) + " features, artifact has " +
                                 std::to_string(model->features.size()));
    }
    for (std::size_t i = 0; i < layout.size(); ++i) {
        if (layout[i].name != model->features[i]) {
            throw ConfigurationError("classifier '" + name + "': layout feature " + std::to_string(i) +
                                     " is '" + layout[i].name + "', artifact has '" +
                                     model->features[i] + "'");
        }
    }
    return FeatureEncoder(std::move(layout), model->encoders);
}

FeatureClassifier::FeatureClassifier(std::string name, std::shared_ptr<const FeatureModel> model,
                                     std::vector<FeatureSpec> layout)
    : name_(std::move(name)), model_(std::move(model)),
      encoder_(makeEncoder(name_, model_, std::move(layout))) {}

Prediction FeatureClassifier::classifyFeatures(const FeatureTuple& in) const {
    std::vector<std::string> warnings;
    const std::vector<double> x = encoder_.encode(in, warnings);
    const std::vector<double> z = model_->scorer.logits(x);

    Prediction p = decide(model_->classes, z);
    p.raw_logits = z;
    for (const auto& w : warnings) {
        Log::write(LogLevel::Debug, "classifier '%s': %s", name_.c_str(), w.c_str());
    }
    p.diagnostics = std::move(warnings);
    return p;
}

} // namespace textclf
