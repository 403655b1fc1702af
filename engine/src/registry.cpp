#include "registry.hpp"
#include "errors.hpp"
#include "log.hpp"

namespace textclf {

std::shared_ptr<const TextClassifier> buildTextClassifier(const ClassifierProfile& p) {
    auto model = loadTextModel(p.artifact);
    return std::make_shared<const TextClassifier>(p.name, std::move(model),
                                                  HeuristicOverlay(overlayRules(p)), p.tokenizer);
}

std::shared_ptr<const FeatureClassifier> buildFeatureClassifier(const ClassifierProfile& p) {
    auto model = loadFeatureModel(p.artifact);
    return std::make_shared<const FeatureClassifier>(p.name, std::move(model), p.features);
}

ClassifierRegistry::ClassifierRegistry(EngineConfig config) : config_(std::move(config)) {}

const ClassifierProfile& ClassifierRegistry::profile(const std::string& name) const {
    auto it = config_.classifiers.find(name);
    if (it == config_.classifiers.end()) {
        throw ConfigurationError("unknown classifier '" + name + "'");
    }
    return it->second;
}

void ClassifierRegistry::loadAll() {
    for (const auto& kv : config_.classifiers) reload(kv.first);
}

void ClassifierRegistry::reload(const std::string& name) {
    const ClassifierProfile& p = profile(name);
    // build outside the lock; readers keep classifying on the old instance
    if (p.kind == ClassifierKind::Text) {
        auto c = buildTextClassifier(p);
        std::scoped_lock lk(m_);
        text_[name] = std::move(c);
    } else {
        auto c = buildFeatureClassifier(p);
        std::scoped_lock lk(m_);
        features_[name] = std::move(c);
    }
    Log::write(LogLevel::Info, "classifier '%s' ready (%s)", name.c_str(), p.artifact.c_str());
}

void ClassifierRegistry::install(std::shared_ptr<const TextClassifier> c) {
    if (!c) throw ConfigurationError("cannot install a null classifier");
    std::scoped_lock lk(m_);
    text_[c->name()] = std::move(c);
}

void ClassifierRegistry::install(std::shared_ptr<const FeatureClassifier> c) {
    if (!c) throw ConfigurationError("cannot install a null classifier");
    std::scoped_lock lk(m_);
    features_[c->name()] = std::move(c);
}

std::shared_ptr<const TextClassifier> ClassifierRegistry::text(const std::string& name) const {
    std::scoped_lock lk(m_);
    auto it = text_.find(name);
    if (it == text_.end()) {
        if (features_.count(name)) {
            throw ConfigurationError("classifier '" + name + "' takes features, not text");
        }
        throw ConfigurationError("text classifier '" + name + "' is not loaded");
    }
    return it->second;
}

std::shared_ptr<const FeatureClassifier> ClassifierRegistry::features(const std::string& name) const {
    std::scoped_lock lk(m_);
    auto it = features_.find(name);
    if (it == features_.end()) {
        if (text_.count(name)) {
            throw ConfigurationError("classifier '" + name + "' takes text, not features");
        }
        throw ConfigurationError("feature classifier '" + name + "' is not loaded");
    }
    return it->second;
}

bool ClassifierRegistry::configured(const std::string& name) const {
    return config_.classifiers.count(name) > 0;
}

std::vector<std::string> ClassifierRegistry::names() const {
    std::scoped_lock lk(m_);
    std::vector<std::string> out;
    for (const auto& kv : text_) out.push_back(kv.first);
    for (const auto& kv : features_) out.push_back(kv.first);
    return out;
}

} // namespace textclf
