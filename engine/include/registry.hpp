#pragma once
#include "classifier.hpp"
#include "engine_config.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace textclf {

std::shared_ptr<const TextClassifier> buildTextClassifier(const ClassifierProfile& p);
std::shared_ptr<const FeatureClassifier> buildFeatureClassifier(const ClassifierProfile& p);

// Named classifiers with whole-instance swap on reload. Callers keep the
// instance they got alive for as long as they hold it.
class ClassifierRegistry {
public:
    explicit ClassifierRegistry(EngineConfig config);

    // Loads every configured classifier; the first failure aborts.
    void loadAll();

    // Builds a fresh instance from the profile and swaps it in. On failure the
    // previous instance stays and the error propagates.
    void reload(const std::string& name);

    void install(std::shared_ptr<const TextClassifier> c);
    void install(std::shared_ptr<const FeatureClassifier> c);

    std::shared_ptr<const TextClassifier> text(const std::string& name) const;
    std::shared_ptr<const FeatureClassifier> features(const std::string& name) const;

    bool configured(const std::string& name) const;
    std::vector<std::string> names() const;

private:
    const ClassifierProfile& profile(const std::string& name) const;

    EngineConfig config_;
    mutable std::mutex m_;
    std::map<std::string, std::shared_ptr<const TextClassifier>> text_;
    std::map<std::string, std::shared_ptr<const FeatureClassifier>> features_;
};

} // namespace textclf
