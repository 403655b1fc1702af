#pragma once
#include "linear_scorer.hpp"
#include "tfidf_vectorizer.hpp"
#include <nlohmann/json_fwd.hpp>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace textclf {

struct ArtifactMetadata {
    std::string version;
    std::string trained_at;
    double accuracy{};
    long long num_examples{};
    std::size_t vocabulary_size{};
    std::size_t num_features{};
    std::string model_type;   // optional in the artifact
};

// TF-IDF vocabulary + multinomial logistic regression.
struct TextModel {
    ArtifactMetadata metadata;
    TfidfVectorizer vectorizer;
    LinearScorer scorer;
    std::vector<std::string> classes;
};

using Encoders = std::map<std::string, std::unordered_map<std::string, int>>;

// Linear model over label-encoded categorical and numeric features.
struct FeatureModel {
    ArtifactMetadata metadata;   // empty unless the artifact carries one
    std::vector<std::string> features;
    Encoders encoders;
    LinearScorer scorer;
    std::vector<std::string> classes;
};

// Both throw ArtifactError or ConfigurationError; nothing partial is returned.
std::shared_ptr<const TextModel> loadTextModel(const std::string& path);
std::shared_ptr<const TextModel> parseTextModel(const nlohmann::json& j,
                                                const std::string& origin = "<memory>");

std::shared_ptr<const FeatureModel> loadFeatureModel(const std::string& path);
std::shared_ptr<const FeatureModel> parseFeatureModel(const nlohmann::json& j,
                                                      const std::string& origin = "<memory>");

// Reads and parses a JSON file, mapping failures to ArtifactError.
nlohmann::json readJsonFile(const std::string& path);

} // namespace textclf
