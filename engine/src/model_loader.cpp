#include "model_loader.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <set>

using json = nlohmann::json;

namespace textclf {

namespace {

std::size_t nonNegative(const json& v, const char* what) {
    if (!v.is_number_integer()) throw ArtifactError(std::string(what) + " must be an integer");
    const long long n = v.get<long long>();
    if (n < 0) throw ArtifactError(std::string(what) + " is negative");
    return static_cast<std::size_t>(n);
}

ArtifactMetadata parseMetadata(const json& m) {
    ArtifactMetadata md;
    md.version         = m.at("version").get<std::string>();
    md.trained_at      = m.at("trained_at").get<std::string>();
    md.accuracy        = m.at("accuracy").get<double>();
    md.num_examples    = m.at("num_examples").get<long long>();
    md.vocabulary_size = nonNegative(m.at("vocabulary_size"), "metadata.vocabulary_size");
    md.num_features    = nonNegative(m.at("num_features"), "metadata.num_features");
    if (m.contains("model_type") && !m.at("model_type").is_null()) {
        md.model_type = m.at("model_type").get<std::string>();
    }
    return md;
}

std::vector<std::string> parseClasses(const json& arr) {
    auto classes = arr.get<std::vector<std::string>>();
    if (classes.empty()) {
        throw ConfigurationError("class list is empty");
    }
    std::set<std::string> seen;
    for (const auto& c : classes) {
        if (!seen.insert(c).second) throw ArtifactError("duplicate class '" + c + "'");
    }
    return classes;
}

Vocabulary parseVocabulary(const json& obj) {
    if (!obj.is_object()) throw ArtifactError("tfidf.vocabulary must be an object");
    Vocabulary vocab;
    vocab.reserve(obj.size());
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        vocab.emplace(it.key(), nonNegative(it.value(), "vocabulary index"));
    }
    return vocab;
}

// Runs a parse step and tags any failure with where the artifact came from.
template <typename F>
auto withOrigin(const std::string& origin, F&& parse) {
    try {
        return parse();
    } catch (const json::exception& e) {
        throw ArtifactError(origin + ": " + e.what());
    } catch (const ArtifactError& e) {
        throw ArtifactError(origin + ": " + e.what());
    } catch (const ConfigurationError& e) {
        throw ConfigurationError(origin + ": " + e.what());
    }
}

} // namespace

json readJsonFile(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw ArtifactError("Could not open model file: " + path);
    }
    try {
        json j; f >> j;
        return j;
    } catch (const json::exception& e) {
        throw ArtifactError(path + ": " + e.what());
    }
}

std::shared_ptr<const TextModel> parseTextModel(const json& j, const std::string& origin) {
    return withOrigin(origin, [&]() {
        const json& tfidf = j.at("tfidf");
        const json& clf   = j.at("classifier");

        ArtifactMetadata md = parseMetadata(j.at("metadata"));
        std::vector<std::string> classes = parseClasses(clf.at("classes"));
        TfidfVectorizer vec(parseVocabulary(tfidf.at("vocabulary")),
                            tfidf.at("idf_weights").get<std::vector<double>>());

        // sanity checks
        if (md.vocabulary_size != vec.size()) {
            throw ArtifactError("metadata.vocabulary_size is " + std::to_string(md.vocabulary_size) +
                                " but the vocabulary has " + std::to_string(vec.size()) + " terms");
        }
        if (md.num_features != vec.size()) {
            throw ArtifactError("metadata.num_features is " + std::to_string(md.num_features) +
                                " but the vocabulary has " + std::to_string(vec.size()) + " terms");
        }

        LinearScorer scorer(clf.at("coefficients").get<Matrix>(),
                            clf.at("intercepts").get<std::vector<double>>(),
                            classes.size(), vec.size());

        return std::make_shared<const TextModel>(
            TextModel{std::move(md), std::move(vec), std::move(scorer), std::move(classes)});
    });
}

std::shared_ptr<const TextModel> loadTextModel(const std::string& path) {
    auto m = parseTextModel(readJsonFile(path), path);
    Log::write(LogLevel::Info, "Loaded text model '%s' v%s: %zu terms, %zu classes",
               path.c_str(), m->metadata.version.c_str(), m->vectorizer.size(), m->classes.size());
    return m;
}

std::shared_ptr<const FeatureModel> parseFeatureModel(const json& j, const std::string& origin) {
    return withOrigin(origin, [&]() {
        auto features = j.at("features").get<std::vector<std::string>>();
        if (features.empty()) throw ConfigurationError("feature list is empty");

        Encoders encoders;
        if (j.contains("encoders")) {
            encoders = j.at("encoders").get<Encoders>();
        }

        Matrix coef = j.at("coefficients").get<Matrix>();
        // the recommender export names it "intercept"
        const char* ikey = j.contains("intercept") ? "intercept" : "intercepts";
        std::vector<double> intercepts = j.at(ikey).get<std::vector<double>>();

        std::vector<std::string> classes;
        if (j.contains("classes")) {
            classes = parseClasses(j.at("classes"));
        } else if (coef.size() == 1) {
            classes = {"failure", "success"};
        } else {
            throw ArtifactError("multi-class feature artifact without 'classes'");
        }

        ArtifactMetadata md;
        if (j.contains("metadata")) {
            const json& m = j.at("metadata");
            md.version    = m.value("version", std::string());
            md.trained_at = m.value("trained_at", std::string());
            md.accuracy   = m.value("accuracy", 0.0);
            md.model_type = m.value("model_type", std::string());
        }
        md.num_features = features.size();

        LinearScorer scorer(std::move(coef), std::move(intercepts), classes.size(), features.size());
        return std::make_shared<const FeatureModel>(
            FeatureModel{std::move(md), std::move(features), std::move(encoders),
                         std::move(scorer), std::move(classes)});
    });
}

std::shared_ptr<const FeatureModel> loadFeatureModel(const std::string& path) {
    auto m = parseFeatureModel(readJsonFile(path), path);
    Log::write(LogLevel::Info, "Loaded feature model '%s': %zu features, %zu classes",
               path.c_str(), m->features.size(), m->classes.size());
    return m;
}

} // namespace textclf
