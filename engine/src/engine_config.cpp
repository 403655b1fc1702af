#include "engine_config.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <limits>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace textclf {

namespace {

// Whole number >= 1; anything else would be truncated or wrap on conversion.
int positiveInt(const json& t, const char* key, int fallback) {
    if (!t.contains(key)) return fallback;
    const json& v = t.at(key);
    if (!v.is_number_integer()) {
        throw ConfigurationError(std::string("tokenizer.") + key + " must be an integer");
    }
    const long long n = v.get<long long>();
    if (n < 1 || n > std::numeric_limits<int>::max()) {
        throw ConfigurationError(std::string("tokenizer.") + key + " is out of range: " + v.dump());
    }
    return static_cast<int>(n);
}

TokenizerOptions parseTokenizer(const json& t) {
    if (!t.is_object()) throw ConfigurationError("tokenizer must be an object");
    TokenizerOptions o;
    o.ngram_min       = positiveInt(t, "ngram_min", o.ngram_min);
    o.ngram_max       = positiveInt(t, "ngram_max", o.ngram_max);
    o.min_token_chars = static_cast<std::size_t>(
        positiveInt(t, "min_token_chars", static_cast<int>(o.min_token_chars)));
    o.lowercase       = t.value("lowercase", o.lowercase);
    o.strip_accents   = t.value("strip_accents", o.strip_accents);
    return o;
}

std::vector<CueRule> parseOverlay(const json& arr) {
    if (!arr.is_array()) throw ConfigurationError("overlay must be an array");
    std::vector<CueRule> rules;
    for (const auto& r : arr) {
        rules.push_back(CueRule{r.at("class").get<std::string>(),
                                r.at("bonus").get<double>(),
                                r.at("cues").get<std::vector<std::string>>()});
    }
    return rules;
}

std::vector<FeatureSpec> parseFeatures(const json& arr) {
    if (!arr.is_array()) throw ConfigurationError("features must be an array");
    std::vector<FeatureSpec> out;
    for (const auto& f : arr) {
        FeatureSpec s;
        s.name = f.at("name").get<std::string>();
        const std::string kind = f.value("kind", std::string("raw"));
        if (!parseFeatureKind(kind, s.kind)) {
            throw ConfigurationError("feature '" + s.name + "' has unknown kind '" + kind + "'");
        }
        s.source = f.value("source", s.name);
        out.push_back(std::move(s));
    }
    return out;
}

std::string resolvePath(const std::string& p, const std::string& base_dir) {
    fs::path path(p);
    if (path.is_absolute() || base_dir.empty()) return p;
    return (fs::path(base_dir) / path).lexically_normal().string();
}

} // namespace

EngineConfig parseEngineConfig(const json& j, const std::string& base_dir) {
    try {
        EngineConfig cfg;
        if (j.contains("log_dir")) cfg.log_dir = j.at("log_dir").get<std::string>();
        if (j.contains("log_level")) {
            const std::string lvl = j.at("log_level").get<std::string>();
            LogLevel parsed;
            if (!Log::parseLevel(lvl, parsed)) {
                throw ConfigurationError("unknown log_level '" + lvl + "'");
            }
            cfg.log_level = parsed;
        }

        const json& classifiers = j.at("classifiers");
        if (!classifiers.is_object()) throw ConfigurationError("classifiers must be an object");
        for (auto it = classifiers.begin(); it != classifiers.end(); ++it) {
            const json& c = it.value();
            ClassifierProfile p;
            p.name = it.key();
            p.artifact = resolvePath(c.at("artifact").get<std::string>(), base_dir);

            const std::string kind = c.value("kind", std::string("text"));
            if (kind == "text") p.kind = ClassifierKind::Text;
            else if (kind == "features") p.kind = ClassifierKind::Features;
            else throw ConfigurationError("classifier '" + p.name + "' has unknown kind '" + kind + "'");

            if (c.contains("tokenizer")) p.tokenizer = parseTokenizer(c.at("tokenizer"));
            if (c.contains("overlay")) p.overlay = parseOverlay(c.at("overlay"));
            if (c.contains("features")) p.features = parseFeatures(c.at("features"));
            cfg.classifiers.emplace(p.name, std::move(p));
        }
        return cfg;
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("invalid engine config: ") + e.what());
    }
}

EngineConfig loadEngineConfig(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw ConfigurationError("Could not open config file: " + path);
    }
    json j;
    try {
        f >> j;
    } catch (const json::exception& e) {
        throw ConfigurationError(path + ": " + e.what());
    }
    return parseEngineConfig(j, fs::path(path).parent_path().string());
}

ClassifierProfile defaultProfile(const std::string& name, const std::string& artifact, ClassifierKind kind) {
    ClassifierProfile p;
    p.name = name;
    p.artifact = artifact;
    p.kind = kind;
    return p;
}

std::vector<CueRule> overlayRules(const ClassifierProfile& p) {
    return p.overlay ? *p.overlay : defaultOverlayRules(p.name);
}

} // namespace textclf
