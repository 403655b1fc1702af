#include "feature_encoder.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace textclf {

static std::string asciiLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

FeatureEncoder::FeatureEncoder(std::vector<FeatureSpec> layout, Encoders encoders)
    : layout_(std::move(layout)), encoders_(std::move(encoders)) {
    if (layout_.empty()) {
        throw ConfigurationError("feature layout is empty");
    }
    for (const auto& f : layout_) {
        if (f.source.empty()) {
            throw ConfigurationError("feature '" + f.name + "' has no source");
        }
        if (f.kind == FeatureKind::Categorical && encoders_.find(f.source) == encoders_.end()) {
            throw ConfigurationError("categorical feature '" + f.name + "' has no encoder '" +
                                     f.source + "'");
        }
    }
}

std::vector<double> FeatureEncoder::encode(const FeatureTuple& in, std::vector<std::string>& warnings) const {
    std::vector<double> x;
    x.reserve(layout_.size());

    for (const auto& f : layout_) {
        if (f.kind == FeatureKind::Categorical) {
            const auto& enc = encoders_.at(f.source);
            auto vit = in.categorical.find(f.source);
            if (vit == in.categorical.end()) {
                warnings.push_back("missing " + f.source + ", using default " +
                                   std::to_string(kDefaultCategoryCode));
                x.push_back(kDefaultCategoryCode);
                continue;
            }
            auto eit = enc.find(vit->second);
            if (eit == enc.end()) eit = enc.find(asciiLower(vit->second));
            if (eit == enc.end()) {
                warnings.push_back("unknown " + f.source + " '" + vit->second + "', using default " +
                                   std::to_string(kDefaultCategoryCode));
                x.push_back(kDefaultCategoryCode);
            } else {
                x.push_back(static_cast<double>(eit->second));
            }
            continue;
        }

        auto nit = in.numeric.find(f.source);
        if (nit == in.numeric.end()) {
            warnings.push_back("missing " + f.source + ", using 0");
            x.push_back(0.0);
            continue;
        }
        const double v = (f.kind == FeatureKind::Log1p) ? std::log1p(nit->second) : nit->second;
        if (!std::isfinite(v)) {
            warnings.push_back("non-finite " + f.name + " from " + f.source + ", using 0");
            x.push_back(0.0);
        } else {
            x.push_back(v);
        }
    }
    return x;
}

bool parseFeatureKind(const std::string& name, FeatureKind& out) {
    if (name == "categorical") out = FeatureKind::Categorical;
    else if (name == "log1p") out = FeatureKind::Log1p;
    else if (name == "raw") out = FeatureKind::Raw;
    else return false;
    return true;
}

std::vector<FeatureSpec> inferLayout(const std::vector<std::string>& features, const Encoders& encoders) {
    // the recommender export renames its numeric inputs
    static const std::map<std::string, std::string> kLogSources = {
        {"log_cost", "cost_per_1m"},
        {"log_context", "context_window"},
    };

    std::vector<FeatureSpec> layout;
    layout.reserve(features.size());
    for (const auto& name : features) {
        if (endsWith(name, "_encoded")) {
            const std::string base = name.substr(0, name.size() - 8);
            if (encoders.count(base)) {
                layout.push_back(FeatureSpec{name, FeatureKind::Categorical, base});
                continue;
            }
        }
        if (name.rfind("log_", 0) == 0 && name.size() > 4) {
            auto it = kLogSources.find(name);
            layout.push_back(FeatureSpec{name, FeatureKind::Log1p,
                                         it != kLogSources.end() ? it->second : name.substr(4)});
            continue;
        }
        layout.push_back(FeatureSpec{name, FeatureKind::Raw, name});
    }
    return layout;
}

FeatureTuple recommenderInputs(const std::string& model_id, const std::string& action,
                               const std::string& language, const std::string& complexity,
                               double context_window, double cost_per_1m) {
    const std::string id = asciiLower(model_id);
    auto has = [&](const char* s) { return id.find(s) != std::string::npos; };

    double model_size = 0.0;
    for (const char* size : {"405b", "120b", "70b", "32b", "33b", "22b", "9b", "8b", "3b"}) {
        if (has(size)) {
            model_size = std::stod(size);
            break;
        }
    }

    FeatureTuple t;
    t.categorical["action"] = action;
    t.categorical["language"] = language;
    t.categorical["complexity"] = complexity;
    t.numeric["context_window"] = context_window;
    t.numeric["cost_per_1m"] = cost_per_1m;
    t.numeric["has_coder_tag"] = (has("coder") || has("code")) ? 1.0 : 0.0;
    t.numeric["has_instant_tag"] = (has("instant") || has("flash")) ? 1.0 : 0.0;
    t.numeric["model_size"] = model_size;
    return t;
}

} // namespace textclf
