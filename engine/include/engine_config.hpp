#pragma once
#include "feature_encoder.hpp"
#include "heuristic_overlay.hpp"
#include "log.hpp"
#include "tokenizer.hpp"
#include <nlohmann/json_fwd.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace textclf {

enum class ClassifierKind { Text, Features };

struct ClassifierProfile {
    std::string name;
    std::string artifact;                    // resolved against the config file
    ClassifierKind kind = ClassifierKind::Text;
    TokenizerOptions tokenizer;
    std::optional<std::vector<CueRule>> overlay;  // unset: built-in defaults
    std::vector<FeatureSpec> features;            // empty: inferred from the artifact
};

struct EngineConfig {
    std::optional<std::string> log_dir;
    std::optional<LogLevel> log_level;
    std::map<std::string, ClassifierProfile> classifiers;
};

// Throw ConfigurationError on unreadable or invalid configuration.
EngineConfig loadEngineConfig(const std::string& path);
EngineConfig parseEngineConfig(const nlohmann::json& j, const std::string& base_dir = "");

// Profile for an artifact given directly, without a config file.
ClassifierProfile defaultProfile(const std::string& name, const std::string& artifact,
                                 ClassifierKind kind = ClassifierKind::Text);

// Configured rules if present, otherwise the built-in table for the name.
std::vector<CueRule> overlayRules(const ClassifierProfile& p);

} // namespace textclf
