#pragma once
#include <stdexcept>
#include <string>

namespace textclf {

// Structurally broken artifact: bad JSON, missing field, dimension mismatch.
struct ArtifactError : std::runtime_error {
    explicit ArtifactError(const std::string& what) : std::runtime_error(what) {}
};

// Artifact or engine configuration that parses but cannot be used.
struct ConfigurationError : std::runtime_error {
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace textclf
