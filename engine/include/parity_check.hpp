#pragma once
#include "tokenizer.hpp"
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace textclf {

struct ParityMismatch {
    std::string text;
    std::vector<std::string> missing;      // expected but not produced
    std::vector<std::string> unexpected;   // produced but not expected
};

// Fixtures: {"fixtures": [{"text": "...", "ngrams": ["...", ...]}, ...]}.
// N-grams compare as multisets. Malformed fixtures throw ConfigurationError.
std::vector<ParityMismatch> checkTokenizerParity(const Tokenizer& tok, const nlohmann::json& fixtures);
std::vector<ParityMismatch> checkTokenizerParityFile(const Tokenizer& tok, const std::string& path);

} // namespace textclf
