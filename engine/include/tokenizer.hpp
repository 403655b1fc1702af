#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace textclf {

// Defaults match the training pipeline's TfidfVectorizer settings.
struct TokenizerOptions {
    int ngram_min = 1;
    int ngram_max = 3;
    std::size_t min_token_chars = 2;   // (?u)\b\w\w+\b
    bool lowercase = true;
    bool strip_accents = true;         // strip_accents='unicode'
};

class Tokenizer {
public:
    Tokenizer();
    explicit Tokenizer(const TokenizerOptions& opts);

    const TokenizerOptions& options() const { return opts_; }

    // Lowercase and accent-strip, returning UTF-8.
    std::string normalize(const std::string& text) const;

    // Word tokens of already normalized text, in order.
    std::vector<std::string> words(const std::string& normalized) const;

    // Full analyzer: normalize, split, then n-grams from ngram_min to ngram_max.
    std::vector<std::string> ngrams(const std::string& text) const;

private:
    TokenizerOptions opts_;
};

// Lowercases and pads with one space on each side for substring cue matching.
// Independent of Tokenizer::normalize: no accent stripping.
std::string padForCues(const std::string& text);

} // namespace textclf
