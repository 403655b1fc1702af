#pragma once
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace textclf {

using Vocabulary = std::unordered_map<std::string, std::size_t>;

class TfidfVectorizer {
public:
    // Throws ArtifactError on idf/vocabulary mismatch or a bad index,
    // ConfigurationError on an empty vocabulary.
    TfidfVectorizer(Vocabulary vocabulary, std::vector<double> idf);

    std::size_t size() const { return idf_.size(); }
    const Vocabulary& vocabulary() const { return vocab_; }
    const std::vector<double>& idf() const { return idf_; }

    // Raw counts times idf, then L2 normalized. All zeros when no token is known.
    std::vector<double> transform(const std::vector<std::string>& tokens) const;

private:
    Vocabulary vocab_;
    std::vector<double> idf_;
};

double l2Norm(const std::vector<double>& v);

} // namespace textclf
