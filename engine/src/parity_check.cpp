#include "parity_check.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <map>

using json = nlohmann::json;

namespace textclf {

std::vector<ParityMismatch> checkTokenizerParity(const Tokenizer& tok, const json& fixtures) {
    std::vector<ParityMismatch> out;
    try {
        for (const auto& fx : fixtures.at("fixtures")) {
            const std::string text = fx.at("text").get<std::string>();

            // positive: expected more often than produced
            std::map<std::string, int> balance;
            for (const auto& g : fx.at("ngrams").get<std::vector<std::string>>()) ++balance[g];
            for (const auto& g : tok.ngrams(text)) --balance[g];

            ParityMismatch m{text, {}, {}};
            for (const auto& [gram, n] : balance) {
                for (int i = 0; i < n; ++i) m.missing.push_back(gram);
                for (int i = 0; i < -n; ++i) m.unexpected.push_back(gram);
            }
            if (!m.missing.empty() || !m.unexpected.empty()) out.push_back(std::move(m));
        }
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("invalid tokenizer fixtures: ") + e.what());
    }
    return out;
}

std::vector<ParityMismatch> checkTokenizerParityFile(const Tokenizer& tok, const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw ConfigurationError("Could not open fixture file: " + path);
    }
    json j;
    try {
        f >> j;
    } catch (const json::exception& e) {
        throw ConfigurationError(path + ": " + e.what());
    }
    return checkTokenizerParity(tok, j);
}

} // namespace textclf
