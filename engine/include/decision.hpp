#pragma once
#include "heuristic_overlay.hpp"
#include <map>
#include <string>
#include <vector>

namespace textclf {

struct Prediction {
    std::string label;
    double confidence{};
    std::map<std::string, double> probabilities;
    std::vector<double> raw_logits;
    std::vector<double> logits;          // after the overlay
    std::vector<OverlayHit> overlay_hits;
    std::vector<std::string> diagnostics; // recoverable input warnings
};

// Stable softmax: shift by the max before exponentiating.
std::vector<double> softmax(const std::vector<double>& logits);

// Arg-max, first occurrence wins ties.
std::size_t argmax(const std::vector<double>& values);

// Fills label, confidence, probabilities and logits.
Prediction decide(const std::vector<std::string>& classes, const std::vector<double>& logits);

// Class/probability pairs, most likely first.
std::vector<std::pair<std::string, double>> sortedProbabilities(const Prediction& p);

} // namespace textclf
