#include "heuristic_overlay.hpp"
#include "errors.hpp"
#include "tokenizer.hpp"
#include <algorithm>
#include <cmath>

namespace textclf {

static long indexOf(const std::vector<std::string>& arr, const std::string& val) {
    auto it = std::find(arr.begin(), arr.end(), val);
    return it == arr.end() ? -1 : static_cast<long>(it - arr.begin());
}

HeuristicOverlay::HeuristicOverlay(std::vector<CueRule> rules) : rules_(std::move(rules)) {
    for (const auto& r : rules_) {
        if (r.class_label.empty()) {
            throw ConfigurationError("overlay rule without a class");
        }
        if (!std::isfinite(r.bonus)) {
            throw ConfigurationError("overlay rule for '" + r.class_label + "' has a non-finite bonus");
        }
        if (r.cues.empty()) {
            throw ConfigurationError("overlay rule for '" + r.class_label + "' has no cues");
        }
        for (const auto& c : r.cues) {
            // an empty cue would match every text
            if (c.empty()) {
                throw ConfigurationError("overlay rule for '" + r.class_label + "' has an empty cue");
            }
        }
    }
}

std::vector<OverlayHit> HeuristicOverlay::apply(const std::string& text,
                                                const std::vector<std::string>& classes,
                                                std::vector<double>& logits) const {
    std::vector<OverlayHit> hits;
    if (rules_.empty()) return hits;

    const std::string padded = padForCues(text);
    for (const auto& r : rules_) {
        const long idx = indexOf(classes, r.class_label);
        if (idx < 0 || static_cast<std::size_t>(idx) >= logits.size()) continue;
        for (const auto& cue : r.cues) {
            if (padded.find(cue) != std::string::npos) {
                logits[idx] += r.bonus;
                hits.push_back(OverlayHit{r.class_label, cue, r.bonus});
                break;
            }
        }
    }
    return hits;
}

std::vector<std::string> HeuristicOverlay::unknownClasses(const std::vector<std::string>& classes) const {
    std::vector<std::string> out;
    for (const auto& r : rules_) {
        if (indexOf(classes, r.class_label) < 0 &&
            std::find(out.begin(), out.end(), r.class_label) == out.end()) {
            out.push_back(r.class_label);
        }
    }
    return out;
}

std::vector<CueRule> defaultOverlayRules(const std::string& classifier) {
    if (classifier != "complexity" && classifier != "complexity_detection") return {};

    // temporal connectives imply a multistep task; tool names a complex one
    return {
        CueRule{"multistep", 1.0,
                {" then ", " and then ", ", then ", "; then ", " after ", " followed by ",
                 " first ", " second ", " third "}},
        CueRule{"complex", 1.5,
                {"oauth", "oauth2", "oidc", "migrate", "migration", "deploy", "docker",
                 "kubectl", "k8s", "s3", "pipeline", "airflow", "terraform", "ansible",
                 "kafka", "stripe", "payment", "upload", "script", "bash", "nginx", "logs"}},
    };
}

} // namespace textclf
