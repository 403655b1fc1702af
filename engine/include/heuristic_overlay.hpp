#pragma once
#include <string>
#include <vector>

namespace textclf {

// Fires once when any cue is a substring of the padded text.
struct CueRule {
    std::string class_label;
    double bonus{};
    std::vector<std::string> cues;
};

struct OverlayHit {
    std::string class_label;
    std::string cue;     // first cue that matched
    double bonus{};
};

class HeuristicOverlay {
public:
    HeuristicOverlay() = default;
    explicit HeuristicOverlay(std::vector<CueRule> rules);

    bool empty() const { return rules_.empty(); }
    const std::vector<CueRule>& rules() const { return rules_; }

    // Adds bonuses in place; classes gives the logit index space.
    std::vector<OverlayHit> apply(const std::string& text,
                                  const std::vector<std::string>& classes,
                                  std::vector<double>& logits) const;

    // Labels referenced by rules but missing from classes.
    std::vector<std::string> unknownClasses(const std::vector<std::string>& classes) const;

private:
    std::vector<CueRule> rules_;
};

// Built-in rule table for a classifier identity; empty when there is none.
std::vector<CueRule> defaultOverlayRules(const std::string& classifier);

} // namespace textclf
