#pragma once
#include "model_loader.hpp"
#include <map>
#include <string>
#include <vector>

namespace textclf {

enum class FeatureKind { Categorical, Log1p, Raw };

struct FeatureSpec {
    std::string name;     // column name in the artifact
    FeatureKind kind{FeatureKind::Raw};
    std::string source;   // key in FeatureTuple (and in encoders for Categorical)
};

struct FeatureTuple {
    std::map<std::string, std::string> categorical;
    std::map<std::string, double> numeric;
};

// Code substituted for an unknown or missing categorical value.
constexpr int kDefaultCategoryCode = 0;

class FeatureEncoder {
public:
    FeatureEncoder(std::vector<FeatureSpec> layout, Encoders encoders);

    const std::vector<FeatureSpec>& layout() const { return layout_; }

    // Never fails on bad input: defaults are substituted and reported in warnings.
    std::vector<double> encode(const FeatureTuple& in, std::vector<std::string>& warnings) const;

private:
    std::vector<FeatureSpec> layout_;
    Encoders encoders_;
};

bool parseFeatureKind(const std::string& name, FeatureKind& out);

// "<x>_encoded" with an encoder "<x>" -> Categorical(x); "log_<x>" -> Log1p;
// anything else -> Raw of the same name.
std::vector<FeatureSpec> inferLayout(const std::vector<std::string>& features, const Encoders& encoders);

// Inputs of the model recommender for one candidate model and task.
FeatureTuple recommenderInputs(const std::string& model_id, const std::string& action,
                               const std::string& language, const std::string& complexity,
                               double context_window, double cost_per_1m);

} // namespace textclf
