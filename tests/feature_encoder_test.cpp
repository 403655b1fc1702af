#include "errors.hpp"
#include "feature_encoder.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>

using namespace textclf;
using namespace textclf::test;

static const Encoders kEncoders = {
    {"action", {{"edit", 0}, {"plan", 1}, {"research", 2}, {"review", 3}}},
    {"language", {{"go", 0}, {"python", 1}, {"typescript", 2}}},
    {"complexity", {{"complex", 0}, {"multistep", 1}, {"simple", 2}}},
};

static const std::vector<std::string> kFeatures = {
    "action_encoded", "language_encoded", "complexity_encoded",
    "log_cost", "log_context", "has_coder_tag", "has_instant_tag", "model_size"};

TEST(InferLayout, RecognisesRecommenderColumns) {
    auto layout = inferLayout(kFeatures, kEncoders);
    ASSERT_EQ(layout.size(), 8u);
    EXPECT_EQ(layout[0].kind, FeatureKind::Categorical);
    EXPECT_EQ(layout[0].source, "action");
    EXPECT_EQ(layout[2].source, "complexity");
    EXPECT_EQ(layout[3].kind, FeatureKind::Log1p);
    EXPECT_EQ(layout[3].source, "cost_per_1m");
    EXPECT_EQ(layout[4].source, "context_window");
    EXPECT_EQ(layout[5].kind, FeatureKind::Raw);
    EXPECT_EQ(layout[5].source, "has_coder_tag");
}

TEST(InferLayout, EncodedSuffixWithoutEncoderIsRaw) {
    auto layout = inferLayout({"region_encoded", "log_tokens"}, kEncoders);
    EXPECT_EQ(layout[0].kind, FeatureKind::Raw);
    EXPECT_EQ(layout[0].source, "region_encoded");
    EXPECT_EQ(layout[1].kind, FeatureKind::Log1p);
    EXPECT_EQ(layout[1].source, "tokens");
}

TEST(FeatureEncoder, EncodesKnownValues) {
    FeatureEncoder enc(inferLayout(kFeatures, kEncoders), kEncoders);
    std::vector<std::string> warnings;
    auto x = enc.encode(recommenderInputs("qwen-2.5-coder-32b", "plan", "typescript", "multistep",
                                          32768.0, 0.6),
                        warnings);
    EXPECT_TRUE(warnings.empty());
    ASSERT_EQ(x.size(), 8u);
    EXPECT_EQ(x[0], 1.0);
    EXPECT_EQ(x[1], 2.0);
    EXPECT_EQ(x[2], 1.0);
    EXPECT_DOUBLE_EQ(x[3], std::log1p(0.6));
    EXPECT_DOUBLE_EQ(x[4], std::log1p(32768.0));
    EXPECT_EQ(x[5], 1.0);
    EXPECT_EQ(x[6], 0.0);
    EXPECT_EQ(x[7], 32.0);
}

TEST(FeatureEncoder, UnknownCategoryFallsBackToDefaultWithWarning) {
    FeatureEncoder enc(inferLayout(kFeatures, kEncoders), kEncoders);
    std::vector<std::string> warnings;
    auto x = enc.encode(recommenderInputs("m", "edit", "rust", "simple", 0.0, 0.0), warnings);
    EXPECT_EQ(x[1], static_cast<double>(kDefaultCategoryCode));
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find("rust"), std::string::npos);
}

TEST(FeatureEncoder, FallsBackToLowercaseLookup) {
    FeatureEncoder enc(inferLayout(kFeatures, kEncoders), kEncoders);
    std::vector<std::string> warnings;
    auto x = enc.encode(recommenderInputs("m", "Review", "Python", "SIMPLE", 0.0, 0.0), warnings);
    EXPECT_TRUE(warnings.empty());
    EXPECT_EQ(x[0], 3.0);
    EXPECT_EQ(x[1], 1.0);
    EXPECT_EQ(x[2], 2.0);
}

TEST(FeatureEncoder, MissingInputsDefaultWithWarnings) {
    FeatureEncoder enc(inferLayout(kFeatures, kEncoders), kEncoders);
    std::vector<std::string> warnings;
    auto x = enc.encode(FeatureTuple{}, warnings);
    EXPECT_EQ(x, std::vector<double>(8, 0.0));
    EXPECT_EQ(warnings.size(), 8u);
}

TEST(FeatureEncoder, NonFiniteNumbersBecomeZero) {
    FeatureEncoder enc({FeatureSpec{"log_cost", FeatureKind::Log1p, "cost_per_1m"},
                        FeatureSpec{"size", FeatureKind::Raw, "size"}},
                       {});
    FeatureTuple t;
    t.numeric["cost_per_1m"] = -1.0;   // log1p(-1) is -inf
    t.numeric["size"] = std::numeric_limits<double>::quiet_NaN();
    std::vector<std::string> warnings;
    EXPECT_EQ(enc.encode(t, warnings), (std::vector<double>{0.0, 0.0}));
    EXPECT_EQ(warnings.size(), 2u);
}

TEST(FeatureEncoder, RejectsBadLayouts) {
    EXPECT_THROW(FeatureEncoder({}, kEncoders), ConfigurationError);
    EXPECT_THROW(FeatureEncoder({FeatureSpec{"region_encoded", FeatureKind::Categorical, "region"}},
                                kEncoders),
                 ConfigurationError);
    EXPECT_THROW(FeatureEncoder({FeatureSpec{"x", FeatureKind::Raw, ""}}, kEncoders),
                 ConfigurationError);
}

TEST(ParseFeatureKind, KnownNamesOnly) {
    FeatureKind k = FeatureKind::Raw;
    EXPECT_TRUE(parseFeatureKind("categorical", k));
    EXPECT_EQ(k, FeatureKind::Categorical);
    EXPECT_TRUE(parseFeatureKind("log1p", k));
    EXPECT_EQ(k, FeatureKind::Log1p);
    EXPECT_FALSE(parseFeatureKind("onehot", k));
    EXPECT_EQ(k, FeatureKind::Log1p);
}

TEST(RecommenderInputs, DerivesModelTraitsFromId) {
    auto t = recommenderInputs("Gemini-2.0-Flash", "edit", "go", "simple", 1.0, 2.0);
    EXPECT_EQ(t.numeric.at("has_coder_tag"), 0.0);
    EXPECT_EQ(t.numeric.at("has_instant_tag"), 1.0);
    EXPECT_EQ(t.numeric.at("model_size"), 0.0);

    auto u = recommenderInputs("llama-3.1-70b-instruct", "edit", "go", "simple", 1.0, 2.0);
    EXPECT_EQ(u.numeric.at("model_size"), 70.0);
    EXPECT_EQ(u.numeric.at("has_coder_tag"), 0.0);

    auto v = recommenderInputs("deepseek-coder-33b", "edit", "go", "simple", 1.0, 2.0);
    EXPECT_EQ(v.numeric.at("has_coder_tag"), 1.0);
    EXPECT_EQ(v.numeric.at("model_size"), 33.0);
    EXPECT_EQ(v.categorical.at("language"), "go");
}
