#include "classifier.hpp"
#include "errors.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <cmath>

using namespace textclf;
using namespace textclf::test;

static TextClassifier tinyComplexity() {
    return TextClassifier("complexity", parseTextModel(tinyComplexityArtifact()),
                          HeuristicOverlay(defaultOverlayRules("complexity")));
}

static double probabilitySum(const Prediction& p) {
    double s = 0.0;
    for (const auto& kv : p.probabilities) s += kv.second;
    return s;
}

TEST(TextClassifier, DeployDockerEndToEnd) {
    auto clf = tinyComplexity();

    auto x = clf.vectorize("deploy docker");
    ASSERT_EQ(x.size(), 2u);
    EXPECT_NEAR(x[0], 0.7071, 1e-4);
    EXPECT_NEAR(x[1], 0.7071, 1e-4);

    auto raw = clf.logits("deploy docker");
    EXPECT_NEAR(raw[0], 0.0, 1e-9);
    EXPECT_NEAR(raw[1], 1.4142, 1e-4);
    EXPECT_NEAR(raw[2], 0.0, 1e-9);

    auto p = clf.classify("deploy docker");
    EXPECT_EQ(p.label, "complex");
    EXPECT_NEAR(p.logits[1], 2.9142, 1e-4);
    EXPECT_NEAR(p.raw_logits[1], 1.4142, 1e-4);
    EXPECT_NEAR(p.confidence, 0.902, 1e-3);
    EXPECT_NEAR(probabilitySum(p), 1.0, 1e-6);
    ASSERT_EQ(p.overlay_hits.size(), 1u);
    EXPECT_EQ(p.overlay_hits[0].class_label, "complex");
    EXPECT_TRUE(p.diagnostics.empty());
}

TEST(TextClassifier, VectorizeIsIdempotentAndNormalized) {
    auto clf = tinyComplexity();
    const std::string text = "Deploy the Docker image, then deploy again";
    auto a = clf.vectorize(text);
    EXPECT_EQ(a, clf.vectorize(text));
    EXPECT_NEAR(l2Norm(a), 1.0, 1e-6);
}

TEST(TextClassifier, DegenerateInputFallsBackToIntercepts) {
    auto clf = tinyComplexity();
    for (const char* text : {"", "   ", "!!! ?? ..", "a b c"}) {
        auto p = clf.classify(text);
        EXPECT_EQ(p.label, "simple") << text;
        EXPECT_NEAR(p.confidence, 1.0 / 3.0, 1e-9) << text;
        EXPECT_NEAR(probabilitySum(p), 1.0, 1e-6) << text;
        ASSERT_EQ(p.diagnostics.size(), 1u) << text;
        EXPECT_TRUE(p.overlay_hits.empty()) << text;
    }
}

TEST(TextClassifier, OverlayCanDecideWithoutKnownTerms) {
    auto clf = tinyComplexity();
    auto p = clf.classify("first write the plan, then run it");
    EXPECT_EQ(p.label, "multistep");
    EXPECT_EQ(p.diagnostics.size(), 1u);
    EXPECT_DOUBLE_EQ(p.raw_logits[2], 0.0);
    EXPECT_DOUBLE_EQ(p.logits[2], 1.0);
}

TEST(TextClassifier, IntentFixtureWithoutOverlay) {
    TextClassifier clf("intent", loadTextModel(fixture("intent_small.json")));
    EXPECT_TRUE(clf.overlay().empty());

    EXPECT_EQ(clf.classify("List files").label, "query");
    EXPECT_EQ(clf.classify("fix this bug").label, "editor");
    EXPECT_EQ(clf.classify("Review this please").label, "review");

    auto p = clf.classify("deploy then docker");
    EXPECT_TRUE(p.overlay_hits.empty());
    EXPECT_EQ(p.label, "query");   // largest intercept
}

TEST(TextClassifier, OverlayForUnknownClassIsIgnored) {
    TextClassifier clf("intent", loadTextModel(fixture("intent_small.json")),
                       HeuristicOverlay(defaultOverlayRules("complexity")));
    auto p = clf.classify("list files then deploy");
    EXPECT_TRUE(p.overlay_hits.empty());
    EXPECT_EQ(p.logits, p.raw_logits);
}

TEST(TextClassifier, RequiresAModel) {
    EXPECT_THROW(TextClassifier("x", nullptr), ConfigurationError);
}

TEST(FeatureClassifier, AllUnknownInputsStillGiveADistribution) {
    FeatureClassifier clf("recommender", loadFeatureModel(fixture("recommender_small.json")));
    FeatureTuple t;
    t.categorical["action"] = "paint";
    t.categorical["language"] = "cobol";
    t.categorical["complexity"] = "unknowable";
    auto p = clf.classifyFeatures(t);
    EXPECT_NEAR(probabilitySum(p), 1.0, 1e-6);
    // every input defaulted: z is just the intercept
    EXPECT_NEAR(p.raw_logits[1], -1.2, 1e-12);
    EXPECT_EQ(p.label, "failure");
    EXPECT_EQ(p.diagnostics.size(), 8u);
}

TEST(FeatureClassifier, BinaryScoreIsSigmoid) {
    FeatureClassifier clf("recommender", loadFeatureModel(fixture("recommender_small.json")));
    auto p = clf.classifyFeatures(
        recommenderInputs("qwen-2.5-coder-32b", "edit", "python", "complex", 0.0, 0.0));
    EXPECT_TRUE(p.diagnostics.empty());
    // -0.10*1 + 0.90*1 + 0.01*32 - 1.2
    const double z = -0.1 + 0.9 + 0.32 - 1.2;
    EXPECT_NEAR(p.raw_logits[1], z, 1e-9);
    EXPECT_NEAR(p.probabilities.at("success"), 1.0 / (1.0 + std::exp(-z)), 1e-9);
}

TEST(FeatureClassifier, LayoutMustMatchArtifact) {
    auto model = loadFeatureModel(fixture("recommender_small.json"));
    EXPECT_THROW(FeatureClassifier("r", model, {FeatureSpec{"model_size", FeatureKind::Raw, "model_size"}}),
                 ConfigurationError);

    auto layout = inferLayout(model->features, model->encoders);
    std::swap(layout[0], layout[1]);
    EXPECT_THROW(FeatureClassifier("r", model, layout), ConfigurationError);
}
