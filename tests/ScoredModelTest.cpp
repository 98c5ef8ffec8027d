#include <gtest/gtest.h>
#include <cmath>
#include <fstream>
#include <numeric>
#include <stdexcept>
#include <sys/stat.h>
#include "Forest.hpp"
#include "LinearModel.hpp"
#include "ModelBundle.hpp"
#include "Scaler.hpp"
#include "TestUtil.hpp"

namespace {

// One stump on feature 0: <= 0.5 votes upright, otherwise turtle neck.
const char* kStumpForest =
    "forest 1 8\n"
    "tree 3\n"
    "0 0 0.5 1 2 0 0 0 0 0 0 0 0\n"
    "1 -1 0 -1 -1 1 0 0 0 0 0 0 0\n"
    "2 -1 0 -1 -1 0 0 0 0 1 0 0 0\n";

FeatureVector withFirst(double v, std::size_t n = 11){
    FeatureVector x(n, 0.0);
    x[0] = v;
    return x;
}

std::string makeDir(const std::string& name){
    const std::string dir = tempPath(name);
    ::mkdir(dir.c_str(), 0755);
    return dir;
}

void writeIn(const std::string& dir, const std::string& file, const std::string& contents){
    std::ofstream out(dir + "/" + file);
    out << contents;
}

}  // namespace

TEST(Forest, FollowsSplitsToLeafDistribution){
    Forest forest;
    ASSERT_TRUE(forest.load(writeTempFile("stump.forest", kStumpForest)));
    EXPECT_TRUE(forest.probabilistic());
    EXPECT_EQ(forest.classCount(), 8u);
    EXPECT_EQ(forest.predict(withFirst(0.2)), 0);
    EXPECT_EQ(forest.predict(withFirst(0.9)), 4);
    const auto p = forest.predictProbabilities(withFirst(0.9));
    ASSERT_EQ(p.size(), 8u);
    EXPECT_DOUBLE_EQ(p[4], 1.0);
}

TEST(Forest, AveragesTreesIntoNormalizedProbabilities){
    const std::string text =
        "forest 2 8\n"
        "tree 1\n0 -1 0 -1 -1 1 0 0 0 0 0 0 0\n"
        "tree 1\n0 -1 0 -1 -1 0 0 0 1 0 0 0 0\n";
    Forest forest;
    ASSERT_TRUE(forest.load(writeTempFile("two.forest", text)));
    const auto p = forest.proba(withFirst(0.0));
    EXPECT_DOUBLE_EQ(p[0], 0.5);
    EXPECT_DOUBLE_EQ(p[3], 0.5);
    EXPECT_NEAR(std::accumulate(p.begin(), p.end(), 0.0), 1.0, 1e-12);
}

TEST(Forest, EmptyLeavesGiveUniformDistribution){
    Forest forest;
    ASSERT_TRUE(forest.load(writeTempFile("zero.forest", "forest 1 8\ntree 1\n0 -1 0 -1 -1 0 0 0 0 0 0 0 0\n")));
    for(double v : forest.proba(withFirst(1.0))) EXPECT_DOUBLE_EQ(v, 1.0 / 8.0);
}

TEST(Forest, ThrowsOnFeatureOutsideInput){
    const std::string text = "forest 1 8\ntree 3\n"
                             "0 20 0.5 1 2 0 0 0 0 0 0 0 0\n"
                             "1 -1 0 -1 -1 1 0 0 0 0 0 0 0\n"
                             "2 -1 0 -1 -1 0 1 0 0 0 0 0 0\n";
    Forest forest;
    ASSERT_TRUE(forest.load(writeTempFile("wide.forest", text)));
    EXPECT_THROW(forest.predict(withFirst(1.0)), std::runtime_error);
}

TEST(Forest, RejectsMalformedFiles){
    Forest forest;
    EXPECT_FALSE(forest.load(tempPath("missing.forest")));
    EXPECT_FALSE(forest.load(writeTempFile("bad.forest", "trees 1 8\n")));
    EXPECT_FALSE(forest.load(writeTempFile("short.forest", "forest 1 8\ntree 2\n0 -1 0 -1 -1 1 0 0 0 0 0 0 0\n")));
}

TEST(LinearModel, PointPredictorVotesWithArgmax){
    // Class 1 wins when x0 > x1.
    LinearModel model;
    ASSERT_TRUE(model.load(writeTempFile("point.linear", "linear 2 2 0\n0 1 0\n1 0 0\n")));
    EXPECT_FALSE(model.probabilistic());
    EXPECT_EQ(model.predict({3.0, 1.0}), 1);
    EXPECT_EQ(model.predict({1.0, 3.0}), 0);
    EXPECT_THROW(model.predictProbabilities({1.0, 3.0}), std::logic_error);
}

TEST(LinearModel, SoftmaxOverMargins){
    LinearModel model;
    ASSERT_TRUE(model.load(writeTempFile("proba.linear", "linear 2 1 1\n1 0\n0 0\n")));
    ASSERT_TRUE(model.probabilistic());
    const auto p = model.predictProbabilities({std::log(3.0)});
    EXPECT_NEAR(p[0], 0.75, 1e-12);
    EXPECT_NEAR(p[1], 0.25, 1e-12);
}

TEST(LinearModel, ThrowsOnDimensionMismatch){
    LinearModel model;
    ASSERT_TRUE(model.load(writeTempFile("dims.linear", "linear 2 2 0\n0 1 0\n1 0 0\n")));
    EXPECT_THROW(model.predict({1.0, 2.0, 3.0}), std::runtime_error);
}

TEST(Scaler, StandardizesAndTreatsZeroScaleAsOne){
    Scaler scaler;
    ASSERT_TRUE(scaler.load(writeTempFile("s.cfg", "length 2\nmean_0 10\nscale_0 2\nmean_1 1\nscale_1 0\n")));
    EXPECT_EQ(scaler.length(), 2u);
    const auto out = scaler.transform({14.0, 5.0});
    EXPECT_DOUBLE_EQ(out[0], 2.0);
    EXPECT_DOUBLE_EQ(out[1], 4.0);
    EXPECT_THROW(scaler.transform({1.0}), std::runtime_error);
}

TEST(Scaler, RejectsIndicesBeyondLength){
    Scaler scaler;
    EXPECT_FALSE(scaler.load(writeTempFile("oob.cfg", "length 2\nmean_5 1\n")));
    EXPECT_FALSE(scaler.load(writeTempFile("nolen.cfg", "mean_0 1\n")));
}

TEST(ModelBundle, MissingManifestYieldsEmptyBundle){
    const auto bundle = ModelBundle::load(makeDir("empty_models"), PosturePolicy{});
    EXPECT_TRUE(bundle->stage(1).models.empty());
    EXPECT_TRUE(bundle->stage(2).models.empty());
    EXPECT_EQ(bundle->failureCount(), 0u);
    ASSERT_EQ(bundle->loadReport().size(), 1u);
    EXPECT_NE(bundle->loadReport()[0].find("no manifest"), std::string::npos);
}

TEST(ModelBundle, LoadsEachModelIndependently){
    const std::string dir = makeDir("models");
    writeIn(dir, "rf.forest", kStumpForest);
    writeIn(dir, "tiny.linear", "linear 2 11 0\n0 0 0 0 0 0 0 0 0 0 0 0\n0 0 0 0 0 0 0 0 0 0 0 0\n");
    writeIn(dir, "s1.cfg", "length 11\n");
    writeIn(dir, "s2.cfg", "length 3\n");
    writeIn(dir, ModelBundle::kManifestName,
            "# pressure stage\n"
            "stage1 forest rf rf.forest\n"
            "stage1 forest gb missing.forest 0.3\n"
            "stage1 linear lr tiny.linear\n"
            "stage1 scaler - s1.cfg\n"
            "stage2 forest imu rf.forest 2.5\n"
            "stage2 scaler - s2.cfg\n"
            "stage3 forest x rf.forest\n");

    const auto bundle = ModelBundle::load(dir, PosturePolicy{});
    ASSERT_EQ(bundle->stage(1).models.size(), 1u);
    EXPECT_EQ(bundle->stage(1).models[0].name, "rf");
    EXPECT_DOUBLE_EQ(bundle->stage(1).models[0].weight, 0.4);
    EXPECT_TRUE(bundle->stage(1).scaler != nullptr);

    ASSERT_EQ(bundle->stage(2).models.size(), 1u);
    EXPECT_DOUBLE_EQ(bundle->stage(2).models[0].weight, 2.5);
    EXPECT_TRUE(bundle->stage(2).scaler == nullptr);

    // missing file, wrong class count, wrong scaler length, unknown stage
    EXPECT_EQ(bundle->failureCount(), 4u);
}

TEST(ModelBundle, DefaultWeights){
    EXPECT_DOUBLE_EQ(defaultModelWeight("rf"), 0.4);
    EXPECT_DOUBLE_EQ(defaultModelWeight("gb"), 0.3);
    EXPECT_DOUBLE_EQ(defaultModelWeight("lr"), 0.15);
    EXPECT_DOUBLE_EQ(defaultModelWeight("svm"), 0.15);
    EXPECT_DOUBLE_EQ(defaultModelWeight("knn"), 1.0);
}
