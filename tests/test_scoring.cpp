#include <gtest/gtest.h>
#include "common/logging.hpp"
#include "scoring/label_encoder.hpp"
#include "scoring/scoring_model.hpp"
#include "model_fixtures.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace gamcoach;

// ─── Bin Search ────────────────────────────────────────────────

TEST(ScoringTest, LowerBoundSearch) {
    const std::vector<double> edges = {18, 30, 45, 60};
    EXPECT_EQ(searchSortedLowerBound(edges, 10), 0u);   // clamps below
    EXPECT_EQ(searchSortedLowerBound(edges, 18), 0u);
    EXPECT_EQ(searchSortedLowerBound(edges, 29.9), 0u);
    EXPECT_EQ(searchSortedLowerBound(edges, 30), 1u);
    EXPECT_EQ(searchSortedLowerBound(edges, 59), 2u);
    EXPECT_EQ(searchSortedLowerBound(edges, 60), 3u);
    EXPECT_EQ(searchSortedLowerBound(edges, 1000), 3u); // clamps above
}

// ─── Label Encoder ─────────────────────────────────────────────

TEST(ScoringTest, LabelEncoderRoundTrip) {
    LabelEncoder encoder;
    encoder.add("housing", "own", 3);
    encoder.add("housing", "rent", 1);

    EXPECT_EQ(encoder.encode("housing", "own").value_or(-1), 3);
    EXPECT_FALSE(encoder.encode("housing", "castle").has_value());
    EXPECT_EQ(encoder.decode("housing", 1).value_or(""), "rent");
    EXPECT_FALSE(encoder.decode("color", 1).has_value());

    const auto labels = encoder.labels("housing");
    ASSERT_EQ(labels.size(), 2u);
    EXPECT_EQ(labels[0], "rent");
    EXPECT_TRUE(encoder.hasFeature("housing"));
}

// ─── Scoring Model ─────────────────────────────────────────────

TEST(ScoringTest, CountScoreClassifier) {
    ScoringModel model = fixtures::classifierModel();
    ScoreBreakdown bd = model.countScore(fixtures::classifierSample());

    ASSERT_EQ(bd.main.size(), 3u);
    EXPECT_DOUBLE_EQ(bd.main[0], -0.6);
    EXPECT_DOUBLE_EQ(bd.main[1], -1.0);
    EXPECT_DOUBLE_EQ(bd.main[2], -0.4);
    ASSERT_EQ(bd.interaction.size(), 1u);
    EXPECT_DOUBLE_EQ(bd.interaction[0], 0.05);
    EXPECT_NEAR(bd.total(), -1.95, 1e-12);
    EXPECT_NEAR(model.rawScore(fixtures::classifierSample()), -2.15, 1e-12);
}

TEST(ScoringTest, CountScoreByName) {
    ScoringModel model = fixtures::classifierModel();
    auto scores = model.countScoreByName(fixtures::classifierSample());
    EXPECT_EQ(scores.size(), 4u);
    EXPECT_DOUBLE_EQ(scores.at("income"), -1.0);
    EXPECT_DOUBLE_EQ(scores.at("age x income"), 0.05);
}

TEST(ScoringTest, PredictClassifier) {
    ScoringModel model = fixtures::classifierModel();
    std::vector<Sample> samples = {
        fixtures::classifierSample(),
        {50.0, 120000.0, std::string("own")}
    };

    auto labels = model.predict(samples);
    EXPECT_DOUBLE_EQ(labels[0], 0.0);
    EXPECT_DOUBLE_EQ(labels[1], 1.0);

    auto raw = model.predict(samples, true);
    EXPECT_NEAR(raw[0], -2.15, 1e-12);
    EXPECT_NEAR(raw[1], 1.63, 1e-12);

    auto probs = model.predictProb(samples);
    EXPECT_NEAR(probs[0], 0.10433, 1e-9);
    EXPECT_GT(probs[1], 0.5);
}

TEST(ScoringTest, SigmoidRoundsAndZeroIsPositive) {
    EXPECT_DOUBLE_EQ(ScoringModel::sigmoid(0.0), 0.5);
    EXPECT_DOUBLE_EQ(ScoringModel::sigmoid(20.0), 1.0);

    ScoringModel model = fixtures::classifierModel();
    EXPECT_DOUBLE_EQ(model.scoreToPrediction(0.0, false), 1.0);
    EXPECT_DOUBLE_EQ(model.scoreToPrediction(-1e-3, false), 0.0);
}

TEST(ScoringTest, ValuesOutsideEdgesClamp) {
    ScoringModel model = fixtures::classifierModel();
    ScoreBreakdown low = model.countScore({10.0, -5.0, std::string("rent")});
    ScoreBreakdown high = model.countScore({95.0, 500000.0, std::string("rent")});
    EXPECT_DOUBLE_EQ(low.main[0], -0.6);
    EXPECT_DOUBLE_EQ(low.main[1], -1.0);
    EXPECT_DOUBLE_EQ(high.main[0], 0.5);
    EXPECT_DOUBLE_EQ(high.main[1], 0.9);
    EXPECT_DOUBLE_EQ(high.interaction[0], 0.05);
}

TEST(ScoringTest, CategoricalAcceptsCodes) {
    ScoringModel model = fixtures::classifierModel();
    ScoreBreakdown bd = model.countScore({25.0, 15000.0, 2.0});
    EXPECT_DOUBLE_EQ(bd.main[2], 0.1);
}

TEST(ScoringTest, UnseenLevelContributesZeroAndWarns) {
    std::vector<std::string> lines;
    logging::setMinLevel(logging::LogLevel::Info);
    logging::setSink([&lines](const std::string& line) { lines.push_back(line); });

    ScoringModel model = fixtures::classifierModel();
    ScoreBreakdown bd = model.countScore({25.0, 15000.0, std::string("castle")});
    logging::setSink({});

    EXPECT_DOUBLE_EQ(bd.main[2], 0.0);
    EXPECT_NEAR(model.intercept() + bd.total(), -1.75, 1e-12);

    ASSERT_FALSE(lines.empty());
    auto event = nlohmann::json::parse(lines.front());
    EXPECT_EQ(event["what"], "unseen_categorical_level");
    EXPECT_EQ(event["context"]["level"], "castle");
}

TEST(ScoringTest, RegressionPredictsRawScore) {
    ScoringModel model = fixtures::regressionModel();
    EXPECT_FALSE(model.isClassifier());
    auto preds = model.predict({fixtures::regressionSample(), {5.0, 100.0}});
    EXPECT_NEAR(preds[0], 5.0, 1e-12);
    EXPECT_NEAR(preds[1], 14.0, 1e-12);
    EXPECT_NEAR(model.predictProb({fixtures::regressionSample()})[0], 5.0, 1e-12);
}

TEST(ScoringTest, WrongSampleLengthThrows) {
    ScoringModel model = fixtures::regressionModel();
    EXPECT_THROW(model.countScore({1.0}), std::invalid_argument);
}

TEST(ScoringTest, InteractionTablesDropTrailingEdge) {
    auto j = fixtures::classifierModelJson();
    j["features"][3]["binLabel1"] = {18, 30, 45, 60, 90};
    ScoringModel model(ModelDescription::fromJson(j));
    EXPECT_EQ(model.interactionTerm(0).edges1.size(), 4u);
    EXPECT_EQ(model.mainTerm(0).edges.size(), 4u);
    EXPECT_DOUBLE_EQ(model.mainTerm(0).upper_edge, 90.0);
    ASSERT_EQ(model.interactionsOf(1).size(), 1u);
    EXPECT_TRUE(model.interactionsOf(2).empty());
}
