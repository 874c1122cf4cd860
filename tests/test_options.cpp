#include <gtest/gtest.h>
#include "options/option.hpp"
#include "options/option_generator.hpp"
#include "scoring/scoring_model.hpp"
#include "model_fixtures.hpp"

#include <algorithm>
#include <vector>

using namespace gamcoach;

namespace {

constexpr std::size_t kAge = 0;
constexpr std::size_t kIncome = 1;
constexpr std::size_t kHousing = 2;

constexpr double kSim = 0.0075;

OptionFilter increase() {
    OptionFilter f;
    f.direction = 1;
    return f;
}

OptionFilter unfiltered() {
    OptionFilter f;
    f.filter_direction = false;
    return f;
}

// One continuous feature "x" with a narrow middle bin [1.2, 1.8).
ScoringModel narrowBinModel() {
    return ScoringModel(ModelDescription::fromJson(nlohmann::json::parse(R"({
        "featureNames": ["x"],
        "featureTypes": ["continuous"],
        "features": [
            {"name": "x", "type": "continuous",
             "binEdge": [0, 1.2, 1.8, 5], "additive": [0.0, 1.0, 2.0]}
        ],
        "intercept": 0.0,
        "isClassifier": false
    })")));
}

const ContinuousOption* byBin(const std::vector<ContinuousOption>& options, std::size_t bin) {
    for (const auto& o : options) {
        if (o.bin == bin) return &o;
    }
    return nullptr;
}

} // namespace

// ─── Option Identifier ─────────────────────────────────────────

TEST(OptionTest, InteractionIdIsNormalized) {
    OptionId a = OptionId::interaction(1, 3, 0, 2);
    OptionId b = OptionId::interaction(0, 2, 1, 3);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.feature, 0u);
    EXPECT_EQ(a.bin2, 3u);
    EXPECT_TRUE(a.isInteraction());
    EXPECT_EQ(a.toString(), "0:2 x 1:3");

    OptionId m = OptionId::mainEffect(OptionKind::Continuous, 1, 3);
    EXPECT_NE(m, a);
    EXPECT_EQ(m.toString(), "1:3");

    OptionIdSet used = {a, m};
    EXPECT_EQ(used.size(), 2u);
    EXPECT_EQ(used.count(b), 1u);
}

// ─── Continuous Options ────────────────────────────────────────

TEST(OptionTest, ContinuousRightBinsUseLowerEdge) {
    ScoringModel model = fixtures::classifierModel();
    OptionGenerator gen(model, fixtures::classifierSample());

    auto options = gen.continuousOptions(kAge, increase(), kSim);
    ASSERT_EQ(options.size(), 3u);

    // Sorted by distance after pruning.
    EXPECT_EQ(options[0].bin, 1u);
    EXPECT_DOUBLE_EQ(options[0].target, 30.0);
    EXPECT_DOUBLE_EQ(options[0].distance, 0.5);
    EXPECT_NEAR(options[0].score_gain, 0.38, 1e-12);
    EXPECT_NEAR(options[0].interaction_gains.at(0), -0.02, 1e-12);

    EXPECT_DOUBLE_EQ(options[1].target, 45.0);
    EXPECT_NEAR(options[1].score_gain, 0.85, 1e-12);
    EXPECT_DOUBLE_EQ(options[2].target, 60.0);
    EXPECT_DOUBLE_EQ(options[2].distance, 3.5);
    EXPECT_NEAR(options[2].score_gain, 1.03, 1e-12);
}

TEST(OptionTest, ContinuousDistanceUsesMad) {
    ScoringModel model = fixtures::classifierModel();
    OptionGenerator gen(model, fixtures::classifierSample());

    auto options = gen.continuousOptions(kIncome, increase(), kSim);
    ASSERT_EQ(options.size(), 3u);
    EXPECT_NEAR(byBin(options, 1)->distance, 0.2, 1e-12);
    EXPECT_NEAR(byBin(options, 2)->distance, 1.4, 1e-12);
    EXPECT_NEAR(byBin(options, 3)->score_gain, 1.83, 1e-12);
}

TEST(OptionTest, ContinuousLeftBinsStayInside) {
    ScoringModel model = fixtures::classifierModel();
    OptionGenerator gen(model, {50.0, 15000.0, std::string("rent")});

    auto options = gen.continuousOptions(kAge, unfiltered(), 0.0);
    const ContinuousOption* bin0 = byBin(options, 0);
    const ContinuousOption* bin1 = byBin(options, 1);
    ASSERT_NE(bin0, nullptr);
    ASSERT_NE(bin1, nullptr);
    EXPECT_NEAR(bin0->target, 30.0 - OptionGenerator::kDefaultEpsilon, 1e-12);
    EXPECT_NEAR(bin1->target, 45.0 - OptionGenerator::kDefaultEpsilon, 1e-12);
    EXPECT_LT(bin1->target, 45.0);
    EXPECT_EQ(searchSortedLowerBound(model.mainTerm(kAge).edges, bin1->target), 1u);
}

TEST(OptionTest, LeftTargetsStayInsideLargeBins) {
    ScoringModel model(ModelDescription::fromJson(nlohmann::json::parse(R"({
        "featureNames": ["x"],
        "featureTypes": ["continuous"],
        "features": [
            {"name": "x", "type": "continuous",
             "binEdge": [0, 1e11, 2e11, 3e11], "additive": [0.0, 1.0, 2.0]}
        ],
        "intercept": 0.0,
        "isClassifier": false
    })")));
    OptionGenerator gen(model, {2.5e11});

    auto options = gen.continuousOptions(0, unfiltered(), 0.0);
    ASSERT_EQ(options.size(), 2u);
    for (std::size_t bin : {0u, 1u}) {
        const ContinuousOption* o = byBin(options, bin);
        ASSERT_NE(o, nullptr);
        EXPECT_LT(o->target, model.mainTerm(0).edges[bin + 1]);
        EXPECT_EQ(searchSortedLowerBound(model.mainTerm(0).edges, o->target), bin);
        EXPECT_DOUBLE_EQ(o->score_gain, static_cast<double>(bin) - 2.0);
    }
}

TEST(OptionTest, IntegerTargetsSnapInsideBins) {
    ScoringModel model = fixtures::classifierModel();
    OptionGenerator gen(model, {50.0, 15000.0, std::string("rent")});

    auto options = gen.continuousOptions(kAge, unfiltered(), 0.0, true);
    EXPECT_DOUBLE_EQ(byBin(options, 0)->target, 29.0);
    EXPECT_DOUBLE_EQ(byBin(options, 1)->target, 44.0);
    EXPECT_DOUBLE_EQ(byBin(options, 3)->target, 60.0);
}

TEST(OptionTest, IntegerSkipsBinsWithoutIntegers) {
    ScoringModel model = narrowBinModel();

    OptionGenerator from_right(model, {4.0});
    auto left = from_right.continuousOptions(0, unfiltered(), 0.0, true);
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left[0].bin, 0u);
    EXPECT_DOUBLE_EQ(left[0].target, 1.0);

    OptionGenerator from_left(model, {0.5});
    auto right = from_left.continuousOptions(0, unfiltered(), 0.0, true);
    ASSERT_EQ(right.size(), 1u);
    EXPECT_EQ(right[0].bin, 2u);
    EXPECT_DOUBLE_EQ(right[0].target, 2.0);

    // Without the integer requirement the narrow bin is reachable.
    auto any = from_left.continuousOptions(0, unfiltered(), 0.0);
    EXPECT_EQ(any.size(), 2u);
}

TEST(OptionTest, DirectionFilterDropsWrongWay) {
    ScoringModel model = fixtures::classifierModel();
    OptionGenerator gen(model, fixtures::classifierSample());

    OptionFilter decrease;
    decrease.direction = -1;
    EXPECT_TRUE(gen.continuousOptions(kAge, decrease, kSim).empty());
    EXPECT_TRUE(gen.categoricalOptions(kHousing, decrease).empty());
}

TEST(OptionTest, ScoreGainBoundDropsOvershoot) {
    ScoringModel model = fixtures::classifierModel();
    OptionGenerator gen(model, fixtures::classifierSample());

    OptionFilter bounded = increase();
    bounded.score_gain_bound = 0.9;
    auto options = gen.continuousOptions(kAge, bounded, kSim);
    ASSERT_EQ(options.size(), 2u);
    for (const auto& o : options) {
        EXPECT_LE(o.score_gain, 0.9);
    }
}

// ─── Redundancy Pruning ────────────────────────────────────────

TEST(OptionTest, PruneKeepsCheapestOfSimilarGains) {
    std::vector<ContinuousOption> options(4);
    options[0].distance = 4.0; options[0].score_gain = 1.009;
    options[1].distance = 1.0; options[1].score_gain = 1.0;
    options[2].distance = 3.0; options[2].score_gain = 2.0;
    options[3].distance = 2.0; options[3].score_gain = 1.005;

    OptionGenerator::pruneRedundant(options, 0.01);
    ASSERT_EQ(options.size(), 2u);
    EXPECT_DOUBLE_EQ(options[0].distance, 1.0);
    EXPECT_DOUBLE_EQ(options[1].distance, 3.0);
}

TEST(OptionTest, PruneComparesAgainstKeptOptionsOnly) {
    // 1.008 is dropped against 1.0, so 1.016 survives even though it is
    // within the threshold of the dropped entry.
    std::vector<ContinuousOption> options(3);
    options[0].distance = 1.0; options[0].score_gain = 1.0;
    options[1].distance = 2.0; options[1].score_gain = 1.008;
    options[2].distance = 3.0; options[2].score_gain = 1.016;

    OptionGenerator::pruneRedundant(options, 0.01);
    ASSERT_EQ(options.size(), 2u);
    EXPECT_DOUBLE_EQ(options[1].score_gain, 1.016);
}

TEST(OptionTest, DefaultSimThreshold) {
    ScoringModel model = fixtures::classifierModel();
    OptionGenerator gen(model, fixtures::classifierSample());
    EXPECT_NEAR(gen.defaultSimThreshold(0.005), 0.0075, 1e-12);
}

// ─── Categorical Options ───────────────────────────────────────

TEST(OptionTest, CategoricalOptionsPerOtherLevel) {
    ScoringModel model = fixtures::classifierModel();
    OptionGenerator gen(model, fixtures::classifierSample());

    auto options = gen.categoricalOptions(kHousing, increase());
    ASSERT_EQ(options.size(), 2u);
    EXPECT_EQ(options[0].level, "mortgage");
    EXPECT_DOUBLE_EQ(options[0].level_code, 2.0);
    EXPECT_EQ(options[0].bin, 1u);
    EXPECT_NEAR(options[0].score_gain, 0.5, 1e-12);
    EXPECT_DOUBLE_EQ(options[0].distance, 0.6);
    EXPECT_TRUE(options[0].interaction_gains.empty());

    EXPECT_EQ(options[1].level, "own");
    EXPECT_NEAR(options[1].score_gain, 1.0, 1e-12);
    EXPECT_DOUBLE_EQ(options[1].distance, 0.7);
}

TEST(OptionTest, CategoricalDistanceDefaultsToOne) {
    auto j = fixtures::classifierModelJson();
    j.erase("catDistances");
    ScoringModel model(ModelDescription::fromJson(j));
    OptionGenerator gen(model, fixtures::classifierSample());

    for (const auto& o : gen.categoricalOptions(kHousing, increase())) {
        EXPECT_DOUBLE_EQ(o.distance, 1.0);
    }
}

// ─── Interaction Options ───────────────────────────────────────

TEST(OptionTest, InteractionOptionsSubtractParentShares) {
    ScoringModel model = fixtures::classifierModel();
    OptionGenerator gen(model, fixtures::classifierSample());

    OptionSet parents;
    parents.continuous[kAge] = gen.continuousOptions(kAge, increase(), kSim);
    parents.continuous[kIncome] = gen.continuousOptions(kIncome, increase(), kSim);

    auto options = gen.interactionOptions(0, parents);
    ASSERT_EQ(options.size(), 9u);

    const auto& grid = model.interactionTerm(0).scores;
    for (const auto& o : options) {
        EXPECT_DOUBLE_EQ(o.distance, 0.0);
        const double share1 = byBin(parents.continuous[kAge], o.bin1)->interaction_gains.at(0);
        const double share2 = byBin(parents.continuous[kIncome], o.bin2)->interaction_gains.at(0);
        // Parents' shares plus the net gain give the full joint change.
        EXPECT_NEAR(share1 + share2 + o.score_gain, grid[o.bin1][o.bin2] - 0.05, 1e-12);
    }

    auto joint = std::find_if(options.begin(), options.end(), [](const InteractionOption& o) {
        return o.bin1 == 2 && o.bin2 == 2;
    });
    ASSERT_NE(joint, options.end());
    EXPECT_NEAR(joint->score_gain, 0.07, 1e-12);
    EXPECT_EQ(joint->id(), OptionId::interaction(kAge, 2, kIncome, 2));
    EXPECT_DOUBLE_EQ(asNumber(joint->target1), 45.0);
    EXPECT_DOUBLE_EQ(asNumber(joint->target2), 50000.0);
}

TEST(OptionTest, InteractionNeedsBothParents) {
    ScoringModel model = fixtures::classifierModel();
    OptionGenerator gen(model, fixtures::classifierSample());

    OptionSet parents;
    parents.continuous[kAge] = gen.continuousOptions(kAge, increase(), kSim);
    EXPECT_TRUE(gen.interactionOptions(0, parents).empty());
}

TEST(OptionTest, OptionSetViews) {
    ScoringModel model = fixtures::classifierModel();
    OptionGenerator gen(model, fixtures::classifierSample());

    OptionSet set;
    set.continuous[kAge] = gen.continuousOptions(kAge, increase(), kSim);
    set.categorical[kHousing] = gen.categoricalOptions(kHousing, increase());

    EXPECT_EQ(set.mainOptionCount(), 5u);
    auto views = set.mainOptions(kHousing);
    ASSERT_EQ(views.size(), 2u);
    EXPECT_EQ(views[1].id, OptionId::mainEffect(OptionKind::Categorical, kHousing, 2));
    EXPECT_EQ(asLabel(views[1].target), "own");
    EXPECT_TRUE(set.mainOptions(kIncome).empty());
}
