#include "hmm_model.hpp"

#include <cmath>

#include <gtest/gtest.h>

#include "errors.hpp"
#include "test_data.hpp"

namespace hmmpos {
namespace {

using test_data::blocked_tags;
using test_data::blocked_words;
using test_data::spot_tags;
using test_data::spot_words;
using test_data::watch_train_tags;
using test_data::watch_train_words;

constexpr double kDelta = 1e-12;

class HmmModelTest : public ::testing::Test {
protected:
    void SetUp() override { model_ = build_model(spot_words(), spot_tags()); }

    std::shared_ptr<const HmmModel> model_;
};

TEST_F(HmmModelTest, OneStatePerTag) {
    ASSERT_EQ(model_->tag_count(), 2u);
    EXPECT_EQ(model_->tags()[0], "NOUN");
    EXPECT_EQ(model_->tags()[1], "VERB");
    EXPECT_EQ(*model_->tag_index("VERB"), 1u);
    EXPECT_FALSE(model_->tag_index("ADJ"));
    EXPECT_FALSE(model_->tag_index(HmmModel::START_STATE));
}

TEST_F(HmmModelTest, EmissionsAreNormalizedByTagCount) {
    EXPECT_NEAR(*model_->emission("VERB", "See"), 1.0 / 3, kDelta);
    EXPECT_NEAR(*model_->emission("VERB", "ran"), 1.0 / 3, kDelta);
    EXPECT_NEAR(*model_->emission("NOUN", "Spot"), 1.0, kDelta);
    EXPECT_FALSE(model_->emission("NOUN", "See"));
    EXPECT_FALSE(model_->emission("ADJ", "See"));
}

TEST_F(HmmModelTest, EmissionDistributionsSumToOne) {
    for (size_t t = 0; t < model_->tag_count(); ++t) {
        double total = 0.0;
        for (const auto& entry : model_->emissions(t)) {
            total += entry.second;
        }
        EXPECT_NEAR(total, 1.0, kDelta) << model_->tags()[t];
    }
}

TEST_F(HmmModelTest, TransitionsFollowObservedBigrams) {
    EXPECT_NEAR(*model_->transition(HmmModel::START_STATE, "VERB"), 0.5, kDelta);
    EXPECT_NEAR(*model_->transition(HmmModel::START_STATE, "NOUN"), 0.5, kDelta);
    EXPECT_NEAR(*model_->transition("VERB", "NOUN"), 1.0 / 3, kDelta);
    EXPECT_NEAR(*model_->transition("NOUN", "VERB"), 1.0, kDelta);
    EXPECT_NEAR(*model_->transition("VERB", HmmModel::END_STATE), 1.0, kDelta);
    EXPECT_EQ(model_->transition_count(), 5u);
}

TEST_F(HmmModelTest, UnseenPairsHaveNoTransition) {
    EXPECT_FALSE(model_->transition("VERB", "VERB"));
    EXPECT_FALSE(model_->transition("NOUN", "NOUN"));
    EXPECT_FALSE(model_->transition("NOUN", HmmModel::END_STATE));
    EXPECT_DOUBLE_EQ(model_->transition_or("NOUN", "NOUN", 1e-6), 1e-6);
    EXPECT_DOUBLE_EQ(model_->transition_or("NOUN", "VERB", 1e-6), 1.0);
}

TEST_F(HmmModelTest, LogViewsMatchTransitions) {
    size_t noun = *model_->tag_index("NOUN");
    size_t verb = *model_->tag_index("VERB");

    EXPECT_NEAR(model_->log_transition(verb, noun), std::log(1.0 / 3), kDelta);
    EXPECT_NEAR(model_->log_start(noun), std::log(0.5), kDelta);
    EXPECT_NEAR(model_->log_end(verb), 0.0, kDelta);
    EXPECT_TRUE(std::isinf(model_->log_transition(verb, verb)));
    EXPECT_TRUE(std::isinf(model_->log_end(noun)));
}

TEST_F(HmmModelTest, ReplacesUnknownWords) {
    Sequence replaced = model_->replace_unknown({"See", "Rex", "run"});

    ASSERT_EQ(replaced.size(), 3u);
    EXPECT_EQ(replaced[0], "See");
    EXPECT_EQ(replaced[1], TaggerConfig::UNKNOWN_TOKEN);
    EXPECT_EQ(replaced[2], "run");
}

TEST_F(HmmModelTest, ReplaceUnknownKeepsEmptySequence) {
    EXPECT_TRUE(model_->replace_unknown({}).empty());
}

TEST(HmmModelBuildTest, VocabularyBelongsToEachModel) {
    auto spot = build_model(spot_words(), spot_tags());
    auto watch = build_model(watch_train_words(), watch_train_tags());

    EXPECT_TRUE(spot->in_vocabulary("Spot"));
    EXPECT_FALSE(watch->in_vocabulary("Spot"));
    EXPECT_TRUE(watch->in_vocabulary("watch"));
    EXPECT_EQ(spot->replace_unknown({"watch"})[0], "nan");
    EXPECT_EQ(watch->replace_unknown({"watch"})[0], "watch");
}

TEST(HmmModelBuildTest, UsesConfiguredUnknownToken) {
    TaggerConfig config;
    config.unknown_token = "<unk>";
    auto model = build_model(spot_words(), spot_tags(), config);

    EXPECT_EQ(model->replace_unknown({"Rex"})[0], "<unk>");
}

TEST(HmmModelBuildTest, TagsOutsideBigramsGetNoBoundaryTransitions) {
    auto model = build_model(blocked_words(), blocked_tags());

    ASSERT_EQ(model->tag_count(), 3u);
    EXPECT_FALSE(model->transition(HmmModel::START_STATE, "Z"));
    EXPECT_FALSE(model->transition("Z", HmmModel::END_STATE));
    EXPECT_NEAR(*model->transition(HmmModel::START_STATE, "X"), 0.5, kDelta);
    EXPECT_NEAR(*model->transition("Y", HmmModel::END_STATE), 0.5, kDelta);
    EXPECT_FALSE(model->transition("X", HmmModel::END_STATE));
}

TEST(HmmModelBuildTest, RejectsBigramTagWithoutUnigram) {
    FrequencyTables tables = count_tables(spot_words(), spot_tags());
    tables.bigram["NOUN"]["ADJ"] = 1;

    EXPECT_THROW(build_model(tables), InconsistentCountsError);
}

TEST(HmmModelBuildTest, RejectsTagWithoutEmissions) {
    FrequencyTables tables = count_tables(spot_words(), spot_tags());
    tables.emission.erase("NOUN");

    EXPECT_THROW(build_model(tables), InconsistentCountsError);
}

TEST(HmmModelBuildTest, RejectsStartTagWithoutUnigram) {
    FrequencyTables tables = count_tables(spot_words(), spot_tags());
    tables.start["ADJ"] = 1;

    EXPECT_THROW(build_model(tables), InconsistentCountsError);
}

TEST(HmmModelBuildTest, RejectsEmissionsThatDisagreeWithUnigrams) {
    FrequencyTables tables = count_tables(spot_words(), spot_tags());
    tables.unigram["VERB"] = 4;

    EXPECT_THROW(build_model(tables), InconsistentCountsError);
}

TEST(HmmModelBuildTest, RejectsEmptyTraining) {
    EXPECT_THROW(build_model(FrequencyTables()), InconsistentCountsError);
    EXPECT_THROW(build_model(Sequences(), Sequences()), InconsistentCountsError);
}

TEST(HmmModelBuildTest, RejectsMismatchedTrainingData) {
    Sequences tags = spot_tags();
    tags[0].pop_back();

    EXPECT_THROW(build_model(spot_words(), tags), MalformedSequenceError);
}

TEST(HmmModelBuildTest, BoundaryTransitionsCoverBothBigramEnds) {
    // Y starts only the one-word sentence and is never the first tag of a
    // bigram, yet start->Y exists because Y ends the pair (X, Y).
    auto model = build_model(Sequences{{"a", "b"}, {"c"}}, Sequences{{"X", "Y"}, {"Y"}});

    EXPECT_NEAR(*model->transition(HmmModel::START_STATE, "X"), 0.5, kDelta);
    EXPECT_NEAR(*model->transition(HmmModel::START_STATE, "Y"), 0.5, kDelta);
    EXPECT_NEAR(*model->transition("Y", HmmModel::END_STATE), 1.0, kDelta);
    EXPECT_FALSE(model->transition("X", HmmModel::END_STATE));
    EXPECT_EQ(model->transition_count(), 4u);
}

} // namespace
} // namespace hmmpos
