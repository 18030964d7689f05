#include "evaluator.hpp"

#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "errors.hpp"
#include "test_data.hpp"

namespace hmmpos {
namespace {

using test_data::blocked_tags;
using test_data::blocked_words;
using test_data::watch_test_tags;
using test_data::watch_test_words;
using test_data::watch_train_tags;
using test_data::watch_train_words;

class EvaluatorTest : public ::testing::Test {
protected:
    EvaluatorTest()
        : hmm_(build_model(watch_train_words(), watch_train_tags())),
          baseline_(watch_train_words(), watch_train_tags()) {}

    HmmTagger hmm_;
    MostFrequentClassTagger baseline_;
};

TEST_F(EvaluatorTest, CountsCorrectTokens) {
    EvaluationResult result = evaluate(baseline_, watch_test_words(), watch_test_tags());

    EXPECT_EQ(result.total, 7u);
    EXPECT_EQ(result.correct, 6u);
    EXPECT_EQ(result.failed_sentences, 0u);
    EXPECT_DOUBLE_EQ(result.accuracy(), 6.0 / 7);
}

TEST_F(EvaluatorTest, HmmIsAtLeastAsAccurateAsBaseline) {
    double hmm_accuracy = accuracy(hmm_, watch_test_words(), watch_test_tags());
    double baseline_accuracy = accuracy(baseline_, watch_test_words(), watch_test_tags());

    EXPECT_DOUBLE_EQ(hmm_accuracy, 1.0);
    EXPECT_GE(hmm_accuracy, baseline_accuracy);

    EXPECT_GE(accuracy(hmm_, watch_train_words(), watch_train_tags()),
              accuracy(baseline_, watch_train_words(), watch_train_tags()));
}

TEST_F(EvaluatorTest, ParallelMatchesSerial) {
    Sequences words;
    Sequences tags;
    for (int i = 0; i < 50; ++i) {
        for (const auto& sentence : watch_train_words()) words.push_back(sentence);
        for (const auto& sentence : watch_train_tags()) tags.push_back(sentence);
        for (const auto& sentence : watch_test_words()) words.push_back(sentence);
        for (const auto& sentence : watch_test_tags()) tags.push_back(sentence);
    }

    EvaluationResult serial = evaluate(hmm_, words, tags, 1);
    EvaluationResult parallel = evaluate(hmm_, words, tags, 4);

    EXPECT_EQ(serial.correct, parallel.correct);
    EXPECT_EQ(serial.total, parallel.total);
    EXPECT_EQ(serial.failed_sentences, parallel.failed_sentences);
}

TEST_F(EvaluatorTest, RejectsMismatchedData) {
    Sequences tags = watch_test_tags();
    tags.pop_back();
    EXPECT_THROW(evaluate(hmm_, watch_test_words(), tags), MalformedSequenceError);

    tags = watch_test_tags();
    tags[0].pop_back();
    EXPECT_THROW(evaluate(hmm_, watch_test_words(), tags), MalformedSequenceError);

    EXPECT_THROW(evaluate(hmm_, Sequences{Sequence{}}, Sequences{Sequence{}}), MalformedSequenceError);
}

TEST_F(EvaluatorTest, EmptyDataHasZeroAccuracy) {
    EvaluationResult result = evaluate(hmm_, Sequences(), Sequences());

    EXPECT_EQ(result.total, 0u);
    EXPECT_DOUBLE_EQ(result.accuracy(), 0.0);
}

TEST(EvaluatorFailureTest, UndecodableSentencesCountAsWrong) {
    HmmTagger tagger(build_model(blocked_words(), blocked_tags()));

    EvaluationResult result = evaluate(tagger, blocked_words(), blocked_tags());

    EXPECT_EQ(result.failed_sentences, 1u);
    EXPECT_EQ(result.correct, 2u);
    EXPECT_EQ(result.total, 3u);
    EXPECT_DOUBLE_EQ(result.accuracy(), 2.0 / 3);
}

TEST(EvaluatorFailureTest, ParallelEvaluationIsolatesFailures) {
    HmmTagger tagger(build_model(blocked_words(), blocked_tags()));
    Sequences words;
    Sequences tags;
    for (int i = 0; i < 20; ++i) {
        words.push_back({"c"});
        tags.push_back({"Z"});
        words.push_back({"a", "b"});
        tags.push_back({"X", "Y"});
    }

    EvaluationResult result = evaluate(tagger, words, tags, 4);

    EXPECT_EQ(result.failed_sentences, 20u);
    EXPECT_EQ(result.correct, 40u);
    EXPECT_EQ(result.total, 60u);
}

class ThrowingTagger : public Tagger {
public:
    std::vector<std::string> tag_sequence(const Sentence& words) const override {
        if (words.front() == "boom") {
            throw std::runtime_error("tagger broke");
        }
        return std::vector<std::string>(words.size(), "NOUN");
    }
    std::string name() const override { return "throwing"; }
};

TEST(EvaluatorFailureTest, OtherErrorsPropagate) {
    ThrowingTagger tagger;
    Sequences words;
    Sequences tags;
    for (int i = 0; i < 10; ++i) {
        words.push_back({i == 6 ? "boom" : "dog"});
        tags.push_back({"NOUN"});
    }

    EXPECT_THROW(evaluate(tagger, words, tags, 1), std::runtime_error);
    EXPECT_THROW(evaluate(tagger, words, tags, 4), std::runtime_error);
}

TEST(EvaluatorFailureTest, TaggerWithoutErrorsIsScored) {
    ThrowingTagger tagger;

    EvaluationResult result = evaluate(tagger, Sequences{{"dog", "runs"}}, Sequences{{"NOUN", "VERB"}}, 2);

    EXPECT_EQ(result.correct, 1u);
    EXPECT_EQ(result.total, 2u);
}

} // namespace
} // namespace hmmpos
