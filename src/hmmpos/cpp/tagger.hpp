#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "config.hpp"
#include "counts.hpp"
#include "hmm_model.hpp"
#include "viterbi.hpp"

namespace hmmpos {

/**
 * Common interface of the part-of-speech taggers
 *
 * tag_sequence() returns one tag per input word. Implementations are
 * immutable after construction and safe to call from several threads.
 */
class Tagger {
public:
    using Sentence = std::vector<std::string>;
    using TaggedSentence = std::vector<std::pair<std::string, std::string>>;

    virtual ~Tagger() = default;

    virtual std::vector<std::string> tag_sequence(const Sentence& words) const = 0;
    virtual std::string name() const = 0;

    // (word, tag) pairs for a sentence
    TaggedSentence tag(const Sentence& words) const;
};

// Bigram HMM tagger: unknown-word substitution followed by Viterbi decoding
class HmmTagger : public Tagger {
public:
    explicit HmmTagger(std::shared_ptr<const HmmModel> model);

    // Throws DecodingFailure when the lattice is fully blocked
    DecodeResult decode(const Sentence& words) const;

    std::vector<std::string> tag_sequence(const Sentence& words) const override;
    std::string name() const override { return "hmm"; }

    const HmmModel& model() const { return *model_; }

private:
    std::shared_ptr<const HmmModel> model_;
};

/**
 * Most-frequent-class baseline
 *
 * Tags each word with the tag it co-occurred with most often in training,
 * ignoring context. Ties go to the lexicographically smallest tag; words
 * never seen in training get config.missing_tag.
 */
class MostFrequentClassTagger : public Tagger {
public:
    MostFrequentClassTagger(const Sequences& words, const Sequences& tags,
                            const TaggerConfig& config = TaggerConfig());

    std::vector<std::string> tag_sequence(const Sentence& words) const override;
    std::string name() const override { return "mfc"; }

    size_t vocabulary_size() const { return word_tags_.size(); }

private:
    std::unordered_map<std::string, std::string> word_tags_;
    std::string missing_tag_;
};

} // namespace hmmpos
