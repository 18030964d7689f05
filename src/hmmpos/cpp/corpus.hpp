#pragma once

#include <istream>
#include <set>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "config.hpp"
#include "counts.hpp"

namespace hmmpos {

using TaggedSentence = std::vector<std::pair<std::string, std::string>>;

/**
 * Tagged corpus: a list of sentences of (word, tag) pairs
 *
 * Every sentence is non-empty. words() and tags() give the parallel
 * sequence view the counting and evaluation functions work on.
 */
class Corpus {
public:
    Corpus() = default;
    explicit Corpus(std::vector<TaggedSentence> sentences);

    const std::vector<TaggedSentence>& sentences() const { return sentences_; }
    size_t size() const { return sentences_.size(); }
    bool empty() const { return sentences_.empty(); }

    Sequences words() const;
    Sequences tags() const;

    std::unordered_set<std::string> vocabulary() const;
    std::set<std::string> tagset() const;
    size_t token_count() const;

private:
    std::vector<TaggedSentence> sentences_;
};

/**
 * Parse one sentence per line of whitespace-separated "word<delim>tag"
 * tokens. The tag follows the last delimiter, so "1/2/NUM" is the word
 * "1/2" tagged NUM. Blank lines are skipped.
 *
 * Throws CorpusFormatError on a token without a delimiter or with an empty
 * word or tag.
 */
Corpus parse_corpus(std::istream& in, const TaggerConfig& config = TaggerConfig());

// Throws CorpusFormatError when the file cannot be opened
Corpus read_corpus(const std::string& filename, const TaggerConfig& config = TaggerConfig());

/**
 * Shuffle deterministically with the given seed, then put the first
 * round(test_fraction * size) sentences in the test split. Returns
 * (train, test).
 *
 * Throws std::invalid_argument unless 0 <= test_fraction < 1.
 */
std::pair<Corpus, Corpus> split_corpus(const Corpus& corpus, double test_fraction, unsigned int seed);

} // namespace hmmpos
