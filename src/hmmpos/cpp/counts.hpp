#pragma once

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace hmmpos {

using Sequence = std::vector<std::string>;
using Sequences = std::vector<Sequence>;

using CountTable = std::unordered_map<std::string, int>;
using PairCountTable = std::unordered_map<std::string, std::unordered_map<std::string, int>>;

/**
 * Frequency tables counted from a training corpus
 *
 * - unigram[tag]: occurrences of each tag
 * - bigram[tag_i][tag_j]: adjacent tag pairs inside a sentence
 * - emission[tag][word]: word occurrences under each tag
 * - start[tag] / end[tag]: first / last tag of each sentence
 */
struct FrequencyTables {
    CountTable unigram;
    PairCountTable bigram;
    PairCountTable emission;
    CountTable start;
    CountTable end;

    size_t num_sentences = 0;
    std::unordered_set<std::string> vocabulary;
};

// result[a[i][j]][b[i][j]] for every position of every sentence.
// Throws MalformedSequenceError when a and b are not parallel.
PairCountTable pair_counts(const Sequences& a, const Sequences& b);

CountTable unigram_counts(const Sequences& sequences);

// Pairs never span two sentences
PairCountTable bigram_counts(const Sequences& sequences);

CountTable starting_counts(const Sequences& sequences);
CountTable ending_counts(const Sequences& sequences);

// All five tables plus the sentence count and the word vocabulary
FrequencyTables count_tables(const Sequences& words, const Sequences& tags);

// Sum helpers, used for the table invariants
long total_count(const CountTable& table);
long total_count(const PairCountTable& table);

} // namespace hmmpos
