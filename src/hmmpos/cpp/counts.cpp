#include "counts.hpp"
#include "errors.hpp"

namespace hmmpos {

PairCountTable pair_counts(const Sequences& a, const Sequences& b) {
    if (a.size() != b.size()) {
        throw MalformedSequenceError("got " + std::to_string(a.size()) + " and " +
                                     std::to_string(b.size()) + " sentences");
    }

    PairCountTable result;
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i].size() != b[i].size()) {
            throw MalformedSequenceError("sentence " + std::to_string(i) + " has " +
                                         std::to_string(a[i].size()) + " and " +
                                         std::to_string(b[i].size()) + " elements");
        }
        for (size_t j = 0; j < a[i].size(); ++j) {
            result[a[i][j]][b[i][j]]++;
        }
    }
    return result;
}

CountTable unigram_counts(const Sequences& sequences) {
    CountTable result;
    for (const auto& sequence : sequences) {
        for (const auto& element : sequence) {
            result[element]++;
        }
    }
    return result;
}

PairCountTable bigram_counts(const Sequences& sequences) {
    PairCountTable result;
    for (const auto& sequence : sequences) {
        for (size_t k = 0; k + 1 < sequence.size(); ++k) {
            result[sequence[k]][sequence[k + 1]]++;
        }
    }
    return result;
}

CountTable starting_counts(const Sequences& sequences) {
    CountTable result;
    for (const auto& sequence : sequences) {
        if (!sequence.empty()) {
            result[sequence.front()]++;
        }
    }
    return result;
}

CountTable ending_counts(const Sequences& sequences) {
    CountTable result;
    for (const auto& sequence : sequences) {
        if (!sequence.empty()) {
            result[sequence.back()]++;
        }
    }
    return result;
}

FrequencyTables count_tables(const Sequences& words, const Sequences& tags) {
    FrequencyTables tables;

    // pair_counts validates the pairing, so run it first
    tables.emission = pair_counts(tags, words);
    tables.unigram = unigram_counts(tags);
    tables.bigram = bigram_counts(tags);
    tables.start = starting_counts(tags);
    tables.end = ending_counts(tags);

    for (const auto& sentence : words) {
        if (sentence.empty()) {
            throw MalformedSequenceError("empty training sentence");
        }
        tables.vocabulary.insert(sentence.begin(), sentence.end());
    }
    tables.num_sentences = words.size();

    return tables;
}

long total_count(const CountTable& table) {
    long total = 0;
    for (const auto& entry : table) {
        total += entry.second;
    }
    return total;
}

long total_count(const PairCountTable& table) {
    long total = 0;
    for (const auto& outer : table) {
        total += total_count(outer.second);
    }
    return total;
}

} // namespace hmmpos
