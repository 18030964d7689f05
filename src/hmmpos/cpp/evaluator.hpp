#pragma once

#include <cstddef>

#include "counts.hpp"
#include "tagger.hpp"

namespace hmmpos {

struct EvaluationResult {
    size_t correct = 0;
    size_t total = 0;
    size_t failed_sentences = 0;

    double accuracy() const { return total == 0 ? 0.0 : static_cast<double>(correct) / total; }
};

/**
 * Token-level accuracy of a tagger against gold tags.
 *
 * A sentence the tagger cannot decode (DecodingFailure) scores zero correct
 * tokens but its tokens still count in the total. With num_threads > 1 the
 * sentences are tagged in parallel.
 *
 * Throws MalformedSequenceError when words and tags are not parallel or a
 * sentence is empty. Any other error raised by the tagger is rethrown after
 * the remaining sentences have been tagged.
 */
EvaluationResult evaluate(const Tagger& tagger, const Sequences& words, const Sequences& tags,
                          int num_threads = 1);

double accuracy(const Tagger& tagger, const Sequences& words, const Sequences& tags,
                int num_threads = 1);

} // namespace hmmpos
