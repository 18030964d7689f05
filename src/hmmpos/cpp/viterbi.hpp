#pragma once

#include <string>
#include <vector>

#include "counts.hpp"
#include "hmm_model.hpp"

namespace hmmpos {

struct DecodeResult {
    std::vector<std::string> tags;
    double log_probability;
};

/**
 * Most likely tag path for an observation sequence (Viterbi, log space)
 *
 * The observations are used as given; apply HmmModel::replace_unknown()
 * first so out-of-vocabulary words become the unknown token. The unknown
 * token contributes no emission term under any tag, even when it was
 * itself seen in training. Other missing (word, tag) emissions prune the path
 * unless the model's config enables pass_through_unseen_emissions.
 *
 * Allocates its own lattice per call and only reads the model.
 *
 * Throws MalformedSequenceError for an empty sequence and DecodingFailure
 * when no path through the lattice has non-zero probability.
 */
DecodeResult viterbi_decode(const HmmModel& model, const Sequence& observations);

} // namespace hmmpos
