#include "viterbi.hpp"
#include "errors.hpp"

#include <cmath>
#include <limits>

namespace hmmpos {

namespace {

const double NEG_INF = -std::numeric_limits<double>::infinity();

// Log emission term for one lattice cell; 0.0 means "no emission term"
// The unknown token never scores, even if it occurred in training
double log_emission(const HmmModel& model, size_t tag, const std::string& word) {
    if (word == model.unknown_token()) {
        return 0.0;
    }
    const HmmModel::Distribution& distribution = model.emissions(tag);
    auto it = distribution.find(word);
    if (it != distribution.end()) {
        return std::log(it->second);
    }
    return model.config().pass_through_unseen_emissions ? 0.0 : NEG_INF;
}

} // namespace

DecodeResult viterbi_decode(const HmmModel& model, const Sequence& observations) {
    if (observations.empty()) {
        throw MalformedSequenceError("cannot decode an empty sequence");
    }

    const size_t n = observations.size();
    const size_t num_tags = model.tag_count();

    // Viterbi matrices
    std::vector<std::vector<double>> viterbi(n, std::vector<double>(num_tags, NEG_INF));
    std::vector<std::vector<int>> backtrack(n, std::vector<int>(num_tags, -1));

    // Initialize first position from the start state
    for (size_t t = 0; t < num_tags; ++t) {
        double start = model.log_start(t);
        if (start == NEG_INF) continue;

        double emission = log_emission(model, t, observations[0]);
        if (emission == NEG_INF) continue;

        viterbi[0][t] = start + emission;
    }

    // Forward pass
    for (size_t i = 1; i < n; ++i) {
        for (size_t curr = 0; curr < num_tags; ++curr) {
            double emission = log_emission(model, curr, observations[i]);
            if (emission == NEG_INF) continue;

            double best = NEG_INF;
            int best_prev = -1;
            for (size_t prev = 0; prev < num_tags; ++prev) {
                if (viterbi[i - 1][prev] == NEG_INF) continue;

                double transition = model.log_transition(prev, curr);
                if (transition == NEG_INF) continue;

                double score = viterbi[i - 1][prev] + transition;
                if (score > best) {
                    best = score;
                    best_prev = static_cast<int>(prev);
                }
            }

            if (best_prev >= 0) {
                viterbi[i][curr] = best + emission;
                backtrack[i][curr] = best_prev;
            }
        }
    }

    // Transition into the end state
    double best_score = NEG_INF;
    int best_final = -1;
    for (size_t t = 0; t < num_tags; ++t) {
        if (viterbi[n - 1][t] == NEG_INF) continue;

        double end = model.log_end(t);
        if (end == NEG_INF) continue;

        double score = viterbi[n - 1][t] + end;
        if (score > best_score) {
            best_score = score;
            best_final = static_cast<int>(t);
        }
    }

    if (best_final < 0) {
        throw DecodingFailure("no tag path reaches the end state for a sequence of " +
                              std::to_string(n) + " words");
    }

    // Backtrack to find best path
    DecodeResult result;
    result.tags.resize(n);
    result.log_probability = best_score;

    int current = best_final;
    for (size_t i = n; i-- > 0;) {
        result.tags[i] = model.tags()[current];
        current = backtrack[i][current];
    }

    return result;
}

} // namespace hmmpos
