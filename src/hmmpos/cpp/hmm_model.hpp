#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "config.hpp"
#include "counts.hpp"

namespace hmmpos {

class HmmModel;

/**
 * Assemble and finalize a model from counted frequency tables.
 *
 * Throws InconsistentCountsError when the bigram, start or end tables name a
 * tag without unigram/emission counts, or when the tables count no sentences.
 */
std::shared_ptr<const HmmModel> build_model(const FrequencyTables& tables,
                                            const TaggerConfig& config = TaggerConfig());

// Count the training split and build the model from it
std::shared_ptr<const HmmModel> build_model(const Sequences& words, const Sequences& tags,
                                            const TaggerConfig& config = TaggerConfig());

/**
 * First-order (bigram) hidden Markov model over part-of-speech tags
 *
 * States are the synthetic start state, one state per tag seen in training
 * and the synthetic end state. Only the tag states emit.
 *
 * Transitions are sparse: a (from, to) pair that was never observed has no
 * entry and transition() returns std::nullopt for it. Callers that need a
 * smoothed model can supply their own value via transition_or().
 *
 * A model is built once by build_model() and never mutated afterwards, so
 * one instance can be shared by any number of concurrent decoders.
 */
class HmmModel {
public:
    static constexpr const char* START_STATE = "<start>";
    static constexpr const char* END_STATE = "<end>";

    using Distribution = std::unordered_map<std::string, double>;

    // Tag states, sorted; a tag's position is its state index
    const std::vector<std::string>& tags() const { return tags_; }
    size_t tag_count() const { return tags_.size(); }
    std::optional<size_t> tag_index(const std::string& tag) const;

    const std::unordered_set<std::string>& vocabulary() const { return tables_.vocabulary; }
    size_t vocabulary_size() const { return tables_.vocabulary.size(); }
    bool in_vocabulary(const std::string& word) const;

    const FrequencyTables& tables() const { return tables_; }
    const TaggerConfig& config() const { return config_; }
    const std::string& unknown_token() const { return config_.unknown_token; }

    // P(word | tag) over the words observed with that tag
    const Distribution& emissions(size_t tag) const { return emissions_[tag]; }
    std::optional<double> emission(const std::string& tag, const std::string& word) const;

    // P(to | from); from may be START_STATE, to may be END_STATE
    std::optional<double> transition(const std::string& from, const std::string& to) const;
    double transition_or(const std::string& from, const std::string& to, double fallback) const;
    size_t transition_count() const;

    // Dense log-space views for the decoder, -inf where no transition exists
    double log_start(size_t tag) const { return log_start_[tag]; }
    double log_end(size_t tag) const { return log_end_[tag]; }
    double log_transition(size_t from, size_t to) const { return log_transitions_[from * tags_.size() + to]; }

    // Unknown-word policy: every word outside the vocabulary becomes unknown_token()
    Sequence replace_unknown(const Sequence& words) const;

private:
    friend std::shared_ptr<const HmmModel> build_model(const FrequencyTables& tables,
                                                       const TaggerConfig& config);

    HmmModel() = default;

    void add_state(const std::string& tag, int count);
    void add_transition(const std::string& from, const std::string& to, double probability);
    void finalize();

    FrequencyTables tables_;
    TaggerConfig config_;

    std::vector<std::string> tags_;
    std::unordered_map<std::string, size_t> tag_index_;
    std::vector<Distribution> emissions_;

    // transitions_[from][to], keyed by state name
    std::unordered_map<std::string, std::unordered_map<std::string, double>> transitions_;

    std::vector<double> log_start_;
    std::vector<double> log_end_;
    std::vector<double> log_transitions_;
};

} // namespace hmmpos
