#include "hmm_model.hpp"
#include "errors.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>

namespace hmmpos {

namespace {

const double NEG_INF = -std::numeric_limits<double>::infinity();

double log_or_neg_inf(double probability) {
    return probability > 0.0 ? std::log(probability) : NEG_INF;
}

int count_or_zero(const CountTable& table, const std::string& key) {
    auto it = table.find(key);
    return it == table.end() ? 0 : it->second;
}

} // namespace

std::optional<size_t> HmmModel::tag_index(const std::string& tag) const {
    auto it = tag_index_.find(tag);
    if (it == tag_index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool HmmModel::in_vocabulary(const std::string& word) const {
    return tables_.vocabulary.count(word) > 0;
}

std::optional<double> HmmModel::emission(const std::string& tag, const std::string& word) const {
    auto index = tag_index(tag);
    if (!index) {
        return std::nullopt;
    }
    const Distribution& distribution = emissions_[*index];
    auto it = distribution.find(word);
    if (it == distribution.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<double> HmmModel::transition(const std::string& from, const std::string& to) const {
    auto from_it = transitions_.find(from);
    if (from_it == transitions_.end()) {
        return std::nullopt;
    }
    auto to_it = from_it->second.find(to);
    if (to_it == from_it->second.end()) {
        return std::nullopt;
    }
    return to_it->second;
}

double HmmModel::transition_or(const std::string& from, const std::string& to, double fallback) const {
    return transition(from, to).value_or(fallback);
}

size_t HmmModel::transition_count() const {
    size_t total = 0;
    for (const auto& entry : transitions_) {
        total += entry.second.size();
    }
    return total;
}

Sequence HmmModel::replace_unknown(const Sequence& words) const {
    Sequence result;
    result.reserve(words.size());
    for (const auto& word : words) {
        result.push_back(in_vocabulary(word) ? word : config_.unknown_token);
    }
    return result;
}

void HmmModel::add_state(const std::string& tag, int count) {
    auto emission_it = tables_.emission.find(tag);
    if (emission_it == tables_.emission.end()) {
        throw InconsistentCountsError("tag '" + tag + "' has no emission counts");
    }
    if (total_count(emission_it->second) != count) {
        throw InconsistentCountsError("emission counts for tag '" + tag +
                                      "' do not sum to its unigram count");
    }

    Distribution distribution;
    for (const auto& word_count : emission_it->second) {
        if (word_count.second > 0) {
            distribution[word_count.first] = static_cast<double>(word_count.second) / count;
        }
    }

    tag_index_[tag] = tags_.size();
    tags_.push_back(tag);
    emissions_.push_back(std::move(distribution));
}

void HmmModel::add_transition(const std::string& from, const std::string& to, double probability) {
    if (probability > 0.0) {
        transitions_[from][to] = probability;
    }
}

void HmmModel::finalize() {
    const size_t n = tags_.size();
    log_start_.assign(n, NEG_INF);
    log_end_.assign(n, NEG_INF);
    log_transitions_.assign(n * n, NEG_INF);

    for (size_t i = 0; i < n; ++i) {
        if (auto p = transition(START_STATE, tags_[i])) {
            log_start_[i] = log_or_neg_inf(*p);
        }
        if (auto p = transition(tags_[i], END_STATE)) {
            log_end_[i] = log_or_neg_inf(*p);
        }
        for (size_t j = 0; j < n; ++j) {
            if (auto p = transition(tags_[i], tags_[j])) {
                log_transitions_[i * n + j] = log_or_neg_inf(*p);
            }
        }
    }
}

std::shared_ptr<const HmmModel> build_model(const FrequencyTables& tables, const TaggerConfig& config) {
    auto start_time = std::chrono::high_resolution_clock::now();

    if (tables.num_sentences == 0) {
        throw InconsistentCountsError("no training sentences");
    }
    if (config.verbose) {
        std::cout << "Building HMM from " << tables.num_sentences << " sentences..." << std::endl;
    }

    std::shared_ptr<HmmModel> model(new HmmModel());
    model->tables_ = tables;
    model->config_ = config;

    // One state per tag, in sorted order so state indices are reproducible
    std::vector<std::string> tags;
    for (const auto& entry : tables.unigram) {
        if (entry.second > 0) {
            tags.push_back(entry.first);
        }
    }
    std::sort(tags.begin(), tags.end());
    for (const auto& tag : tags) {
        model->add_state(tag, tables.unigram.at(tag));
    }

    auto require_state = [&model](const std::string& tag, const char* table) {
        if (!model->tag_index(tag)) {
            throw InconsistentCountsError(std::string(table) + " table references tag '" + tag +
                                          "' with no unigram count");
        }
    };
    for (const auto& entry : tables.emission) {
        require_state(entry.first, "emission");
    }
    for (const auto& entry : tables.start) {
        require_state(entry.first, "start");
    }
    for (const auto& entry : tables.end) {
        require_state(entry.first, "end");
    }

    const double num_sentences = static_cast<double>(tables.num_sentences);
    if (total_count(tables.start) != static_cast<long>(tables.num_sentences) ||
        total_count(tables.end) != static_cast<long>(tables.num_sentences)) {
        throw InconsistentCountsError("start/end counts do not match the sentence count");
    }

    // Transitions exist only for tag pairs observed in the bigram table
    for (const auto& from_entry : tables.bigram) {
        const std::string& from = from_entry.first;
        require_state(from, "bigram");
        const double from_count = tables.unigram.at(from);

        for (const auto& to_entry : from_entry.second) {
            const std::string& to = to_entry.first;
            require_state(to, "bigram");
            if (to_entry.second <= 0) {
                continue;
            }

            model->add_transition(from, to, to_entry.second / from_count);
            for (const std::string* tag : {&from, &to}) {
                model->add_transition(HmmModel::START_STATE, *tag,
                                      count_or_zero(tables.start, *tag) / num_sentences);
                model->add_transition(*tag, HmmModel::END_STATE,
                                      count_or_zero(tables.end, *tag) / num_sentences);
            }
        }
    }

    model->finalize();

    if (config.verbose) {
        double elapsed = std::chrono::duration<double>(
            std::chrono::high_resolution_clock::now() - start_time).count();
        std::cout << "Model built in " << elapsed << " seconds" << std::endl;
        std::cout << "Tag set size: " << model->tag_count() << " tags" << std::endl;
        std::cout << "Vocabulary size: " << model->vocabulary_size() << " words" << std::endl;
        std::cout << "Transitions: " << model->transition_count() << std::endl;
    }

    return model;
}

std::shared_ptr<const HmmModel> build_model(const Sequences& words, const Sequences& tags,
                                            const TaggerConfig& config) {
    return build_model(count_tables(words, tags), config);
}

} // namespace hmmpos
