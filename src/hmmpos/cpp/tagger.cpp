#include "tagger.hpp"

#include <stdexcept>

namespace hmmpos {

Tagger::TaggedSentence Tagger::tag(const Sentence& words) const {
    if (words.empty()) {
        return {};
    }

    std::vector<std::string> predicted_tags = tag_sequence(words);

    // Combine words with predicted tags
    TaggedSentence result;
    result.reserve(words.size());
    for (size_t i = 0; i < words.size(); ++i) {
        result.emplace_back(words[i], predicted_tags[i]);
    }
    return result;
}

HmmTagger::HmmTagger(std::shared_ptr<const HmmModel> model) : model_(std::move(model)) {
    if (!model_) {
        throw std::invalid_argument("HmmTagger requires a model");
    }
}

DecodeResult HmmTagger::decode(const Sentence& words) const {
    return viterbi_decode(*model_, model_->replace_unknown(words));
}

std::vector<std::string> HmmTagger::tag_sequence(const Sentence& words) const {
    return decode(words).tags;
}

MostFrequentClassTagger::MostFrequentClassTagger(const Sequences& words, const Sequences& tags,
                                                 const TaggerConfig& config)
    : missing_tag_(config.missing_tag) {
    PairCountTable word_tag_counts = pair_counts(words, tags);

    for (const auto& word_entry : word_tag_counts) {
        const std::string* best_tag = nullptr;
        int best_count = 0;
        for (const auto& tag_count : word_entry.second) {
            if (tag_count.second > best_count ||
                (tag_count.second == best_count && best_tag && tag_count.first < *best_tag)) {
                best_tag = &tag_count.first;
                best_count = tag_count.second;
            }
        }
        if (best_tag) {
            word_tags_[word_entry.first] = *best_tag;
        }
    }
}

std::vector<std::string> MostFrequentClassTagger::tag_sequence(const Sentence& words) const {
    std::vector<std::string> result;
    result.reserve(words.size());
    for (const auto& word : words) {
        auto it = word_tags_.find(word);
        result.push_back(it == word_tags_.end() ? missing_tag_ : it->second);
    }
    return result;
}

} // namespace hmmpos
