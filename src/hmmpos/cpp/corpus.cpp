#include "corpus.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <numeric>
#include <random>
#include <sstream>
#include <stdexcept>

namespace hmmpos {

Corpus::Corpus(std::vector<TaggedSentence> sentences) : sentences_(std::move(sentences)) {
    for (size_t i = 0; i < sentences_.size(); ++i) {
        if (sentences_[i].empty()) {
            throw MalformedSequenceError("sentence " + std::to_string(i) + " is empty");
        }
    }
}

Sequences Corpus::words() const {
    Sequences result;
    result.reserve(sentences_.size());
    for (const auto& sentence : sentences_) {
        Sequence words;
        words.reserve(sentence.size());
        for (const auto& word_tag : sentence) {
            words.push_back(word_tag.first);
        }
        result.push_back(std::move(words));
    }
    return result;
}

Sequences Corpus::tags() const {
    Sequences result;
    result.reserve(sentences_.size());
    for (const auto& sentence : sentences_) {
        Sequence tags;
        tags.reserve(sentence.size());
        for (const auto& word_tag : sentence) {
            tags.push_back(word_tag.second);
        }
        result.push_back(std::move(tags));
    }
    return result;
}

std::unordered_set<std::string> Corpus::vocabulary() const {
    std::unordered_set<std::string> result;
    for (const auto& sentence : sentences_) {
        for (const auto& word_tag : sentence) {
            result.insert(word_tag.first);
        }
    }
    return result;
}

std::set<std::string> Corpus::tagset() const {
    std::set<std::string> result;
    for (const auto& sentence : sentences_) {
        for (const auto& word_tag : sentence) {
            result.insert(word_tag.second);
        }
    }
    return result;
}

size_t Corpus::token_count() const {
    size_t total = 0;
    for (const auto& sentence : sentences_) {
        total += sentence.size();
    }
    return total;
}

Corpus parse_corpus(std::istream& in, const TaggerConfig& config) {
    std::vector<TaggedSentence> sentences;
    std::string line;
    size_t line_number = 0;

    while (std::getline(in, line)) {
        ++line_number;

        std::istringstream tokens(line);
        TaggedSentence sentence;
        std::string token;
        while (tokens >> token) {
            size_t delimiter_pos = token.rfind(config.delimiter);
            if (delimiter_pos == std::string::npos) {
                throw CorpusFormatError("token '" + token + "' has no tag", line_number);
            }
            std::string word = token.substr(0, delimiter_pos);
            std::string tag = token.substr(delimiter_pos + 1);
            if (word.empty() || tag.empty()) {
                throw CorpusFormatError("token '" + token + "' has an empty word or tag", line_number);
            }
            sentence.emplace_back(std::move(word), std::move(tag));
        }

        if (!sentence.empty()) {
            sentences.push_back(std::move(sentence));
        }
    }

    return Corpus(std::move(sentences));
}

Corpus read_corpus(const std::string& filename, const TaggerConfig& config) {
    std::ifstream file(filename);
    if (!file) {
        throw CorpusFormatError("cannot open corpus file: " + filename, 0);
    }
    return parse_corpus(file, config);
}

std::pair<Corpus, Corpus> split_corpus(const Corpus& corpus, double test_fraction, unsigned int seed) {
    if (!(test_fraction >= 0.0 && test_fraction < 1.0)) {
        throw std::invalid_argument("test fraction must be in [0, 1)");
    }

    std::vector<size_t> order(corpus.size());
    std::iota(order.begin(), order.end(), 0);
    std::mt19937 rng(seed);
    std::shuffle(order.begin(), order.end(), rng);

    const size_t test_size = static_cast<size_t>(std::lround(test_fraction * corpus.size()));

    std::vector<TaggedSentence> test;
    std::vector<TaggedSentence> train;
    test.reserve(test_size);
    train.reserve(corpus.size() - test_size);
    for (size_t i = 0; i < order.size(); ++i) {
        const TaggedSentence& sentence = corpus.sentences()[order[i]];
        if (i < test_size) {
            test.push_back(sentence);
        } else {
            train.push_back(sentence);
        }
    }

    return {Corpus(std::move(train)), Corpus(std::move(test))};
}

} // namespace hmmpos
