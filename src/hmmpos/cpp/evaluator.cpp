#include "evaluator.hpp"
#include "errors.hpp"

#include <exception>
#include <string>

namespace hmmpos {

EvaluationResult evaluate(const Tagger& tagger, const Sequences& words, const Sequences& tags,
                          int num_threads) {
    if (words.size() != tags.size()) {
        throw MalformedSequenceError("got " + std::to_string(words.size()) + " word sequences and " +
                                     std::to_string(tags.size()) + " tag sequences");
    }
    size_t total = 0;
    for (size_t i = 0; i < words.size(); ++i) {
        if (words[i].empty() || words[i].size() != tags[i].size()) {
            throw MalformedSequenceError("sentence " + std::to_string(i) + " has " +
                                         std::to_string(words[i].size()) + " words and " +
                                         std::to_string(tags[i].size()) + " tags");
        }
        total += words[i].size();
    }

    const long num_sentences = static_cast<long>(words.size());
    const int threads = num_threads > 1 ? num_threads : 1;
    size_t correct = 0;
    size_t failed = 0;
    std::exception_ptr error;

#pragma omp parallel for num_threads(threads) if(threads > 1) \
        schedule(dynamic) reduction(+:correct, failed)
    for (long i = 0; i < num_sentences; ++i) {
        // Nothing may leave the parallel region; the first other error is
        // rethrown once the loop is done.
        try {
            std::vector<std::string> predicted = tagger.tag_sequence(words[i]);
            for (size_t j = 0; j < predicted.size() && j < tags[i].size(); ++j) {
                if (predicted[j] == tags[i][j]) {
                    ++correct;
                }
            }
        } catch (const DecodingFailure&) {
            ++failed;
        } catch (...) {
#pragma omp critical(hmmpos_evaluate_error)
            {
                if (!error) {
                    error = std::current_exception();
                }
            }
        }
    }

    if (error) {
        std::rethrow_exception(error);
    }

    EvaluationResult result;
    result.correct = correct;
    result.total = total;
    result.failed_sentences = failed;
    return result;
}

double accuracy(const Tagger& tagger, const Sequences& words, const Sequences& tags,
                int num_threads) {
    return evaluate(tagger, words, tags, num_threads).accuracy();
}

} // namespace hmmpos
