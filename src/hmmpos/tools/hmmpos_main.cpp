#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

#include <boost/program_options.hpp>

#include "corpus.hpp"
#include "errors.hpp"
#include "evaluator.hpp"
#include "hmm_model.hpp"
#include "model_io.hpp"
#include "tagger.hpp"

namespace {

namespace po = boost::program_options;

struct Options {
    std::string command;
    std::string corpus_file;
    std::string model_file;
    hmmpos::TaggerConfig config;
};

void print_usage(const char* program, const po::options_description& desc) {
    std::cout << program << " <evaluate|train|tag> [options]\n"
              << "  evaluate  train on a split of --corpus, report HMM and baseline accuracy\n"
              << "  train     train on all of --corpus and save to --model\n"
              << "  tag       tag whitespace-tokenized sentences from stdin with --model\n\n"
              << desc << std::endl;
}

// Returns false when only help was requested
bool parse_options(int argc, char** argv, Options& options) {
    hmmpos::TaggerConfig& config = options.config;
    std::string delimiter(1, config.delimiter);

    po::options_description desc("options");
    desc.add_options()
        ("corpus", po::value<std::string>(&options.corpus_file), "tagged corpus file, one sentence per line")
        ("model",  po::value<std::string>(&options.model_file),  "model file")

        ("test-fraction", po::value<double>(&config.test_fraction)->default_value(config.test_fraction), "held-out fraction for evaluate")
        ("seed",          po::value<unsigned int>(&config.seed)->default_value(config.seed),         "shuffle seed for the train/test split")
        ("threads",       po::value<int>(&config.num_threads)->default_value(config.num_threads),    "# of evaluation threads")

        ("delimiter",     po::value<std::string>(&delimiter)->default_value(delimiter),                   "word/tag separator")
        ("unknown-token", po::value<std::string>(&config.unknown_token)->default_value(config.unknown_token), "placeholder for unknown words")
        ("missing-tag",   po::value<std::string>(&config.missing_tag)->default_value(config.missing_tag),     "baseline tag for unknown words")

        ("pass-through-unseen", po::bool_switch(&config.pass_through_unseen_emissions), "ignore every missing emission, not only unknown words")
        ("verbose", po::bool_switch(&config.verbose), "progress messages")
        ("help", "help message");

    po::options_description hidden;
    hidden.add_options()
        ("command", po::value<std::string>(&options.command), "command");

    po::options_description all;
    all.add(desc).add(hidden);

    po::positional_options_description positional;
    positional.add("command", 1);

    po::variables_map variables;
    po::store(po::command_line_parser(argc, argv).options(all).positional(positional)
                  .style(po::command_line_style::unix_style & (~po::command_line_style::allow_guessing))
                  .run(),
              variables);
    po::notify(variables);

    if (variables.count("help") || options.command.empty()) {
        print_usage(argv[0], desc);
        return false;
    }

    if (delimiter.size() != 1) {
        throw po::error("--delimiter must be a single character");
    }
    config.delimiter = delimiter[0];
    return true;
}

void require(const std::string& value, const char* option) {
    if (value.empty()) {
        throw po::error(std::string("--") + option + " is required");
    }
}

int run_evaluate(const Options& options) {
    require(options.corpus_file, "corpus");
    const hmmpos::TaggerConfig& config = options.config;

    hmmpos::Corpus corpus = hmmpos::read_corpus(options.corpus_file, config);
    auto split = hmmpos::split_corpus(corpus, config.test_fraction, config.seed);
    const hmmpos::Corpus& train = split.first;
    const hmmpos::Corpus& test = split.second;

    std::cout << "Corpus: " << corpus.size() << " sentences, " << corpus.token_count() << " tokens, "
              << corpus.tagset().size() << " tags" << std::endl;
    std::cout << "Train: " << train.size() << " sentences, test: " << test.size() << " sentences" << std::endl;

    const hmmpos::Sequences train_words = train.words();
    const hmmpos::Sequences train_tags = train.tags();
    const hmmpos::Sequences test_words = test.words();
    const hmmpos::Sequences test_tags = test.tags();

    hmmpos::HmmTagger hmm(hmmpos::build_model(train_words, train_tags, config));
    hmmpos::MostFrequentClassTagger baseline(train_words, train_tags, config);

    std::cout << std::fixed << std::setprecision(2);
    for (const hmmpos::Tagger* tagger : {static_cast<const hmmpos::Tagger*>(&baseline),
                                         static_cast<const hmmpos::Tagger*>(&hmm)}) {
        auto start = std::chrono::high_resolution_clock::now();
        hmmpos::EvaluationResult train_result =
            hmmpos::evaluate(*tagger, train_words, train_tags, config.num_threads);
        hmmpos::EvaluationResult test_result =
            hmmpos::evaluate(*tagger, test_words, test_tags, config.num_threads);
        double elapsed = std::chrono::duration<double>(
            std::chrono::high_resolution_clock::now() - start).count();

        std::cout << tagger->name() << ": training accuracy " << 100.0 * train_result.accuracy()
                  << "%, testing accuracy " << 100.0 * test_result.accuracy() << "%";
        if (test_result.failed_sentences > 0) {
            std::cout << " (" << test_result.failed_sentences << " test sentences undecodable)";
        }
        std::cout << std::endl;
        if (config.verbose) {
            std::cout << tagger->name() << ": evaluated in " << elapsed << " seconds" << std::endl;
        }
    }
    return 0;
}

int run_train(const Options& options) {
    require(options.corpus_file, "corpus");
    require(options.model_file, "model");

    hmmpos::Corpus corpus = hmmpos::read_corpus(options.corpus_file, options.config);
    auto model = hmmpos::build_model(corpus.words(), corpus.tags(), options.config);
    hmmpos::save_model(*model, options.model_file);

    std::cout << "Saved model with " << model->tag_count() << " tags and "
              << model->vocabulary_size() << " words to " << options.model_file << std::endl;
    return 0;
}

int run_tag(const Options& options) {
    require(options.model_file, "model");

    hmmpos::HmmTagger tagger(hmmpos::load_model(options.model_file, options.config));

    std::string line;
    size_t line_number = 0;
    int status = 0;
    while (std::getline(std::cin, line)) {
        ++line_number;

        std::istringstream tokens(line);
        hmmpos::Tagger::Sentence words;
        std::string word;
        while (tokens >> word) {
            words.push_back(word);
        }
        if (words.empty()) {
            std::cout << std::endl;
            continue;
        }

        try {
            hmmpos::Tagger::TaggedSentence tagged = tagger.tag(words);
            for (size_t i = 0; i < tagged.size(); ++i) {
                std::cout << (i ? " " : "") << tagged[i].first << options.config.delimiter << tagged[i].second;
            }
            std::cout << std::endl;
        } catch (const hmmpos::DecodingFailure& e) {
            std::cerr << "line " << line_number << ": " << e.what() << std::endl;
            std::cout << std::endl;
            status = 1;
        }
    }
    return status;
}

} // namespace

int main(int argc, char** argv) {
    try {
        Options options;
        if (!parse_options(argc, argv, options)) {
            return 0;
        }

        if (options.command == "evaluate") {
            return run_evaluate(options);
        } else if (options.command == "train") {
            return run_train(options);
        } else if (options.command == "tag") {
            return run_tag(options);
        }
        throw po::error("unknown command '" + options.command + "'");
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }
}
