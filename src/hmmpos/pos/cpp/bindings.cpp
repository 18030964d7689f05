#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>

#include <chrono>

#include "corpus.hpp"
#include "errors.hpp"
#include "evaluator.hpp"
#include "hmm_model.hpp"
#include "model_io.hpp"
#include "tagger.hpp"

namespace py = pybind11;
using namespace pybind11::literals;

PYBIND11_MODULE(hmmpos_cpp, m) {
    m.doc() = "Bigram HMM part-of-speech tagger with Python bindings";

    py::class_<hmmpos::TaggerConfig>(m, "TaggerConfig")
        .def(py::init<>())
        .def_readwrite("unknown_token", &hmmpos::TaggerConfig::unknown_token)
        .def_readwrite("missing_tag", &hmmpos::TaggerConfig::missing_tag)
        .def_readwrite("delimiter", &hmmpos::TaggerConfig::delimiter)
        .def_readwrite("test_fraction", &hmmpos::TaggerConfig::test_fraction)
        .def_readwrite("seed", &hmmpos::TaggerConfig::seed)
        .def_readwrite("num_threads", &hmmpos::TaggerConfig::num_threads)
        .def_readwrite("pass_through_unseen_emissions",
                       &hmmpos::TaggerConfig::pass_through_unseen_emissions)
        .def_readwrite("verbose", &hmmpos::TaggerConfig::verbose);

    // Immutable model, shared with every tagger built on it
    py::class_<hmmpos::HmmModel, std::shared_ptr<hmmpos::HmmModel>>(m, "HmmModel")
        .def_property_readonly("tags", &hmmpos::HmmModel::tags)
        .def("tag_count", &hmmpos::HmmModel::tag_count,
             "Get the number of tag states")
        .def("vocabulary_size", &hmmpos::HmmModel::vocabulary_size,
             "Get the size of the training vocabulary")
        .def("transition_count", &hmmpos::HmmModel::transition_count)
        .def("emission", &hmmpos::HmmModel::emission,
             "P(word | tag), or None when never observed",
             py::arg("tag"), py::arg("word"))
        .def("transition", &hmmpos::HmmModel::transition,
             "P(to | from), or None for an unseen pair",
             py::arg("from_state"), py::arg("to_state"))
        .def("replace_unknown", &hmmpos::HmmModel::replace_unknown,
             "Replace out-of-vocabulary words with the unknown token",
             py::arg("words"))
        .def("__repr__", [](const hmmpos::HmmModel& model) {
            return "<HmmModel: " + std::to_string(model.vocabulary_size()) +
                   " words, " + std::to_string(model.tag_count()) + " tags>";
        });

    py::class_<hmmpos::DecodeResult>(m, "DecodeResult")
        .def_readonly("tags", &hmmpos::DecodeResult::tags)
        .def_readonly("log_probability", &hmmpos::DecodeResult::log_probability);

    py::class_<hmmpos::EvaluationResult>(m, "EvaluationResult")
        .def_readonly("correct", &hmmpos::EvaluationResult::correct)
        .def_readonly("total", &hmmpos::EvaluationResult::total)
        .def_readonly("failed_sentences", &hmmpos::EvaluationResult::failed_sentences)
        .def("accuracy", &hmmpos::EvaluationResult::accuracy);

    py::class_<hmmpos::Tagger>(m, "Tagger")
        .def("tag", &hmmpos::Tagger::tag,
             "Tag a sentence (list of words) and return word-tag pairs",
             py::arg("words"))
        .def("tag_sequence", &hmmpos::Tagger::tag_sequence,
             "Tag a sentence and return only the tags",
             py::arg("words"))
        .def_property_readonly("name", &hmmpos::Tagger::name);

    py::class_<hmmpos::HmmTagger, hmmpos::Tagger>(m, "HmmTagger")
        .def(py::init([](std::shared_ptr<hmmpos::HmmModel> model) {
                 return hmmpos::HmmTagger(std::move(model));
             }),
             "Create a Viterbi tagger over a trained model",
             py::arg("model"))
        .def("decode", &hmmpos::HmmTagger::decode,
             "Decode a sentence and return tags with the path log-probability",
             py::arg("words"));

    py::class_<hmmpos::MostFrequentClassTagger, hmmpos::Tagger>(m, "MostFrequentClassTagger")
        .def(py::init<const hmmpos::Sequences&, const hmmpos::Sequences&, const hmmpos::TaggerConfig&>(),
             "Train the most-frequent-class baseline",
             py::arg("words"), py::arg("tags"), py::arg("config") = hmmpos::TaggerConfig());

    // Model construction and persistence
    m.def("build_model", [](const hmmpos::Sequences& words, const hmmpos::Sequences& tags,
                            const hmmpos::TaggerConfig& config) {
        return std::const_pointer_cast<hmmpos::HmmModel>(hmmpos::build_model(words, tags, config));
    }, "Count the training data and build a bigram HMM",
       py::arg("words"), py::arg("tags"), py::arg("config") = hmmpos::TaggerConfig());

    m.def("save_model", [](const hmmpos::HmmModel& model, const std::string& filename) {
        hmmpos::save_model(model, filename);
    }, "Save the trained model to a file", py::arg("model"), py::arg("filename"));

    m.def("load_model", [](const std::string& filename, const hmmpos::TaggerConfig& config) {
        return std::const_pointer_cast<hmmpos::HmmModel>(hmmpos::load_model(filename, config));
    }, "Load a trained model from a file",
       py::arg("filename"), py::arg("config") = hmmpos::TaggerConfig());

    m.def("evaluate", &hmmpos::evaluate,
          "Token accuracy of a tagger against gold tags",
          py::arg("tagger"), py::arg("words"), py::arg("tags"), py::arg("num_threads") = 1,
          py::call_guard<py::gil_scoped_release>());

    // Exception handling
    auto base = py::register_exception<hmmpos::HmmPosException>(m, "HmmPosException");
    py::register_exception<hmmpos::InconsistentCountsError>(m, "InconsistentCountsError", base);
    py::register_exception<hmmpos::MalformedSequenceError>(m, "MalformedSequenceError", base);
    py::register_exception<hmmpos::DecodingFailure>(m, "DecodingFailure", base);
    py::register_exception<hmmpos::CorpusFormatError>(m, "CorpusFormatError", base);
    py::register_exception<hmmpos::ModelFormatError>(m, "ModelFormatError", base);

    // Utility functions for data conversion
    m.def("read_corpus", [](const std::string& filename, const hmmpos::TaggerConfig& config) {
        hmmpos::Corpus corpus = hmmpos::read_corpus(filename, config);
        return py::make_tuple(corpus.words(), corpus.tags());
    }, "Read a word/TAG corpus file into parallel word and tag lists",
       py::arg("filename"), py::arg("config") = hmmpos::TaggerConfig());

    m.def("convert_nltk_corpus", [](const py::list& nltk_corpus) {
        hmmpos::Sequences words;
        hmmpos::Sequences tags;

        for (auto sentence : nltk_corpus) {
            hmmpos::Sequence sentence_words;
            hmmpos::Sequence sentence_tags;

            for (auto word_tag_pair : sentence) {
                auto pair = word_tag_pair.cast<py::tuple>();
                sentence_words.push_back(pair[0].cast<std::string>());
                sentence_tags.push_back(pair[1].cast<std::string>());
            }

            words.push_back(std::move(sentence_words));
            tags.push_back(std::move(sentence_tags));
        }

        return py::make_tuple(words, tags);
    }, "Convert NLTK tagged sentences to parallel word and tag lists", py::arg("nltk_corpus"));

    // Benchmark utility
    m.def("benchmark_tagging", [](const hmmpos::Tagger& tagger,
                                  const hmmpos::Sequences& test_sentences,
                                  int iterations) {
        auto start = std::chrono::high_resolution_clock::now();

        size_t failed = 0;
        for (int i = 0; i < iterations; ++i) {
            for (const auto& sentence : test_sentences) {
                try {
                    tagger.tag_sequence(sentence);
                } catch (const hmmpos::DecodingFailure&) {
                    ++failed;
                }
            }
        }

        auto end = std::chrono::high_resolution_clock::now();
        double elapsed = std::chrono::duration<double>(end - start).count();

        size_t total_tokens = 0;
        for (const auto& sentence : test_sentences) {
            total_tokens += sentence.size();
        }
        total_tokens *= iterations;

        return py::dict("total_time"_a=elapsed,
                        "tokens_per_second"_a=total_tokens / elapsed,
                        "sentences_per_second"_a=(test_sentences.size() * iterations) / elapsed,
                        "avg_time_per_sentence"_a=elapsed / (test_sentences.size() * iterations),
                        "failed_sentences"_a=failed);
    }, "Benchmark tagging performance",
       py::arg("tagger"), py::arg("test_sentences"), py::arg("iterations") = 100);
}
