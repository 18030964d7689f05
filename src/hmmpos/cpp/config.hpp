#pragma once

#include <string>

namespace hmmpos {

/**
 * Tagger configuration
 *
 * Plain value type shared by the corpus reader, the model builder, the
 * taggers and the command-line driver.
 */
struct TaggerConfig {
    static constexpr const char* UNKNOWN_TOKEN = "nan";
    static constexpr const char* MISSING_TAG = "<MISSING>";
    static constexpr char DELIMITER = '/';
    static constexpr double TEST_FRACTION = 0.2;
    static constexpr unsigned int SEED = 12345;

    // Placeholder substituted for out-of-vocabulary words before decoding
    std::string unknown_token = UNKNOWN_TOKEN;

    // Tag the baseline tagger assigns to words never seen in training
    std::string missing_tag = MISSING_TAG;

    // Separator between word and tag in corpus tokens ("dog/NOUN")
    char delimiter = DELIMITER;

    double test_fraction = TEST_FRACTION;
    unsigned int seed = SEED;

    // Threads used by evaluate(); 1 runs serially
    int num_threads = 1;

    // When true, any (word, tag) pair without an emission probability is
    // scored as probability 1 instead of only the unknown token.
    bool pass_through_unseen_emissions = false;

    // Progress messages on stdout
    bool verbose = false;
};

} // namespace hmmpos
