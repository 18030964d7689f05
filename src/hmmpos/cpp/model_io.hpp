#pragma once

#include <istream>
#include <memory>
#include <ostream>
#include <string>

#include "config.hpp"
#include "hmm_model.hpp"

namespace hmmpos {

/**
 * Text persistence of a trained model
 *
 * The frequency tables are written rather than the probabilities; loading
 * rebuilds the model with build_model(), so a loaded model passes the same
 * consistency checks as a freshly trained one. The file is line oriented:
 *
 *   HMMPOS_Model_v1
 *   sentences <n>
 *   unigram <k>    followed by k lines "tag count"
 *   bigram <k>     followed by k lines "tag tag count"
 *   emission <k>   followed by k lines "tag word count"
 *   start <k>      followed by k lines "tag count"
 *   end <k>        followed by k lines "tag count"
 *
 * Throws ModelFormatError on I/O failure, malformed content, or a tag or
 * word containing whitespace.
 */
void write_model(const HmmModel& model, std::ostream& out);
void save_model(const HmmModel& model, const std::string& filename);

std::shared_ptr<const HmmModel> read_model(std::istream& in, const TaggerConfig& config = TaggerConfig());
std::shared_ptr<const HmmModel> load_model(const std::string& filename,
                                           const TaggerConfig& config = TaggerConfig());

} // namespace hmmpos
