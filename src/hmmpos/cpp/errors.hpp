#pragma once

#include <exception>
#include <string>

namespace hmmpos {

// Base class for all hmmpos errors
class HmmPosException : public std::exception {
public:
    explicit HmmPosException(const std::string& message) : message_(message) {}
    const char* what() const noexcept override { return message_.c_str(); }

private:
    std::string message_;
};

// Frequency tables reference tags that have no unigram/emission counts.
// Raised while building a model; no model is produced.
class InconsistentCountsError : public HmmPosException {
public:
    explicit InconsistentCountsError(const std::string& message)
        : HmmPosException("inconsistent counts: " + message) {}
};

// Paired word/tag sequences differ in count or length, or a sequence is empty
class MalformedSequenceError : public HmmPosException {
public:
    explicit MalformedSequenceError(const std::string& message)
        : HmmPosException("malformed sequence: " + message) {}
};

/**
 * No tag path with non-zero probability reaches the end state.
 *
 * Recoverable: scoped to the one sentence being decoded, the model is
 * left untouched.
 */
class DecodingFailure : public HmmPosException {
public:
    explicit DecodingFailure(const std::string& message)
        : HmmPosException("decoding failed: " + message) {}
};

class CorpusFormatError : public HmmPosException {
public:
    CorpusFormatError(const std::string& message, size_t line)
        : HmmPosException("corpus line " + std::to_string(line) + ": " + message),
          line_(line) {}

    size_t line() const { return line_; }

private:
    size_t line_;
};

class ModelFormatError : public HmmPosException {
public:
    explicit ModelFormatError(const std::string& message)
        : HmmPosException("model file: " + message) {}
};

} // namespace hmmpos
