#ifndef EXCEPTIONS_HPP
#define EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

namespace citerate {

/**
 * @brief Base class for all errors raised by the citation rate library.
 *
 * Every exception records the function that raised it so that messages
 * logged far from the throw site still point at the origin.
 */
class ModelException : public std::runtime_error {
public:
    ModelException(const std::string& source, const std::string& message)
        : std::runtime_error(source + ": " + message),
          source_(source),
          message_(message) {}

    const std::string& getSource() const { return source_; }
    const std::string& getMessage() const { return message_; }

private:
    std::string source_;
    std::string message_;
};

/**
 * @brief Caller misconfiguration: a variance, pseudocount or grid setting
 * outside its admissible domain.
 */
class InvalidParameterException : public ModelException {
public:
    using ModelException::ModelException;
};

/**
 * @brief Input document does not have the expected shape
 * (missing title, malformed year key, unparsable timestamp, ...).
 */
class DataFormatException : public ModelException {
public:
    using ModelException::ModelException;
};

/**
 * @brief A recursion produced a value that cannot be valid, e.g. a
 * negative smoothed variance or a non-finite log-likelihood.
 */
class NumericalException : public ModelException {
public:
    using ModelException::ModelException;
};

/**
 * @brief Input could not be read or output could not be written.
 */
class FileIOException : public ModelException {
public:
    using ModelException::ModelException;
};

} // namespace citerate

#define THROW_INVALID_PARAM(source, msg) \
    throw ::citerate::InvalidParameterException((source), (msg))

#define THROW_DATA_FORMAT(source, msg) \
    throw ::citerate::DataFormatException((source), (msg))

#define THROW_NUMERICAL(source, msg) \
    throw ::citerate::NumericalException((source), (msg))

#endif // EXCEPTIONS_HPP
