#ifndef TABULA_EXCEPTIONS_H
#define TABULA_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Tabula {

class TabulaException : public std::runtime_error {
public:
    explicit TabulaException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public TabulaException {
public:
    explicit IOException(const std::string& message) : TabulaException("IO Error: " + message) {}
};

class DatasetException : public TabulaException {
public:
    explicit DatasetException(const std::string& message) : TabulaException("Dataset Error: " + message) {}
};

// Raised by analysis when the dataset has no records.
class EmptyDatasetException : public DatasetException {
public:
    EmptyDatasetException() : DatasetException("dataset contains no records") {}
};

class ConfigurationException : public TabulaException {
public:
    explicit ConfigurationException(const std::string& message) : TabulaException("Configuration Error: " + message) {}
};

// Unrecognized operator method string (missing value / encoding / normalization).
class InvalidOptionException : public ConfigurationException {
public:
    InvalidOptionException(const std::string& option, const std::string& value)
        : ConfigurationException("Invalid value for " + option + ": '" + value + "'"),
          option_(option),
          value_(value) {}

    const std::string& option() const noexcept { return option_; }
    const std::string& value() const noexcept { return value_; }

private:
    std::string option_;
    std::string value_;
};

} // namespace Tabula

#endif // TABULA_EXCEPTIONS_H
