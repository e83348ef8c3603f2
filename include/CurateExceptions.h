#ifndef CURATE_EXCEPTIONS_H
#define CURATE_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Curate {

class CurateException : public std::runtime_error {
public:
    explicit CurateException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public CurateException {
public:
    explicit IOException(const std::string& message) : CurateException("IO Error: " + message) {}
};

class ConfigurationException : public CurateException {
public:
    explicit ConfigurationException(const std::string& message) : CurateException("Configuration Error: " + message) {}
};

// Raised when skip/header indices or the row layout cannot yield a table.
class StructuralException : public CurateException {
public:
    explicit StructuralException(const std::string& message) : CurateException("Structure Error: " + message) {}
};

class DatasetException : public CurateException {
public:
    explicit DatasetException(const std::string& message) : CurateException("Dataset Error: " + message) {}
};

} // namespace Curate

#endif // CURATE_EXCEPTIONS_H
