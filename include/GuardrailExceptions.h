#ifndef GUARDRAIL_EXCEPTIONS_H
#define GUARDRAIL_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Guardrail {

class GuardrailException : public std::runtime_error {
public:
    explicit GuardrailException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public GuardrailException {
public:
    explicit IOException(const std::string& message) : GuardrailException("IO Error: " + message) {}
};

class DatasetException : public GuardrailException {
public:
    explicit DatasetException(const std::string& message) : GuardrailException("Dataset Error: " + message) {}
};

class InvalidTableException : public GuardrailException {
public:
    explicit InvalidTableException(const std::string& message) : GuardrailException("Invalid Table: " + message) {}
};

class ConfigurationException : public GuardrailException {
public:
    explicit ConfigurationException(const std::string& message) : GuardrailException("Configuration Error: " + message) {}
};

class CancelledException : public GuardrailException {
public:
    explicit CancelledException(const std::string& message) : GuardrailException("Cancelled: " + message) {}
};

} // namespace Guardrail

#endif // GUARDRAIL_EXCEPTIONS_H
