/**
 * Errors raised by the community detection library.
 */
#ifndef MLL_EXCEPTIONS_HPP
#define MLL_EXCEPTIONS_HPP

#include <exception>
#include <sstream>
#include <string>

/// Raised when the requested model, or another configuration value, is not recognized.
class ConfigurationError: public std::exception {
public:
    explicit ConfigurationError(const std::string &message) {
        this->message = "Configuration error: " + message;
    }
    const char* what() const noexcept override {
        return this->message.c_str();
    }
private:
    std::string message;
};

/// Raised when an input (graph, partition or parameter) violates its domain.
class ValidationError: public std::exception {
public:
    explicit ValidationError(const std::string &message) {
        this->message = "Validation error: " + message;
    }
    ValidationError(const std::string &name, double value, const std::string &domain) {
        std::ostringstream message_stream;
        message_stream << "Validation error: " << name << " = " << value << " is outside of " << domain;
        this->message = message_stream.str();
    }
    const char* what() const noexcept override {
        return this->message.c_str();
    }
private:
    std::string message;
};

/// Raised when the numeric minimizer fails to produce a finite improvement. Carries the last valid estimate so that
/// the caller can fall back to it.
class OptimizationError: public std::exception {
public:
    OptimizationError(const std::string &message, double last_valid) {
        std::ostringstream message_stream;
        message_stream << "Optimization error: " << message << " (last valid estimate = " << last_valid << ")";
        this->message = message_stream.str();
        this->_last_valid = last_valid;
    }
    const char* what() const noexcept override {
        return this->message.c_str();
    }
    double last_valid() const { return this->_last_valid; }
private:
    std::string message;
    double _last_valid;
};

#endif // MLL_EXCEPTIONS_HPP
