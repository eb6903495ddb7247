#pragma once
#include <stdexcept>
#include <string>

namespace Glimpse {

enum class ErrorType {
    None,
    BrowserStart,
    Navigation,
    NavigationTimeout,
    ScriptEvaluation,
    Capture,
    Persistence
};

const char* to_string(ErrorType type);

class Error : public std::runtime_error {
public:
    Error(ErrorType type, const std::string& message) : std::runtime_error(message), type_(type) {
    }

    ErrorType type() const {
        return type_;
    }

private:
    ErrorType type_;
};

// Browser executable or DevTools endpoint could not be brought up.
class BrowserStartError : public Error {
public:
    explicit BrowserStartError(const std::string& message)
        : Error(ErrorType::BrowserStart, message) {
    }
};

// Malformed URL, DNS or connection failure.
class NavigationError : public Error {
public:
    explicit NavigationError(const std::string& message) : Error(ErrorType::Navigation, message) {
    }
};

class NavigationTimeoutError : public Error {
public:
    explicit NavigationTimeoutError(const std::string& message)
        : Error(ErrorType::NavigationTimeout, message) {
    }
};

// Raised by the driver when an in-page script throws or returns nothing usable.
class ScriptEvaluationError : public Error {
public:
    explicit ScriptEvaluationError(const std::string& message)
        : Error(ErrorType::ScriptEvaluation, message) {
    }
};

class CaptureError : public Error {
public:
    explicit CaptureError(const std::string& message) : Error(ErrorType::Capture, message) {
    }
};

class PersistenceError : public Error {
public:
    explicit PersistenceError(const std::string& message)
        : Error(ErrorType::Persistence, message) {
    }
};

}  // namespace Glimpse
