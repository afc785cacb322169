#pragma once

#include <stdexcept>
#include <string>

namespace volvelle {

/**
 * Structured error reporting for the lattice engine.
 *
 * Only lattice-load failures and request-shape violations surface as
 * exceptions. Parse and validation problems travel inside reports.
 */

enum class ErrorCode {
    // General errors
    INVALID_ARGUMENT = 1,

    // Lattice dataset errors
    LATTICE_PARSE_FAILED = 100,
    LATTICE_DUPLICATE_WINDOW = 101,
    LATTICE_WINDOW_RANGE = 102,
    LATTICE_OFFSET_RANGE = 103,
    LATTICE_INCONSISTENT_VOCABULARY = 104,

    // Request errors
    INVALID_REQUEST = 200,

    // Configuration errors
    CONFIG_INVALID = 300,

    // I/O errors
    FILE_NOT_FOUND = 400
};

class VolvelleException : public std::runtime_error {
public:
    explicit VolvelleException(ErrorCode code, const std::string& message,
                               const std::string& context = "",
                               const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "Volvelle error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string context_;
    std::string suggestion_;
};

// Convenience exception types
class InvalidArgumentError : public VolvelleException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : VolvelleException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

class LatticeLoadError : public VolvelleException {
public:
    explicit LatticeLoadError(ErrorCode code,
                              const std::string& message,
                              const std::string& context = "",
                              const std::string& suggestion = "")
        : VolvelleException(code, message, context, suggestion) {}

    explicit LatticeLoadError(const std::string& message,
                              const std::string& context = "")
        : VolvelleException(ErrorCode::LATTICE_PARSE_FAILED, message, context,
                            "Regenerate the lattice artifact and check its schema") {}
};

class RequestError : public VolvelleException {
public:
    explicit RequestError(const std::string& message,
                          const std::string& context = "",
                          const std::string& suggestion = "")
        : VolvelleException(ErrorCode::INVALID_REQUEST, message, context, suggestion) {}
};

class ConfigError : public VolvelleException {
public:
    explicit ConfigError(const std::string& message,
                         const std::string& context = "",
                         const std::string& suggestion = "")
        : VolvelleException(ErrorCode::CONFIG_INVALID, message, context, suggestion) {}
};

class IOError : public VolvelleException {
public:
    explicit IOError(const std::string& message,
                     const std::string& context = "",
                     const std::string& suggestion = "")
        : VolvelleException(ErrorCode::FILE_NOT_FOUND, message, context, suggestion) {}
};

// Request-shape check
#define VOLVELLE_CHECK_REQUEST(condition, message) \
    do { if (!(condition)) throw volvelle::RequestError(message, __func__); } while (0)

} // namespace volvelle
