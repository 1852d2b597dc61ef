#pragma once

#include <stdexcept>
#include <string>

namespace engram {

/**
 * Structured error reporting for the memory engine.
 * Every exception carries a code, the function it was raised in and,
 * where one exists, a recovery suggestion.
 */

enum class ErrorCode {
    INVALID_ARGUMENT = 1,

    // Backend errors
    BACKEND_UNAVAILABLE = 100,
    COLLECTION_NOT_FOUND = 101,
    BACKEND_PROTOCOL = 102,

    // Configuration errors
    CONFIG_INVALID = 300,

    // Flow control
    OPERATION_CANCELLED = 400
};

class EngramException : public std::runtime_error {
public:
    explicit EngramException(ErrorCode code, const std::string& message,
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
        std::string result = "Engram error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
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

class InvalidArgumentError : public EngramException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : EngramException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

// Transport failure, timeout or non-2xx answer other than 404.
class BackendUnavailableError : public EngramException {
public:
    explicit BackendUnavailableError(const std::string& message,
                                     const std::string& context = "",
                                     const std::string& suggestion = "")
        : EngramException(ErrorCode::BACKEND_UNAVAILABLE, message, context, suggestion) {}
};

class CollectionNotFoundError : public EngramException {
public:
    explicit CollectionNotFoundError(const std::string& collection,
                                     const std::string& context = "")
        : EngramException(ErrorCode::COLLECTION_NOT_FOUND,
                          "Collection not found: " + collection, context,
                          "Create the collection or call initialize() first")
        , collection_(collection) {}

    const std::string& collection() const noexcept { return collection_; }

private:
    std::string collection_;
};

class OperationCancelledError : public EngramException {
public:
    explicit OperationCancelledError(const std::string& context = "")
        : EngramException(ErrorCode::OPERATION_CANCELLED, "Operation cancelled", context) {}
};

class ConfigError : public EngramException {
public:
    explicit ConfigError(const std::string& message,
                         const std::string& context = "",
                         const std::string& suggestion = "")
        : EngramException(ErrorCode::CONFIG_INVALID, message, context, suggestion) {}
};

class ErrorHandler {
public:
    static void check_argument(bool condition, const std::string& message,
                               const std::string& context = "") {
        if (!condition) {
            throw InvalidArgumentError(message, context);
        }
    }
};

#define ENGRAM_CHECK_ARGUMENT(condition, message) \
    engram::ErrorHandler::check_argument(condition, message, __func__)

} // namespace engram
