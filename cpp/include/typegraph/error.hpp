#pragma once

#include <stdexcept>
#include <string>

namespace typegraph {

/**
 * Structured error reporting for the catalog materialization layer.
 *
 * Two families matter to callers:
 *  - DataError: a persisted value could not be turned into a typed value
 *    (type mismatch, malformed property, missing edge, mapper failure).
 *    The materializer converts these into an absent result.
 *  - SchemaError: the type registry or naming policy is inconsistent.
 *    These are never swallowed.
 */

enum class ErrorCode {
    // General errors
    INVALID_ARGUMENT = 1,

    // Type system errors
    TYPE_NOT_FOUND = 100,
    CONVERSION_FAILED = 101,
    UNSUPPORTED_CATEGORY = 102,

    // Repository errors
    REPOSITORY_ERROR = 200,
    MAPPING_FAILED = 201,
    NAMING_FAILED = 202,

    // Database errors
    CONNECTION_FAILED = 300,
    QUERY_FAILED = 301,

    // Internal errors
    INTERNAL_ERROR = 500
};

class TypegraphException : public std::runtime_error {
public:
    explicit TypegraphException(ErrorCode code, const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , message_(message)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "Typegraph error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string message_;
    std::string context_;
    std::string suggestion_;
};

class InvalidArgumentError : public TypegraphException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : TypegraphException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

// =============================================================================
// Recoverable data errors
// =============================================================================

class DataError : public TypegraphException {
public:
    using TypegraphException::TypegraphException;
};

class ConversionError : public DataError {
public:
    explicit ConversionError(const std::string& message,
                             const std::string& context = "",
                             const std::string& suggestion = "")
        : DataError(ErrorCode::CONVERSION_FAILED, message, context, suggestion) {}
};

class MappingError : public DataError {
public:
    explicit MappingError(const std::string& message,
                          const std::string& context = "",
                          const std::string& suggestion = "")
        : DataError(ErrorCode::MAPPING_FAILED, message, context, suggestion) {}
};

class TypeNotFoundError : public DataError {
public:
    explicit TypeNotFoundError(const std::string& type_name,
                               const std::string& context = "")
        : DataError(ErrorCode::TYPE_NOT_FOUND, "Unknown type: " + type_name, context,
                    "Define the type in the TypeRegistry before use") {}
};

// Failure reported by the persistence layer (naming lookups, graph reads).
class RepositoryError : public DataError {
public:
    explicit RepositoryError(const std::string& message,
                             const std::string& context = "",
                             const std::string& suggestion = "")
        : DataError(ErrorCode::REPOSITORY_ERROR, message, context, suggestion) {}
};

class DatabaseError : public DataError {
public:
    explicit DatabaseError(const std::string& message,
                           const std::string& context = "",
                           const std::string& suggestion = "",
                           ErrorCode code = ErrorCode::QUERY_FAILED)
        : DataError(code, message, context, suggestion) {}
};

// =============================================================================
// Unchecked schema / programming errors
// =============================================================================

class SchemaError : public TypegraphException {
public:
    using TypegraphException::TypegraphException;
};

class UnsupportedCategoryError : public SchemaError {
public:
    explicit UnsupportedCategoryError(const std::string& message,
                                      const std::string& context = "")
        : SchemaError(ErrorCode::UNSUPPORTED_CATEGORY, message, context,
                      "The type registry produced a category outside the closed set") {}
};

// A naming lookup failed; the persistence layer is unusable for this type.
class NamingError : public SchemaError {
public:
    explicit NamingError(const RepositoryError& cause, const std::string& context = "")
        : SchemaError(ErrorCode::NAMING_FAILED, cause.message(), context, cause.suggestion()) {}
};

// Error handling utilities
class ErrorHandler {
public:
    static void check_condition(bool condition, ErrorCode code,
                                const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "") {
        if (!condition) {
            throw TypegraphException(code, message, context, suggestion);
        }
    }

    static void check_argument(bool condition, const std::string& message,
                               const std::string& context = "") {
        if (!condition) {
            throw InvalidArgumentError(message, context);
        }
    }

    static void check_pointer(const void* ptr, const std::string& name,
                              const std::string& context = "") {
        if (!ptr) {
            throw InvalidArgumentError("Null pointer: " + name, context);
        }
    }
};

// Macros for common error checking
#define TYPEGRAPH_CHECK(condition, code, message) \
    typegraph::ErrorHandler::check_condition(condition, code, message, __func__)

#define TYPEGRAPH_CHECK_ARGUMENT(condition, message) \
    typegraph::ErrorHandler::check_argument(condition, message, __func__)

#define TYPEGRAPH_CHECK_POINTER(ptr, name) \
    typegraph::ErrorHandler::check_pointer(ptr, name, __func__)

#define TYPEGRAPH_THROW(code, message) \
    throw typegraph::TypegraphException(code, message, __func__)

#define TYPEGRAPH_THROW_INVALID_ARG(message) \
    throw typegraph::InvalidArgumentError(message, __func__)

} // namespace typegraph
