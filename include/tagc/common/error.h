// =============================================================================
// tag-counter - Error Handling Framework
// =============================================================================
// Error codes and exception hierarchy for the tag-counter library.
//
// This module provides:
// - ErrorCode enum matching CLI exit codes
// - TagcException hierarchy for structured error handling
// - Error context (file, line, record) for diagnostics
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/argument error
// - 2: I/O error (file not found, read/write failure)
// - 3: Format error (malformed FASTQ, unparseable sample name)
// - 4: Configuration error (invalid barcode reference or primer context)
// =============================================================================

#ifndef TAGC_COMMON_ERROR_H
#define TAGC_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace tagc {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes matching CLI exit codes.
/// @note These values are used as process exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage or argument error.
    /// @note Missing required options, invalid option values.
    kUsageError = 1,

    /// @brief I/O error.
    /// @note File not found, read/write failure, permission denied, etc.
    kIOError = 2,

    /// @brief Input format error.
    /// @note Malformed FASTQ record, read collection without a sample token.
    kFormatError = 3,

    /// @brief Configuration error.
    /// @note Barcode reference or primer context cannot be trusted.
    kConfigError = 4
};

/// @brief Convert ErrorCode to its integer exit code value.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kFormatError:
            return "format error";
        case ErrorCode::kConfigError:
            return "configuration error";
    }
    return "unknown error";
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
struct ErrorContext {
    /// @brief File path associated with the error (if applicable).
    std::string filePath;

    /// @brief Line number (1-based) where the error occurred (if applicable).
    std::optional<std::uint64_t> lineNumber;

    /// @brief Record number (1-based) where the error occurred (if applicable).
    std::optional<std::uint64_t> recordNumber;

    /// @brief Source location where the error was created.
    std::source_location location;

    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    explicit ErrorContext(std::string path,
                          std::source_location loc = std::source_location::current())
        : filePath(std::move(path)), location(loc) {}

    ErrorContext& withLine(std::uint64_t line) {
        lineNumber = line;
        return *this;
    }

    ErrorContext& withRecord(std::uint64_t record) {
        recordNumber = record;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all tag-counter errors.
/// @note Provides error code, message, and optional context.
class TagcException : public std::exception {
public:
    TagcException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    TagcException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~TagcException() override = default;

    TagcException(const TagcException&) = default;
    TagcException(TagcException&&) noexcept = default;
    TagcException& operator=(const TagcException&) = default;
    TagcException& operator=(TagcException&&) noexcept = default;

    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the exit code for this error.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the error context.
    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

protected:
    /// @brief Format the what() string from message and context.
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for usage and argument errors (exit code 1).
class UsageError : public TagcException {
public:
    explicit UsageError(std::string message)
        : TagcException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : TagcException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for I/O errors (exit code 2).
/// @note Thrown for file not found, read/write failures, permission denied,
///       corrupted gzip input, etc.
class IOError : public TagcException {
public:
    explicit IOError(std::string message)
        : TagcException(ErrorCode::kIOError, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : TagcException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    /// @brief Construct from system error code.
    IOError(std::string message, std::error_code ec)
        : TagcException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    /// @brief Get the system error code (if available).
    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

/// @brief Exception for input format errors (exit code 3).
class FormatError : public TagcException {
public:
    explicit FormatError(std::string message)
        : TagcException(ErrorCode::kFormatError, std::move(message)) {}

    FormatError(std::string message, ErrorContext context)
        : TagcException(ErrorCode::kFormatError, std::move(message), std::move(context)) {}
};

/// @brief Exception for configuration errors (exit code 4).
/// @note Thrown when the barcode reference or the primer context is invalid;
///       the run must not proceed.
class ConfigError : public TagcException {
public:
    explicit ConfigError(std::string message)
        : TagcException(ErrorCode::kConfigError, std::move(message)) {}

    ConfigError(std::string message, ErrorContext context)
        : TagcException(ErrorCode::kConfigError, std::move(message), std::move(context)) {}
};

}  // namespace tagc

#endif  // TAGC_COMMON_ERROR_H
