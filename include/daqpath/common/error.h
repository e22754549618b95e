// =============================================================================
// daqpath - Error Handling
// =============================================================================
// Exceptions and result types shared by the pattern compressor, the driver
// boundary and the command-line tool.
//
// Every failure carries an ErrorCode that doubles as the process exit code:
// - 0: Success
// - 1: Usage error (no paths given, conflicting options)
// - 2: Invalid argument (empty or mixed-shape path list, bad configuration)
// - 3: I/O error (path list file not readable)
// - 4: Driver library could not be loaded
// - 5: Driver entry point not found
// - 6: Driver call returned an error code
//
// Configuration checks report through VoidResult (std::expected); everything
// else throws a DaqPathException subclass.
// =============================================================================

#ifndef DAQPATH_COMMON_ERROR_H
#define DAQPATH_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>

namespace daqpath {

// =============================================================================
// Error Codes
// =============================================================================

enum class ErrorCode : std::uint8_t {
    kSuccess = 0,
    kUsageError = 1,
    kInvalidArgument = 2,
    kIOError = 3,

    /// @brief dlopen() of the vendor library failed.
    kDriverUnavailable = 4,

    /// @brief The loaded library does not export a requested DAQmx function.
    kSymbolNotFound = 5,

    /// @brief A DAQmx function returned a negative status.
    kDriverError = 6
};

/// @brief Process exit code for an error code.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Category name used in what() ("[driver error] ...").
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kDriverUnavailable:
            return "driver unavailable";
        case ErrorCode::kSymbolNotFound:
            return "symbol not found";
        case ErrorCode::kDriverError:
            return "driver error";
    }
    return "unknown error";
}

// =============================================================================
// Exceptions
// =============================================================================

/// @brief Base class of every exception daqpath throws.
class DaqPathException : public std::exception {
public:
    DaqPathException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    /// @brief "[category] message".
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Message without the category prefix.
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

private:
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::string what_;
};

class UsageError : public DaqPathException {
public:
    explicit UsageError(std::string message)
        : DaqPathException(ErrorCode::kUsageError, std::move(message)) {}
};

/// @brief Precondition violation, e.g. an empty path list or a list mixing
///        bare tokens with slash-delimited paths.
class InvalidArgumentError : public DaqPathException {
public:
    explicit InvalidArgumentError(std::string message)
        : DaqPathException(ErrorCode::kInvalidArgument, std::move(message)) {}
};

class IOError : public DaqPathException {
public:
    explicit IOError(std::string message)
        : DaqPathException(ErrorCode::kIOError, std::move(message)) {}

    /// @brief Append the system error text to message.
    IOError(std::string message, std::error_code ec)
        : DaqPathException(ErrorCode::kIOError, withSystemError(message, ec)),
          systemError_(ec) {}

    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string withSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

class DriverUnavailableError : public DaqPathException {
public:
    explicit DriverUnavailableError(std::string message)
        : DaqPathException(ErrorCode::kDriverUnavailable, std::move(message)) {}
};

class SymbolNotFoundError : public DaqPathException {
public:
    explicit SymbolNotFoundError(std::string symbol)
        : DaqPathException(ErrorCode::kSymbolNotFound,
                           "driver entry point not found: " + symbol),
          symbol_(std::move(symbol)) {}

    /// @brief Exported name that could not be resolved.
    [[nodiscard]] const std::string& symbol() const noexcept { return symbol_; }

private:
    std::string symbol_;
};

/// @brief A driver function returned a negative status.
/// @note Keeps the function name and raw status so callers can react to
///       specific driver conditions.
class DriverError : public DaqPathException {
public:
    /// @param function Full driver function name (e.g. "DAQmxStartTask").
    /// @param returnCode Negative status returned by the driver.
    /// @param text Error text resolved from the driver.
    DriverError(std::string function, std::int32_t returnCode, std::string_view text)
        : DaqPathException(ErrorCode::kDriverError, describe(function, returnCode, text)),
          function_(std::move(function)),
          returnCode_(returnCode) {}

    [[nodiscard]] const std::string& function() const noexcept { return function_; }

    [[nodiscard]] std::int32_t returnCode() const noexcept { return returnCode_; }

private:
    static std::string describe(std::string_view function, std::int32_t returnCode,
                                std::string_view text);

    std::string function_;
    std::int32_t returnCode_;
};

// =============================================================================
// Result Type
// =============================================================================

/// @brief Error half of a Result.
class Error {
public:
    Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Throw the exception type matching code().
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

template <typename T>
using Result = std::expected<T, Error>;

/// @brief Outcome of a check that produces no value.
using VoidResult = Result<std::monostate>;

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Throw the matching exception if result holds an error.
inline void unwrapOrThrow(const VoidResult& result) {
    if (!result) {
        result.error().throwException();
    }
}

}  // namespace daqpath

#endif  // DAQPATH_COMMON_ERROR_H
