// =============================================================================
// daqpath - Error Handling Implementation
// =============================================================================

#include "daqpath/common/error.h"

#include <format>

namespace daqpath {

void DaqPathException::formatWhat() {
    what_ = std::format("[{}] {}", errorCodeToString(code_), message_);
}

std::string IOError::withSystemError(const std::string& message, std::error_code ec) {
    return std::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

std::string DriverError::describe(std::string_view function, std::int32_t returnCode,
                                  std::string_view text) {
    return std::format("{} failed with error {}: {}", function, returnCode, text);
}

void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_);
        case ErrorCode::kInvalidArgument:
            throw InvalidArgumentError(message_);
        case ErrorCode::kIOError:
            throw IOError(message_);
        case ErrorCode::kDriverUnavailable:
            throw DriverUnavailableError(message_);
        case ErrorCode::kSuccess:
        case ErrorCode::kSymbolNotFound:
        case ErrorCode::kDriverError:
            // No symbol name or return code to rebuild the specific type from
            break;
    }
    throw DaqPathException(code_, message_);
}

}  // namespace daqpath
