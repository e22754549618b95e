// =============================================================================
// daqpath - NI-DAQmx Driver Boundary Implementation
// =============================================================================

#include "daqpath/driver/driver.h"

#include <algorithm>
#include <format>
#include <utility>
#include <vector>

#include "daqpath/common/logger.h"

namespace daqpath::driver {

namespace {

using ExtendedErrorInfoFunction = ReturnCode (*)(char*, uInt32);
using ErrorStringFunction = ReturnCode (*)(ReturnCode, char*, uInt32);

constexpr std::string_view kExtendedErrorInfo = "GetExtendedErrorInfo";
constexpr std::string_view kErrorString = "GetErrorString";
constexpr std::string_view kMajorVersion = "GetSysNIDAQMajorVersion";
constexpr std::string_view kMinorVersion = "GetSysNIDAQMinorVersion";

}  // namespace

// =============================================================================
// DriverConfig / DriverVersion Implementation
// =============================================================================

VoidResult DriverConfig::validate() const {
    if (libraryPath.empty()) {
        return makeVoidError(ErrorCode::kInvalidArgument, "Driver library path must not be empty");
    }

    if (errorBufferSize == 0) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             "Error buffer size must be greater than zero");
    }

    if (maxErrorBufferSize < errorBufferSize) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             std::format("Maximum error buffer size {} is below the initial size {}",
                                         maxErrorBufferSize, errorBufferSize));
    }

    return {};
}

std::string DriverVersion::toString() const {
    return std::format("{}.{}", major, minor);
}

// =============================================================================
// Driver Implementation
// =============================================================================

Driver::Driver(std::shared_ptr<const SymbolResolver> resolver, DriverConfig config)
    : resolver_(std::move(resolver)), config_(std::move(config)) {
    if (!resolver_) {
        throw InvalidArgumentError("Driver requires a symbol resolver");
    }
    unwrapOrThrow(config_.validate());
}

Driver Driver::load(DriverConfig config) {
    unwrapOrThrow(config.validate());
    auto library = std::make_shared<const DriverLibrary>(config.libraryPath);
    DAQPATH_LOG_INFO("Using NI-DAQmx driver from {}", library->path());
    return Driver(std::move(library), std::move(config));
}

std::string Driver::qualifiedName(std::string_view name) const {
    std::string result = config_.functionPrefix;
    result += name;
    return result;
}

void* Driver::lookup(const std::string& symbol) const {
    void* address = resolver_->resolve(symbol);
    if (address == nullptr) {
        throw SymbolNotFoundError(symbol);
    }
    return address;
}

ReturnCode Driver::check(ReturnCode code, std::string_view function) const {
    if (code == kSuccess) {
        return code;
    }

    const std::string text = errorText(code);
    if (code < 0) {
        throw DriverError(std::string(function), code, text);
    }

    DAQPATH_LOG_WARNING("{} warning {}: {}", function, code, text);
    return code;
}

template <typename Fetch>
std::optional<std::string> Driver::fetchString(Fetch&& fetch) const {
    uInt32 size = config_.errorBufferSize;
    while (true) {
        std::vector<char> buffer(size, '\0');
        const ReturnCode status = fetch(buffer.data(), size);
        if (status == kSuccess) {
            auto end = std::find(buffer.begin(), buffer.end(), '\0');
            return std::string(buffer.begin(), end);
        }

        if (status != kErrorBufferTooSmallForString ||
            size > config_.maxErrorBufferSize / 2) {
            DAQPATH_LOG_DEBUG("Driver string unavailable (status {}, buffer {})", status, size);
            return std::nullopt;
        }
        size *= 2;
    }
}

std::string Driver::errorString(ReturnCode code) const {
    auto function =
        reinterpret_cast<ErrorStringFunction>(resolver_->resolve(qualifiedName(kErrorString)));
    if (function != nullptr) {
        auto text = fetchString(
            [function, code](char* buffer, uInt32 size) { return function(code, buffer, size); });
        if (text && !text->empty()) {
            return std::move(*text);
        }
    }
    return std::format("unknown driver error {}", code);
}

std::string Driver::errorText(ReturnCode code) const {
    auto function = reinterpret_cast<ExtendedErrorInfoFunction>(
        resolver_->resolve(qualifiedName(kExtendedErrorInfo)));
    if (function != nullptr) {
        auto text = fetchString(function);
        if (text && !text->empty()) {
            return std::move(*text);
        }
    }
    return errorString(code);
}

DriverVersion Driver::version() const {
    DriverVersion result;
    call(kMajorVersion, &result.major);
    call(kMinorVersion, &result.minor);
    return result;
}

}  // namespace daqpath::driver
