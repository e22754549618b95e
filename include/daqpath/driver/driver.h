// =============================================================================
// daqpath - NI-DAQmx Driver Boundary
// =============================================================================
// Calls driver entry points by name and translates their int32 status codes.
//
// Every NI-DAQmx function returns an int32:
// - 0: success
// - < 0: error, reported as DriverError with the text the driver gives for it
// - > 0: warning, logged and returned to the caller
//
// Usage:
// @code
// auto driver = Driver::load();
// uInt32 major = 0;
// driver.call("GetSysNIDAQMajorVersion", &major);
// @endcode
// =============================================================================

#ifndef DAQPATH_DRIVER_DRIVER_H
#define DAQPATH_DRIVER_DRIVER_H

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "daqpath/common/error.h"
#include "daqpath/driver/driver_library.h"

namespace daqpath::driver {

// =============================================================================
// Driver C Types
// =============================================================================

using int32 = std::int32_t;
using uInt32 = std::uint32_t;

/// @brief Status code returned by every driver entry point.
using ReturnCode = int32;

// =============================================================================
// Constants
// =============================================================================

/// @brief Status code for a successful call.
inline constexpr ReturnCode kSuccess = 0;

/// @brief Driver status for a string buffer that is too small.
inline constexpr ReturnCode kErrorBufferTooSmallForString = -200228;

/// @brief Initial size of the buffer used to fetch driver strings.
inline constexpr uInt32 kDefaultErrorBufferSize = 3000;

/// @brief Largest string buffer the driver is offered.
inline constexpr uInt32 kMaxErrorBufferSize = 1000000;

/// @brief Library opened by Driver::load() when no path is configured.
inline constexpr std::string_view kDefaultLibraryName = "libnidaqmx.so";

/// @brief Prefix prepended to every entry point name.
inline constexpr std::string_view kDefaultFunctionPrefix = "DAQmx";

// =============================================================================
// Configuration
// =============================================================================

/// @brief Driver boundary configuration.
struct DriverConfig {
    /// @brief Shared library to open.
    std::string libraryPath = std::string(kDefaultLibraryName);

    /// @brief Prefix added to names passed to Driver::call().
    std::string functionPrefix = std::string(kDefaultFunctionPrefix);

    /// @brief Initial string buffer size; doubled while the driver reports
    ///        kErrorBufferTooSmallForString.
    uInt32 errorBufferSize = kDefaultErrorBufferSize;

    /// @brief Upper bound for the string buffer size.
    uInt32 maxErrorBufferSize = kMaxErrorBufferSize;

    /// @brief Validate configuration.
    [[nodiscard]] VoidResult validate() const;
};

/// @brief Installed NI-DAQmx version.
struct DriverVersion {
    uInt32 major = 0;
    uInt32 minor = 0;

    /// @brief "major.minor".
    [[nodiscard]] std::string toString() const;
};

// =============================================================================
// Driver Class
// =============================================================================

/// @brief Typed access to the driver's exported entry points.
///
/// Entry points are resolved on every call, so a Driver stays cheap to copy
/// and needs no knowledge of the full driver API. The argument types passed to
/// invoke() and call() must match the C prototype exactly.
class Driver {
public:
    /// @brief Construct over a symbol resolver.
    /// @throws InvalidArgumentError if config is invalid or resolver is null.
    explicit Driver(std::shared_ptr<const SymbolResolver> resolver, DriverConfig config = {});

    /// @brief Open the configured driver library.
    /// @throws InvalidArgumentError if config is invalid.
    /// @throws DriverUnavailableError if the library cannot be opened.
    [[nodiscard]] static Driver load(DriverConfig config = {});

    /// @brief Call an entry point and return its raw status.
    /// @param name Entry point name without the configured prefix.
    /// @throws SymbolNotFoundError if the entry point is not exported.
    template <typename... Args>
    ReturnCode invoke(std::string_view name, Args... args) const {
        using Function = ReturnCode (*)(Args...);
        auto function = reinterpret_cast<Function>(lookup(qualifiedName(name)));
        return function(args...);
    }

    /// @brief Call an entry point and check its status.
    /// @return The status (kSuccess or a warning code).
    /// @throws DriverError if the status is negative.
    /// @throws SymbolNotFoundError if the entry point is not exported.
    template <typename... Args>
    ReturnCode call(std::string_view name, Args... args) const {
        return check(invoke(name, args...), qualifiedName(name));
    }

    /// @brief Translate a status code.
    /// @param code Status returned by function.
    /// @param function Full driver function name, used in messages.
    /// @return code when it is success or a warning (warnings are logged).
    /// @throws DriverError if code is negative.
    ReturnCode check(ReturnCode code, std::string_view function) const;

    /// @brief Describe a status code for an error report.
    /// @note Prefers the extended information of the last failed call and
    ///       falls back to the generic text for code.
    [[nodiscard]] std::string errorText(ReturnCode code) const;

    /// @brief Generic driver text for a status code.
    [[nodiscard]] std::string errorString(ReturnCode code) const;

    /// @brief Query the installed driver version.
    [[nodiscard]] DriverVersion version() const;

    /// @brief Get the configuration.
    [[nodiscard]] const DriverConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] std::string qualifiedName(std::string_view name) const;

    /// @throws SymbolNotFoundError if symbol is not exported.
    [[nodiscard]] void* lookup(const std::string& symbol) const;

    /// @brief Fetch a driver string, growing the buffer on demand.
    /// @param fetch Callable (char* buffer, uInt32 size) -> ReturnCode.
    template <typename Fetch>
    [[nodiscard]] std::optional<std::string> fetchString(Fetch&& fetch) const;

    std::shared_ptr<const SymbolResolver> resolver_;
    DriverConfig config_;
};

}  // namespace daqpath::driver

#endif  // DAQPATH_DRIVER_DRIVER_H
