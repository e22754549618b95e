// =============================================================================
// daqpath - Driver Library Loader
// =============================================================================
// Symbol lookup for the vendor driver. SymbolResolver is the seam between the
// Driver and the shared object: DriverLibrary resolves names with dlsym() in a
// library opened by dlopen(), tests plug in a table of local functions.
// =============================================================================

#ifndef DAQPATH_DRIVER_DRIVER_LIBRARY_H
#define DAQPATH_DRIVER_DRIVER_LIBRARY_H

#include <string>
#include <string_view>

namespace daqpath::driver {

// =============================================================================
// SymbolResolver Interface
// =============================================================================

/// @brief Maps driver entry point names to function addresses.
class SymbolResolver {
public:
    virtual ~SymbolResolver() = default;

    /// @brief Look up an entry point.
    /// @param symbol Full exported name (e.g. "DAQmxGetErrorString").
    /// @return The address, or nullptr if the symbol is not exported.
    [[nodiscard]] virtual void* resolve(std::string_view symbol) const = 0;
};

// =============================================================================
// DriverLibrary Class
// =============================================================================

/// @brief Owns a dlopen() handle to the vendor driver library.
class DriverLibrary final : public SymbolResolver {
public:
    /// @brief Open a shared library.
    /// @param path File name or path, searched like dlopen() does.
    /// @throws DriverUnavailableError if the library cannot be opened.
    explicit DriverLibrary(std::string path);

    /// @brief Closes the library handle.
    ~DriverLibrary() override;

    // Non-copyable, movable
    DriverLibrary(const DriverLibrary&) = delete;
    DriverLibrary& operator=(const DriverLibrary&) = delete;
    DriverLibrary(DriverLibrary&& other) noexcept;
    DriverLibrary& operator=(DriverLibrary&& other) noexcept;

    [[nodiscard]] void* resolve(std::string_view symbol) const override;

    /// @brief Path the library was opened from.
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    void close() noexcept;

    void* handle_ = nullptr;
    std::string path_;
};

}  // namespace daqpath::driver

#endif  // DAQPATH_DRIVER_DRIVER_LIBRARY_H
