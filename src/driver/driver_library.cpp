// =============================================================================
// daqpath - Driver Library Loader Implementation
// =============================================================================

#include "daqpath/driver/driver_library.h"

#include <dlfcn.h>

#include <cstdio>
#include <exception>
#include <format>
#include <utility>

#include "daqpath/common/error.h"
#include "daqpath/common/logger.h"

namespace daqpath::driver {

DriverLibrary::DriverLibrary(std::string path) : path_(std::move(path)) {
    handle_ = dlopen(path_.c_str(), RTLD_LAZY | RTLD_LOCAL);
    if (handle_ == nullptr) {
        const char* reason = dlerror();
        throw DriverUnavailableError(std::format("cannot load driver library '{}': {}", path_,
                                                 reason != nullptr ? reason : "unknown error"));
    }
    DAQPATH_LOG_DEBUG("Loaded driver library {}", path_);
}

DriverLibrary::~DriverLibrary() {
    close();
}

DriverLibrary::DriverLibrary(DriverLibrary&& other) noexcept
    : handle_(std::exchange(other.handle_, nullptr)), path_(std::move(other.path_)) {}

DriverLibrary& DriverLibrary::operator=(DriverLibrary&& other) noexcept {
    if (this != &other) {
        close();
        handle_ = std::exchange(other.handle_, nullptr);
        path_ = std::move(other.path_);
    }
    return *this;
}

void* DriverLibrary::resolve(std::string_view symbol) const {
    if (handle_ == nullptr) {
        return nullptr;
    }
    const std::string name(symbol);
    return dlsym(handle_, name.c_str());
}

void DriverLibrary::close() noexcept {
    if (handle_ == nullptr) {
        return;
    }

    const bool failed = dlclose(handle_) != 0;
    handle_ = nullptr;
    if (!failed) {
        return;
    }

    // Runs from the destructor: a throwing log call must not escape
    const char* reason = dlerror();
    try {
        DAQPATH_LOG_WARNING("Failed to unload driver library {}: {}", path_,
                            reason != nullptr ? reason : "unknown error");
    } catch (const std::exception& ex) {
        std::fprintf(stderr, "daqpath: failed to unload %s (%s)\n", path_.c_str(), ex.what());
    }
}

}  // namespace daqpath::driver
