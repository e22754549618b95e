// =============================================================================
// daqpath - Driver Commands Implementation
// =============================================================================

#include "driver_commands.h"

#include <ostream>
#include <utility>

#include "daqpath/common/logger.h"

namespace daqpath::commands {

// =============================================================================
// ExplainCommand Implementation
// =============================================================================

ExplainCommand::ExplainCommand(driver::Driver driver, driver::ReturnCode code)
    : driver_(std::move(driver)), code_(code) {}

int ExplainCommand::execute(std::ostream& out) const {
    if (code_ == driver::kSuccess) {
        out << code_ << ": success\n";
        return 0;
    }

    out << code_ << ": " << driver_.errorString(code_) << '\n';
    return 0;
}

// =============================================================================
// VersionCommand Implementation
// =============================================================================

VersionCommand::VersionCommand(driver::Driver driver) : driver_(std::move(driver)) {}

int VersionCommand::execute(std::ostream& out) const {
    const driver::DriverVersion version = driver_.version();
    DAQPATH_LOG_DEBUG("Driver reports version {}", version.toString());
    out << "NI-DAQmx " << version.toString() << '\n';
    return 0;
}

}  // namespace daqpath::commands
