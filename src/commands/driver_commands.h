// =============================================================================
// daqpath - Driver Commands
// =============================================================================
// Command handlers that talk to the installed NI-DAQmx driver:
// - ExplainCommand: print the driver's text for a status code
// - VersionCommand: print the installed driver version
// =============================================================================

#ifndef DAQPATH_COMMANDS_DRIVER_COMMANDS_H
#define DAQPATH_COMMANDS_DRIVER_COMMANDS_H

#include <iosfwd>

#include "daqpath/driver/driver.h"

namespace daqpath::commands {

/// @brief Command handler for translating driver status codes.
class ExplainCommand {
public:
    ExplainCommand(driver::Driver driver, driver::ReturnCode code);

    /// @brief Print "<code>: <text>" to out.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute(std::ostream& out) const;

private:
    driver::Driver driver_;
    driver::ReturnCode code_;
};

/// @brief Command handler for reporting the driver version.
class VersionCommand {
public:
    explicit VersionCommand(driver::Driver driver);

    /// @brief Print "NI-DAQmx <major>.<minor>" to out.
    /// @return Exit code (0 = success).
    /// @throws DriverError or SymbolNotFoundError if the query fails.
    [[nodiscard]] int execute(std::ostream& out) const;

private:
    driver::Driver driver_;
};

}  // namespace daqpath::commands

#endif  // DAQPATH_COMMANDS_DRIVER_COMMANDS_H
