// =============================================================================
// daqpath - Compress Command
// =============================================================================
// Command handler that prints the compact pattern for a list of resource
// paths given on the command line, in a file, or on stdin.
// =============================================================================

#ifndef DAQPATH_COMMANDS_COMPRESS_COMMAND_H
#define DAQPATH_COMMANDS_COMPRESS_COMMAND_H

#include <iosfwd>
#include <string>
#include <vector>

#include "daqpath/common/error.h"

namespace daqpath::commands {

// =============================================================================
// Compress Options
// =============================================================================

/// @brief Configuration options for the compress command.
struct CompressOptions {
    /// @brief Paths given as positional arguments.
    std::vector<std::string> paths;

    /// @brief File with paths, "-" for stdin. Used when paths is empty.
    std::string inputPath = "-";
};

// =============================================================================
// CompressCommand Class
// =============================================================================

/// @brief Command handler for pattern compression.
class CompressCommand {
public:
    /// @brief Construct with options.
    explicit CompressCommand(CompressOptions options);

    /// @brief Execute the command, writing the pattern to out.
    /// @return Exit code (0 = success).
    /// @throws DaqPathException on invalid input or I/O failure.
    [[nodiscard]] int execute(std::ostream& out);

private:
    /// @brief Collect paths from the arguments or the input source.
    [[nodiscard]] std::vector<std::string> collectPaths() const;

    CompressOptions options_;
};

}  // namespace daqpath::commands

#endif  // DAQPATH_COMMANDS_COMPRESS_COMMAND_H
