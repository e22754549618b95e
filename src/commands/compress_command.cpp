// =============================================================================
// daqpath - Compress Command Implementation
// =============================================================================

#include "compress_command.h"

#include <cerrno>
#include <fstream>
#include <iostream>
#include <system_error>
#include <utility>

#include "daqpath/common/logger.h"
#include "daqpath/pattern/path_list.h"
#include "daqpath/pattern/pattern_compressor.h"

namespace daqpath::commands {

CompressCommand::CompressCommand(CompressOptions options) : options_(std::move(options)) {}

int CompressCommand::execute(std::ostream& out) {
    const std::vector<std::string> paths = collectPaths();
    if (paths.empty()) {
        throw UsageError("No paths given (pass them as arguments or on stdin)");
    }

    DAQPATH_LOG_DEBUG("Compressing {} paths", paths.size());

    pattern::PatternCompressor compressor;
    out << compressor.compress(paths) << '\n';
    return 0;
}

std::vector<std::string> CompressCommand::collectPaths() const {
    if (!options_.paths.empty()) {
        std::vector<std::string> paths;
        for (const auto& argument : options_.paths) {
            auto names = pattern::splitNameList(argument);
            paths.insert(paths.end(), names.begin(), names.end());
        }
        return paths;
    }

    if (options_.inputPath.empty() || options_.inputPath == "-") {
        return pattern::readNameList(std::cin);
    }

    std::ifstream file(options_.inputPath);
    if (!file) {
        throw IOError("Failed to open path list " + options_.inputPath,
                      std::error_code(errno, std::generic_category()));
    }
    return pattern::readNameList(file);
}

}  // namespace daqpath::commands
