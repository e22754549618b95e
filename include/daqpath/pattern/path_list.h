// =============================================================================
// daqpath - Path List Parsing
// =============================================================================
// The driver reports resource names as one comma-separated string
// ("Dev1/ai0, Dev1/ai1, ..."). These helpers turn such lists, or text with
// one name per line, into the path vectors PatternCompressor consumes.
// =============================================================================

#ifndef DAQPATH_PATTERN_PATH_LIST_H
#define DAQPATH_PATTERN_PATH_LIST_H

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace daqpath::pattern {

/// @brief Split a comma-separated name list.
/// @return Names with surrounding whitespace removed; empty entries dropped.
[[nodiscard]] std::vector<std::string> splitNameList(std::string_view list);

/// @brief Read names from a stream, one or more comma-separated per line.
/// @throws IOError if the stream fails before end of input.
[[nodiscard]] std::vector<std::string> readNameList(std::istream& input);

}  // namespace daqpath::pattern

#endif  // DAQPATH_PATTERN_PATH_LIST_H
