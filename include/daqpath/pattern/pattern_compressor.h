// =============================================================================
// daqpath - Path Pattern Compressor
// =============================================================================
// Compresses a set of hardware resource paths (e.g. "Dev1/ai0", "Dev1/ai1")
// into the compact channel notation accepted by the driver ("Dev1/ai0:1").
//
// Paths are grouped by their first segment (slash-delimited paths) or by
// their leading non-digit run (bare tokens such as "ai12"). Each group with
// several members is compressed recursively; a group of plain integers under
// an empty prefix becomes a range "min:max" when it has no gaps. A nested
// pattern that contains a comma is braced:
//
//   Dev0/ao0, Dev0/ao1, Dev1/ai1..3, Dev1/ao1..7
//     -> "Dev0/ao0:1,Dev1/{ai1:3,ao1:7}"
//
// When any nested group has no compact form, the whole input is emitted as a
// comma-joined enumeration of the original strings.
// =============================================================================

#ifndef DAQPATH_PATTERN_PATTERN_COMPRESSOR_H
#define DAQPATH_PATTERN_PATTERN_COMPRESSOR_H

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace daqpath::pattern {

// =============================================================================
// Constants
// =============================================================================

/// @brief Separator between path segments.
inline constexpr char kPathSeparator = '/';

/// @brief Separator between clauses of a pattern.
inline constexpr char kClauseSeparator = ',';

/// @brief Separator between the bounds of a range.
inline constexpr char kRangeSeparator = ':';

// =============================================================================
// Types
// =============================================================================

/// @brief Shape of the paths handled by one compression level.
enum class PathShape {
    /// @brief Single-segment tokens, split at the first digit ("ao12").
    kBare,

    /// @brief Slash-delimited paths, split at the first '/' ("Dev1/ao12").
    kSlash
};

/// @brief One path split into its group prefix and suffix candidate.
struct PathSplit {
    /// @brief Group key.
    std::string_view prefix;

    /// @brief Remainder grouped under prefix (may be empty).
    std::string_view suffix;
};

/// @brief A successfully compressed (sub)pattern.
struct CompressedPattern {
    /// @brief Pattern text.
    std::string text;
};

/// @brief Marker for a group that has no compact form.
struct NoCompactForm {};

/// @brief Outcome of compressing one nested group.
using PatternResult = std::variant<CompressedPattern, NoCompactForm>;

// =============================================================================
// Free Functions
// =============================================================================

/// @brief Remove one leading '/' from a path.
[[nodiscard]] std::string_view stripLeadingSeparator(std::string_view path) noexcept;

/// @brief Determine the shape of a path (after stripping a leading '/').
[[nodiscard]] PathShape shapeOf(std::string_view path) noexcept;

/// @brief Determine the common shape of a non-empty list of paths.
/// @return The shape, or nullopt if the list is empty or mixes shapes.
[[nodiscard]] std::optional<PathShape> detectShape(std::span<const std::string_view> paths);

/// @brief Split a path (leading '/' already stripped) according to shape.
/// @note For kSlash the path must contain a '/'.
[[nodiscard]] PathSplit splitPath(std::string_view path, PathShape shape) noexcept;

/// @brief Parse a suffix as a non-negative decimal integer.
/// @return The value, or nullopt if suffix is empty, has non-digits or overflows.
[[nodiscard]] std::optional<long long> parseIndex(std::string_view suffix) noexcept;

/// @brief Render integer suffixes as a contiguous range.
/// @param suffixes Integer strings, in any order, duplicates allowed.
/// @return "n" or "min:max", or nullopt if a suffix is not an integer, two
///         different suffixes have the same value ("01" and "1"), or the
///         values have a gap.
[[nodiscard]] std::optional<std::string> formatRange(std::span<const std::string_view> suffixes);

// =============================================================================
// PatternCompressor Class
// =============================================================================

/// @brief Builds compact channel patterns from lists of resource paths.
///
/// The compressor is stateless; one instance can be shared between threads.
///
/// Usage:
/// @code
/// PatternCompressor compressor;
/// std::vector<std::string> channels = {"Dev1/ai0", "Dev1/ai1", "Dev1/ai2"};
/// std::string pattern = compressor.compress(channels);  // "Dev1/ai0:2"
/// @endcode
class PatternCompressor {
public:
    /// @brief Compress a list of paths.
    /// @param paths Non-empty list, all bare tokens or all slash-delimited
    ///        (one leading '/' ignored). Duplicates are allowed.
    /// @return Compact pattern, or the comma-joined input when no compact
    ///         form exists.
    /// @throws InvalidArgumentError if paths is empty or mixes shapes.
    [[nodiscard]] std::string compress(std::span<const std::string_view> paths) const;

    /// @brief Compress a list of paths (string version).
    [[nodiscard]] std::string compress(std::span<const std::string> paths) const;

    /// @brief Compress one nested group without falling back.
    /// @param paths Group members; an empty or mixed-shape group has no
    ///        compact form.
    /// @return The compressed group or NoCompactForm.
    [[nodiscard]] PatternResult compressGroup(std::span<const std::string_view> paths) const;
};

/// @brief Convenience wrapper around PatternCompressor::compress().
[[nodiscard]] std::string makePattern(std::span<const std::string> paths);

}  // namespace daqpath::pattern

#endif  // DAQPATH_PATTERN_PATTERN_COMPRESSOR_H
