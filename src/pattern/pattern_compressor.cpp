// =============================================================================
// daqpath - Path Pattern Compressor Implementation
// =============================================================================

#include "daqpath/pattern/pattern_compressor.h"

#include <algorithm>
#include <charconv>
#include <map>
#include <set>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "daqpath/common/error.h"
#include "daqpath/common/logger.h"

namespace daqpath::pattern {

namespace {

[[nodiscard]] constexpr bool isDigit(char c) noexcept {
    return c >= '0' && c <= '9';
}

/// @brief Index of the first path whose shape differs from the first path's.
[[nodiscard]] std::optional<std::size_t> findShapeConflict(
    std::span<const std::string_view> paths) {
    if (paths.empty()) {
        return std::nullopt;
    }
    const PathShape first = shapeOf(paths.front());
    for (std::size_t i = 1; i < paths.size(); ++i) {
        if (shapeOf(paths[i]) != first) {
            return i;
        }
    }
    return std::nullopt;
}

/// @brief Join clauses or paths with the clause separator.
template <typename Range>
[[nodiscard]] std::string joinClauses(const Range& items) {
    return fmt::format("{}", fmt::join(items, std::string_view(&kClauseSeparator, 1)));
}

}  // namespace

// =============================================================================
// Path Helpers
// =============================================================================

std::string_view stripLeadingSeparator(std::string_view path) noexcept {
    if (!path.empty() && path.front() == kPathSeparator) {
        path.remove_prefix(1);
    }
    return path;
}

PathShape shapeOf(std::string_view path) noexcept {
    return stripLeadingSeparator(path).find(kPathSeparator) == std::string_view::npos
               ? PathShape::kBare
               : PathShape::kSlash;
}

std::optional<PathShape> detectShape(std::span<const std::string_view> paths) {
    if (paths.empty() || findShapeConflict(paths).has_value()) {
        return std::nullopt;
    }
    return shapeOf(paths.front());
}

PathSplit splitPath(std::string_view path, PathShape shape) noexcept {
    std::size_t boundary = 0;
    if (shape == PathShape::kSlash) {
        boundary = path.find(kPathSeparator);
        return {path.substr(0, boundary), path.substr(boundary + 1)};
    }

    auto firstDigit = std::find_if(path.begin(), path.end(), isDigit);
    boundary = static_cast<std::size_t>(firstDigit - path.begin());
    return {path.substr(0, boundary), path.substr(boundary)};
}

// =============================================================================
// Range Detection
// =============================================================================

std::optional<long long> parseIndex(std::string_view suffix) noexcept {
    if (suffix.empty() || !std::all_of(suffix.begin(), suffix.end(), isDigit)) {
        return std::nullopt;
    }

    long long value = 0;
    auto [ptr, ec] = std::from_chars(suffix.data(), suffix.data() + suffix.size(), value);
    if (ec != std::errc{} || ptr != suffix.data() + suffix.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::string> formatRange(std::span<const std::string_view> suffixes) {
    // Value -> spelling; "01" and "1" name different channels
    std::map<long long, std::string_view> values;

    for (const auto suffix : suffixes) {
        auto value = parseIndex(suffix);
        if (!value) {
            return std::nullopt;
        }
        auto [it, inserted] = values.emplace(*value, suffix);
        if (!inserted && it->second != suffix) {
            return std::nullopt;
        }
    }

    if (values.empty()) {
        return std::nullopt;
    }

    const long long first = values.begin()->first;
    const long long last = values.rbegin()->first;
    if (static_cast<std::size_t>(last - first) + 1 != values.size()) {
        return std::nullopt;
    }

    if (first == last) {
        return std::to_string(first);
    }
    return fmt::format("{}{}{}", first, kRangeSeparator, last);
}

// =============================================================================
// PatternCompressor Implementation
// =============================================================================

PatternResult PatternCompressor::compressGroup(std::span<const std::string_view> paths) const {
    auto shape = detectShape(paths);
    if (!shape) {
        return NoCompactForm{};
    }

    // Prefix -> distinct suffixes, both ordered
    std::map<std::string_view, std::set<std::string_view>> groups;
    for (const auto path : paths) {
        const std::string_view stripped = stripLeadingSeparator(path);
        if (stripped.empty()) {
            return NoCompactForm{};
        }
        const PathSplit split = splitPath(stripped, *shape);
        groups[split.prefix].insert(split.suffix);
    }

    const std::string_view separator =
        *shape == PathShape::kSlash ? std::string_view{"/"} : std::string_view{};

    std::vector<std::string> clauses;
    clauses.reserve(groups.size());

    for (const auto& [prefix, suffixSet] : groups) {
        if (suffixSet.size() == 1) {
            const std::string_view suffix = *suffixSet.begin();
            std::string clause(prefix);
            if (!suffix.empty()) {
                clause += separator;
                clause += suffix;
            }
            clauses.push_back(std::move(clause));
            continue;
        }

        const std::vector<std::string_view> members(suffixSet.begin(), suffixSet.end());

        if (prefix.empty()) {
            auto range = formatRange(members);
            if (!range) {
                return NoCompactForm{};
            }
            clauses.push_back(std::move(*range));
            continue;
        }

        PatternResult nested = compressGroup(members);
        auto* sub = std::get_if<CompressedPattern>(&nested);
        if (sub == nullptr) {
            return NoCompactForm{};
        }

        std::string clause(prefix);
        clause += separator;
        if (sub->text.find(kClauseSeparator) != std::string::npos) {
            clause += '{';
            clause += sub->text;
            clause += '}';
        } else {
            clause += sub->text;
        }
        clauses.push_back(std::move(clause));
    }

    return CompressedPattern{joinClauses(clauses)};
}

std::string PatternCompressor::compress(std::span<const std::string_view> paths) const {
    if (paths.empty()) {
        throw InvalidArgumentError("cannot build a pattern from an empty path list");
    }

    for (std::size_t i = 0; i < paths.size(); ++i) {
        if (stripLeadingSeparator(paths[i]).empty()) {
            throw InvalidArgumentError(fmt::format("empty path at position {}", i));
        }
    }

    if (auto conflict = findShapeConflict(paths)) {
        throw InvalidArgumentError(
            fmt::format("mixed bare and slash-delimited paths: '{}' and '{}'",
                        paths.front(), paths[*conflict]));
    }

    PatternResult result = compressGroup(paths);
    if (auto* compressed = std::get_if<CompressedPattern>(&result)) {
        return std::move(compressed->text);
    }

    DAQPATH_LOG_DEBUG("No compact pattern for {} paths, enumerating", paths.size());
    return joinClauses(paths);
}

std::string PatternCompressor::compress(std::span<const std::string> paths) const {
    std::vector<std::string_view> views(paths.begin(), paths.end());
    return compress(std::span<const std::string_view>(views));
}

std::string makePattern(std::span<const std::string> paths) {
    return PatternCompressor{}.compress(paths);
}

}  // namespace daqpath::pattern
