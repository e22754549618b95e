// =============================================================================
// daqpath - Pattern Compressor Property Tests
// =============================================================================
// Property-based tests for the pattern compressor:
// - the pattern does not depend on input order or duplicates
// - expanding a pattern yields exactly the input paths, none dropped
// - integer suffixes become a range exactly when they have no gaps
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <random>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "daqpath/pattern/pattern_compressor.h"

namespace daqpath::pattern::test {

namespace {

constexpr std::array<std::string_view, 4> kChannelTypes = {"ai", "ao", "ctr", "di"};

/// @brief A contiguous run of channels of one type on one device.
struct ChannelBlock {
    int device = 0;
    std::size_t type = 0;
    int first = 0;
    int count = 1;
};

std::string compress(const std::vector<std::string>& paths) {
    return PatternCompressor{}.compress(paths);
}

std::string join(const std::vector<std::string>& paths) {
    std::string result;
    for (const auto& path : paths) {
        if (!result.empty()) {
            result += ',';
        }
        result += path;
    }
    return result;
}

/// @brief Split a pattern into its top-level clauses.
std::vector<std::string> splitClauses(std::string_view pattern) {
    std::vector<std::string> clauses;
    int depth = 0;
    std::size_t start = 0;
    for (std::size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] == '{') {
            ++depth;
        } else if (pattern[i] == '}') {
            --depth;
        } else if (pattern[i] == ',' && depth == 0) {
            clauses.emplace_back(pattern.substr(start, i - start));
            start = i + 1;
        }
    }
    clauses.emplace_back(pattern.substr(start));
    return clauses;
}

/// @brief Expand a compact pattern back into the paths it names.
std::vector<std::string> expandPattern(std::string_view pattern) {
    std::vector<std::string> paths;
    for (const auto& clause : splitClauses(pattern)) {
        auto brace = clause.find('{');
        if (brace != std::string::npos) {
            std::string prefix = clause.substr(0, brace);
            std::string inner = clause.substr(brace + 1, clause.size() - brace - 2);
            for (const auto& path : expandPattern(inner)) {
                paths.push_back(prefix + path);
            }
            continue;
        }

        auto colon = clause.find(':');
        if (colon == std::string::npos) {
            paths.push_back(clause);
            continue;
        }

        std::string left = clause.substr(0, colon);
        std::size_t digits = left.find_last_not_of("0123456789") + 1;
        std::string prefix = left.substr(0, digits);
        long long low = std::stoll(left.substr(digits));
        long long high = std::stoll(clause.substr(colon + 1));
        for (long long value = low; value <= high; ++value) {
            paths.push_back(prefix + std::to_string(value));
        }
    }
    return paths;
}

}  // namespace

// =============================================================================
// RapidCheck Generators
// =============================================================================

namespace gen {

/// @brief Generate one channel block.
[[nodiscard]] rc::Gen<ChannelBlock> channelBlock() {
    return rc::gen::apply(
        [](int device, std::size_t type, int first, int count) {
            return ChannelBlock{device, type, first, count};
        },
        rc::gen::inRange(0, 4),                                      // device
        rc::gen::inRange<std::size_t>(0, kChannelTypes.size()),      // channel type
        rc::gen::inRange(0, 16),                                     // first index
        rc::gen::inRange(1, 9));                                     // channel count
}

/// @brief Generate a path list that always has a compact form.
/// Each (device, type) pair appears in at most one block, so every index set
/// is contiguous.
[[nodiscard]] rc::Gen<std::vector<std::string>> compressiblePaths() {
    return rc::gen::map(
        rc::gen::nonEmpty(rc::gen::container<std::vector<ChannelBlock>>(channelBlock())),
        [](const std::vector<ChannelBlock>& blocks) {
            std::set<std::pair<int, std::size_t>> seen;
            std::vector<std::string> paths;
            for (const auto& block : blocks) {
                if (!seen.insert({block.device, block.type}).second) {
                    continue;
                }
                for (int i = block.first; i < block.first + block.count; ++i) {
                    paths.push_back("Dev" + std::to_string(block.device) + "/" +
                                    std::string(kChannelTypes[block.type]) +
                                    std::to_string(i));
                }
            }
            return paths;
        });
}

/// @brief Generate digital line paths ("DevN/portP/lineL") that always
/// compress, with one contiguous line range per port.
[[nodiscard]] rc::Gen<std::vector<std::string>> portLinePaths() {
    return rc::gen::map(
        rc::gen::nonEmpty(rc::gen::container<std::vector<ChannelBlock>>(channelBlock())),
        [](const std::vector<ChannelBlock>& blocks) {
            std::set<std::pair<int, std::size_t>> seen;
            std::vector<std::string> paths;
            for (const auto& block : blocks) {
                if (!seen.insert({block.device, block.type}).second) {
                    continue;
                }
                for (int i = block.first; i < block.first + block.count; ++i) {
                    paths.push_back("Dev" + std::to_string(block.device) + "/port" +
                                    std::to_string(block.type) + "/line" + std::to_string(i));
                }
            }
            return paths;
        });
}

}  // namespace gen

// =============================================================================
// Property Tests
// =============================================================================

RC_GTEST_PROP(PatternCompressorProperty, OrderIndependent, ()) {
    auto paths = *gen::compressiblePaths();
    auto shuffled = paths;
    std::mt19937 rng(*rc::gen::arbitrary<unsigned>());
    std::shuffle(shuffled.begin(), shuffled.end(), rng);

    RC_ASSERT(compress(shuffled) == compress(paths));
}

RC_GTEST_PROP(PatternCompressorProperty, DuplicatesDoNotChangePattern, ()) {
    auto paths = *gen::compressiblePaths();
    auto indices = *rc::gen::container<std::vector<std::size_t>>(
        rc::gen::inRange<std::size_t>(0, paths.size()));

    auto withDuplicates = paths;
    for (auto index : indices) {
        withDuplicates.push_back(paths[index]);
    }

    RC_ASSERT(compress(withDuplicates) == compress(paths));
}

RC_GTEST_PROP(PatternCompressorProperty, LeadingSeparatorIsIgnored, ()) {
    auto paths = *gen::compressiblePaths();
    auto absolute = paths;
    for (auto& path : absolute) {
        path.insert(0, "/");
    }

    RC_ASSERT(compress(absolute) == compress(paths));
}

RC_GTEST_PROP(PatternCompressorProperty, ExpansionCoversInputExactly, ()) {
    auto paths = *gen::compressiblePaths();
    auto pattern = compress(paths);
    auto expanded = expandPattern(pattern);

    std::set<std::string> expected(paths.begin(), paths.end());
    std::set<std::string> actual(expanded.begin(), expanded.end());

    RC_ASSERT(expanded.size() == actual.size());
    RC_ASSERT(actual == expected);
}

RC_GTEST_PROP(PatternCompressorProperty, NestedPortExpansionCoversInput, ()) {
    auto paths = *gen::portLinePaths();
    auto expanded = expandPattern(compress(paths));

    std::set<std::string> expected(paths.begin(), paths.end());
    std::set<std::string> actual(expanded.begin(), expanded.end());

    RC_ASSERT(expanded.size() == actual.size());
    RC_ASSERT(actual == expected);
}

RC_GTEST_PROP(PatternCompressorProperty, ZeroPaddedIndexIsNeverDropped, ()) {
    auto paths = *gen::compressiblePaths();
    const auto index = *rc::gen::inRange<std::size_t>(0, paths.size());

    // "Dev0/ai5" -> "Dev0/ai05": same index, different channel name
    std::string padded = paths[index];
    padded.insert(padded.find_last_not_of("0123456789") + 1, "0");
    paths.push_back(padded);

    auto expanded = expandPattern(compress(paths));
    std::set<std::string> expected(paths.begin(), paths.end());
    std::set<std::string> actual(expanded.begin(), expanded.end());

    RC_ASSERT(actual == expected);
}

RC_GTEST_PROP(PatternCompressorProperty, RangeExactlyWhenContiguous, ()) {
    auto values = *rc::gen::nonEmpty(rc::gen::container<std::vector<int>>(rc::gen::inRange(0, 40)));

    std::set<int> unique(values.begin(), values.end());
    const int low = *unique.begin();
    const int high = *unique.rbegin();
    const bool contiguous = static_cast<std::size_t>(high - low + 1) == unique.size();

    std::vector<std::string> suffixes;
    for (int value : values) {
        suffixes.push_back(std::to_string(value));
    }
    std::vector<std::string_view> views(suffixes.begin(), suffixes.end());

    auto range = formatRange(views);
    RC_ASSERT(range.has_value() == contiguous);
    if (contiguous) {
        std::string expected = low == high
                                   ? std::to_string(low)
                                   : std::to_string(low) + ":" + std::to_string(high);
        RC_ASSERT(*range == expected);
    }
}

RC_GTEST_PROP(PatternCompressorProperty, GapsFallBackToEnumeration, ()) {
    auto values = *rc::gen::nonEmpty(rc::gen::container<std::vector<int>>(rc::gen::inRange(0, 40)));

    std::vector<std::string> paths;
    for (int value : values) {
        paths.push_back("Dev1/ai" + std::to_string(value));
    }

    std::set<int> unique(values.begin(), values.end());
    const bool contiguous =
        static_cast<std::size_t>(*unique.rbegin() - *unique.begin() + 1) == unique.size();

    auto pattern = compress(paths);
    if (contiguous) {
        RC_ASSERT(pattern.find(',') == std::string::npos);
    } else {
        RC_ASSERT(pattern == join(paths));
    }
}

}  // namespace daqpath::pattern::test
