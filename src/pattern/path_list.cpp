// =============================================================================
// daqpath - Path List Parsing Implementation
// =============================================================================

#include "daqpath/pattern/path_list.h"

#include <istream>
#include <iterator>

#include "daqpath/common/error.h"

namespace daqpath::pattern {

namespace {

constexpr std::string_view kWhitespace = " \t\r\n";

std::string_view trim(std::string_view str) noexcept {
    const auto first = str.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = str.find_last_not_of(kWhitespace);
    return str.substr(first, last - first + 1);
}

}  // namespace

std::vector<std::string> splitNameList(std::string_view list) {
    std::vector<std::string> names;

    while (!list.empty()) {
        const auto comma = list.find(',');
        const std::string_view name = trim(list.substr(0, comma));
        if (!name.empty()) {
            names.emplace_back(name);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        list.remove_prefix(comma + 1);
    }

    return names;
}

std::vector<std::string> readNameList(std::istream& input) {
    std::vector<std::string> names;
    std::string line;

    while (std::getline(input, line)) {
        auto lineNames = splitNameList(line);
        names.insert(names.end(), std::make_move_iterator(lineNames.begin()),
                     std::make_move_iterator(lineNames.end()));
    }

    if (input.bad()) {
        throw IOError("Failed to read path list");
    }

    return names;
}

}  // namespace daqpath::pattern
