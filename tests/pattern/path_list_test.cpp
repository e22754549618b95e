// =============================================================================
// daqpath - Path List Tests
// =============================================================================

#include "daqpath/pattern/path_list.h"

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "daqpath/common/error.h"

namespace daqpath::pattern {
namespace {

using Names = std::vector<std::string>;

TEST(SplitNameListTest, DriverStyleList) {
    EXPECT_EQ(splitNameList("Dev1/ai0, Dev1/ai1, Dev1/ai2"),
              (Names{"Dev1/ai0", "Dev1/ai1", "Dev1/ai2"}));
}

TEST(SplitNameListTest, DropsEmptyEntriesAndWhitespace) {
    EXPECT_EQ(splitNameList("  Dev1/ai0 ,,\tDev2/ao1\r\n, "), (Names{"Dev1/ai0", "Dev2/ao1"}));
    EXPECT_TRUE(splitNameList("").empty());
    EXPECT_TRUE(splitNameList(" , ,").empty());
}

TEST(SplitNameListTest, SingleName) {
    EXPECT_EQ(splitNameList("Dev1/port0/line3"), (Names{"Dev1/port0/line3"}));
}

TEST(ReadNameListTest, OneNamePerLine) {
    std::istringstream input("Dev1/ai0\nDev1/ai1\n\nDev1/ai2\n");
    EXPECT_EQ(readNameList(input), (Names{"Dev1/ai0", "Dev1/ai1", "Dev1/ai2"}));
}

TEST(ReadNameListTest, CommaSeparatedLines) {
    std::istringstream input("Dev0/ao0, Dev0/ao1\nDev1/ai0");
    EXPECT_EQ(readNameList(input), (Names{"Dev0/ao0", "Dev0/ao1", "Dev1/ai0"}));
}

TEST(ReadNameListTest, EmptyStream) {
    std::istringstream input("");
    EXPECT_TRUE(readNameList(input).empty());
}

TEST(ReadNameListTest, BadStreamThrows) {
    std::istringstream input("Dev1/ai0");
    input.setstate(std::ios::badbit);
    EXPECT_THROW((void)readNameList(input), IOError);
}

}  // namespace
}  // namespace daqpath::pattern
