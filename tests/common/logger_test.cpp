// =============================================================================
// daqpath - Logger Tests
// =============================================================================

#include "daqpath/common/logger.h"

#include <gtest/gtest.h>

namespace daqpath::log {
namespace {

TEST(LoggerLevelTest, FromString) {
    EXPECT_EQ(levelFromString("trace"), Level::kTrace);
    EXPECT_EQ(levelFromString("DEBUG"), Level::kDebug);
    EXPECT_EQ(levelFromString("warn"), Level::kWarning);
    EXPECT_EQ(levelFromString("Warning"), Level::kWarning);
    EXPECT_EQ(levelFromString("fatal"), Level::kCritical);
    EXPECT_EQ(levelFromString("bogus"), Level::kInfo);
}

TEST(LoggerLevelTest, NamesRoundTrip) {
    for (Level level : {Level::kTrace, Level::kDebug, Level::kInfo, Level::kWarning,
                        Level::kError, Level::kCritical}) {
        EXPECT_EQ(levelFromString(levelToString(level)), level);
    }
}

TEST(LoggerTest, MacrosAreSafeBeforeInit) {
    ASSERT_FALSE(isInitialized());
    EXPECT_EQ(logger(), nullptr);
    DAQPATH_LOG_WARNING("not initialized: {}", 42);
    flush();
    shutdown();
    EXPECT_FALSE(isInitialized());
}

}  // namespace
}  // namespace daqpath::log
