#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "quadrant/config.h"
#include "quadrant/klog.h"

using namespace quadrant;

namespace {

std::vector<std::string> g_sunk;

void capture_sink(LogLevel, const char* line) { g_sunk.push_back(line); }

class KlogTest : public ::testing::Test {
protected:
    void SetUp() override {
        klog_clear();
        g_sunk.clear();
        klog_set_sink(capture_sink);
        klog_set_min_level(LOG_INFO);
    }
    void TearDown() override {
        klog_set_sink(nullptr);
        klog_set_min_level(LOG_INFO);
    }
};

}

TEST_F(KlogTest, FormatsWithLevelPrefix) {
    klog(LOG_WARN, "disk %d is %s", 3, "full");
    ASSERT_EQ(1, klog_count());
    EXPECT_STREQ("[WARN] disk 3 is full", klog_line(0));
    ASSERT_EQ(1u, g_sunk.size());
    EXPECT_EQ("[WARN] disk 3 is full", g_sunk[0]);
}

TEST_F(KlogTest, DropsLinesBelowMinimumLevel) {
    klog(LOG_DEBUG, "hidden");
    EXPECT_EQ(0, klog_count());
    klog_set_min_level(LOG_DEBUG);
    klog(LOG_DEBUG, "shown");
    EXPECT_EQ(1, klog_count());
}

TEST_F(KlogTest, RingKeepsNewestLinesOldestFirst) {
    for (int i = 0; i < config::LOG_RING_LINES + 4; i++) klog(LOG_INFO, "line %d", i);
    ASSERT_EQ(config::LOG_RING_LINES, klog_count());
    EXPECT_STREQ("[INFO] line 4", klog_line(0));
    EXPECT_STREQ("[INFO] line 19", klog_line(config::LOG_RING_LINES - 1));
    EXPECT_STREQ("", klog_line(config::LOG_RING_LINES));
}

TEST(KlogDeathTest, AssertionFailureIsFatal) {
    EXPECT_DEATH(QUADRANT_ASSERT(1 + 1 == 3, "arithmetic broke"), "");
}
