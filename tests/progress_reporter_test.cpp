#include <gtest/gtest.h>
#include <sstream>
#include "mock_session.h"
#include "progress_reporter.h"

using ::testing::Return;

TEST(ProgressTest, RoundsPercentAndBar) {
    Progress half = computeProgress(500, 1000);
    EXPECT_EQ(half.percent, 50);
    EXPECT_EQ(half.filled, 10);

    Progress almost = computeProgress(999, 1000);
    EXPECT_EQ(almost.percent, 100);
    EXPECT_EQ(almost.filled, 20);

    Progress start = computeProgress(1, 1000);
    EXPECT_EQ(start.percent, 0);
    EXPECT_EQ(start.filled, 0);
}

TEST(ProgressTest, HalfRoundsUp) {
    EXPECT_EQ(computeProgress(5, 1000).percent, 1);
    EXPECT_EQ(computeProgress(25, 100).filled, 5);
    EXPECT_EQ(computeProgress(125, 1000).filled, 3);
    EXPECT_EQ(computeProgress(145, 1000).percent, 15);
    EXPECT_EQ(computeProgress(285, 1000).percent, 29);
    EXPECT_EQ(computeProgress(575, 1000).percent, 58);
}

TEST(ProgressTest, HandlesVeryLargeImages) {
    uint64_t total = UINT64_MAX - 1;
    EXPECT_EQ(computeProgress(total / 2, total).percent, 50);
    EXPECT_EQ(computeProgress(total, total).percent, 100);
    EXPECT_EQ(computeProgress(total, total).filled, PROGRESS_BAR_WIDTH);
}

TEST(ProgressTest, FormatsSizes) {
    EXPECT_EQ(formatSize(0), "0 B");
    EXPECT_EQ(formatSize(1023), "1023 B");
    EXPECT_EQ(formatSize(1536), "1.5 KiB");
    EXPECT_EQ(formatSize(3ULL * 1024 * 1024), "3.0 MiB");
    EXPECT_EQ(formatSize(2ULL * 1024 * 1024 * 1024), "2.0 GiB");
}

TEST(ProgressTest, RendersStatusLine) {
    EXPECT_EQ(renderProgress("rootfs.img", 500, 1000, 65536),
              "\rrootfs.img: [##########          ] 50% (64.0 KiB written)");
}

TEST(ProgressReporterTest, QueriesBytesWrittenWithoutNewline) {
    MockSession session;
    std::ostringstream out;
    EXPECT_CALL(session, sdBytesWritten()).WillOnce(Return(512));

    ProgressReporter reporter(session, out);
    reporter.report("image", 1000, 1000);

    EXPECT_EQ(out.str(), "\rimage: [####################] 100% (512 B written)");
    reporter.finish();
    EXPECT_EQ(out.str().back(), '\n');
}
