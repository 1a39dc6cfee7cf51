/**
 * @file test_format_utils.cpp
 * @brief Tests for human-readable size, speed and remaining-time formatting
 */

#include <gtest/gtest.h>

import tondar.utils.format_utils;
import tondar.utils.category_utils;

namespace utils = tondar::utils;

TEST(FormatUtils, FormatSize) {
    EXPECT_EQ(utils::formatSize(0), "0 B");
    EXPECT_EQ(utils::formatSize(-5), "0 B");
    EXPECT_EQ(utils::formatSize(512), "512.00 B");
    EXPECT_EQ(utils::formatSize(1024), "1.00 KB");
    EXPECT_EQ(utils::formatSize(1536), "1.50 KB");
    EXPECT_EQ(utils::formatSize(1572864), "1.50 MB");
    EXPECT_EQ(utils::formatSize(qint64(5) * 1024 * 1024 * 1024 * 1024), "5120.00 GB");
}

TEST(FormatUtils, FormatSpeed) {
    EXPECT_EQ(utils::formatSpeed(0), "0 B/s");
    EXPECT_EQ(utils::formatSpeed(2560), "2.50 KB/s");
    EXPECT_TRUE(utils::formatSpeed(1e30).endsWith(" GB/s"));
}

TEST(FormatUtils, FormatTimeLeft) {
    EXPECT_EQ(utils::formatTimeLeft(0, 100, 0), "--:--");
    EXPECT_EQ(utils::formatTimeLeft(0, 0, 10), "--:--");
    EXPECT_EQ(utils::formatTimeLeft(0, 100, 10), "0:10");
    EXPECT_EQ(utils::formatTimeLeft(0, 125, 1), "2:05");
    EXPECT_EQ(utils::formatTimeLeft(0, 2 * 3600 + 30 * 60, 1), "2h 30m");
    EXPECT_EQ(utils::formatTimeLeft(200, 100, 10), "0:00");
    EXPECT_TRUE(utils::formatTimeLeft(0, 1000, 1e-300).endsWith("m"));
}

TEST(CategoryUtils, DetectsCategoryFromExtension) {
    EXPECT_EQ(utils::detectCategory("movie.MKV"), "Video");
    EXPECT_EQ(utils::detectCategory("song.flac"), "Audio");
    EXPECT_EQ(utils::detectCategory("/a/b/archive.tar.gz"), "Archives");
    EXPECT_EQ(utils::detectCategory("report.pdf"), "Documents");
    EXPECT_EQ(utils::detectCategory("setup.exe"), "Programs");
    EXPECT_EQ(utils::detectCategory("README"), "Other");
}

TEST(CategoryUtils, ExtensionLabel) {
    EXPECT_EQ(utils::extensionLabel("photo.jpeg"), "JPEG");
    EXPECT_EQ(utils::extensionLabel(".bashrc"), "FILE");
    EXPECT_EQ(utils::extensionLabel("dir.d/noext"), "FILE");
    EXPECT_EQ(utils::extensionLabel("trailing."), "FILE");
}
