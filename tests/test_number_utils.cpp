/**
 * @file test_number_utils.cpp
 * @brief Tests for range-checked JSON number conversions
 */

#include <gtest/gtest.h>

#include <QJsonValue>
#include <QString>
#include <limits>

import tondar.utils.number_utils;

namespace utils = tondar::utils;

TEST(NumberUtils, SafeIntegers) {
    EXPECT_TRUE(utils::isSafeInteger(0));
    EXPECT_TRUE(utils::isSafeInteger(-42));
    EXPECT_TRUE(utils::isSafeInteger(utils::kMaxSafeInteger));
    EXPECT_FALSE(utils::isSafeInteger(1.5));
    EXPECT_FALSE(utils::isSafeInteger(1e20));
    EXPECT_FALSE(utils::isSafeInteger(std::numeric_limits<double>::infinity()));
    EXPECT_FALSE(utils::isSafeInteger(std::numeric_limits<double>::quiet_NaN()));
}

TEST(NumberUtils, ClampToInt64) {
    EXPECT_EQ(utils::clampToInt64(12.9), 12);
    EXPECT_EQ(utils::clampToInt64(1e20), std::numeric_limits<qint64>::max());
    EXPECT_EQ(utils::clampToInt64(-1e20), std::numeric_limits<qint64>::min());
    EXPECT_EQ(utils::clampToInt64(std::numeric_limits<double>::quiet_NaN()), 0);
}

TEST(NumberUtils, ReadInt64) {
    EXPECT_EQ(utils::readInt64(QJsonValue(4096.0), -1), 4096);
    EXPECT_EQ(utils::readInt64(QJsonValue(7.8), -1), 7);
    EXPECT_EQ(utils::readInt64(QJsonValue(1e20), -1), -1);
    EXPECT_EQ(utils::readInt64(QJsonValue(QStringLiteral("12")), -1), -1);
    EXPECT_EQ(utils::readInt64(QJsonValue(), 5), 5);
}

TEST(NumberUtils, ReadIntRejectsValuesBeyondInt) {
    EXPECT_EQ(utils::readInt(QJsonValue(100.0), 0), 100);
    EXPECT_EQ(utils::readInt(QJsonValue(3e9), 8), 8);
    EXPECT_EQ(utils::readInt(QJsonValue(-3e9), 8), 8);
}
