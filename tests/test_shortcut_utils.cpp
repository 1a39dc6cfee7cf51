/**
 * @file test_shortcut_utils.cpp
 * @brief Tests for shortcut binding parsing and matching
 */

#include <gtest/gtest.h>

import tondar.utils.shortcut_utils;

namespace utils = tondar::utils;

TEST(ShortcutUtils, ParsesModifiersAndKey) {
    const utils::Shortcut s = utils::parseShortcut("Ctrl+Shift+K");
    EXPECT_TRUE(s.ctrl);
    EXPECT_TRUE(s.shift);
    EXPECT_FALSE(s.alt);
    EXPECT_FALSE(s.meta);
    EXPECT_EQ(s.key, "k");
}

TEST(ShortcutUtils, AcceptsModifierAliases) {
    const utils::Shortcut s = utils::parseShortcut("control+Option+Cmd+F5");
    EXPECT_TRUE(s.ctrl);
    EXPECT_TRUE(s.alt);
    EXPECT_TRUE(s.meta);
    EXPECT_EQ(s.key, "f5");
}

TEST(ShortcutUtils, UnknownModifierInvalidatesBinding) {
    EXPECT_FALSE(utils::parseShortcut("Hyper+K").isValid());
    EXPECT_FALSE(utils::parseShortcut("").isValid());
    EXPECT_FALSE(utils::parseShortcut("Ctrl+").isValid());
}

TEST(ShortcutUtils, MatchRequiresExactModifiers) {
    const utils::Shortcut s = utils::parseShortcut("Ctrl+N");
    EXPECT_TRUE(utils::matchesShortcut(s, true, false, false, false, "n"));
    EXPECT_TRUE(utils::matchesShortcut(s, true, false, false, false, "N"));
    EXPECT_FALSE(utils::matchesShortcut(s, true, true, false, false, "n"));
    EXPECT_FALSE(utils::matchesShortcut(s, false, false, false, false, "n"));
    EXPECT_FALSE(utils::matchesShortcut(s, true, false, false, false, "m"));
}

TEST(ShortcutUtils, BareKeyBinding) {
    const utils::Shortcut s = utils::parseShortcut("F1");
    EXPECT_TRUE(utils::matchesShortcut(s, false, false, false, false, "f1"));
    EXPECT_FALSE(utils::matchesShortcut(s, true, false, false, false, "f1"));
}
