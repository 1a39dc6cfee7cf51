/**
 * @file test_settings_utils.cpp
 * @brief Tests for dotted-path access and deep merge of settings documents
 */

#include <gtest/gtest.h>

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

import tondar.utils.settings_utils;

namespace utils = tondar::utils;

namespace {

QJsonObject parse(const char* json) {
    return QJsonDocument::fromJson(QByteArray(json)).object();
}

}  // namespace

TEST(SettingsUtils, SplitRejectsEmptySegments) {
    EXPECT_EQ(utils::splitSettingsPath("app.theme"), (QStringList{"app", "theme"}));
    EXPECT_TRUE(utils::splitSettingsPath("").isEmpty());
    EXPECT_TRUE(utils::splitSettingsPath("app..theme").isEmpty());
    EXPECT_TRUE(utils::splitSettingsPath(".app").isEmpty());
    EXPECT_TRUE(utils::splitSettingsPath("app.").isEmpty());
}

TEST(SettingsUtils, ValueAtPathResolvesNestedKeys) {
    const QJsonObject doc = parse(R"({"app":{"theme":"dark","nested":{"x":1}},"flag":true})");

    EXPECT_EQ(utils::valueAtPath(doc, "app.theme").toString(), "dark");
    EXPECT_EQ(utils::valueAtPath(doc, "app.nested.x").toInt(), 1);
    EXPECT_TRUE(utils::valueAtPath(doc, "flag").toBool());
    EXPECT_TRUE(utils::valueAtPath(doc, "app").isObject());
}

TEST(SettingsUtils, ValueAtPathMissingSegmentIsUndefined) {
    const QJsonObject doc = parse(R"({"app":{"theme":"dark"},"flag":true})");

    EXPECT_TRUE(utils::valueAtPath(doc, "app.missing").isUndefined());
    EXPECT_TRUE(utils::valueAtPath(doc, "nope.theme").isUndefined());
    EXPECT_TRUE(utils::valueAtPath(doc, "flag.inner").isUndefined());
    EXPECT_TRUE(utils::valueAtPath(doc, "").isUndefined());
}

TEST(SettingsUtils, WithValueAtPathCopiesAndCreatesGroups) {
    const QJsonObject doc = parse(R"({"app":{"theme":"dark","sidebar":"left"}})");

    const QJsonObject next = utils::withValueAtPath(doc, "app.theme", "light");
    EXPECT_EQ(utils::valueAtPath(next, "app.theme").toString(), "light");
    EXPECT_EQ(utils::valueAtPath(next, "app.sidebar").toString(), "left");
    EXPECT_EQ(utils::valueAtPath(doc, "app.theme").toString(), "dark");

    const QJsonObject created = utils::withValueAtPath(doc, "a.b.c", 3);
    EXPECT_EQ(utils::valueAtPath(created, "a.b.c").toInt(), 3);
}

TEST(SettingsUtils, DeepMergeKeepsDefaultsForMissingKeys) {
    const QJsonObject defaults = parse(R"({"app":{"theme":"system","sidebar":"left"},"session":{"history":false}})");
    const QJsonObject persisted = parse(R"({"app":{"theme":"dark"}})");

    const QJsonObject merged = utils::deepMerge(defaults, persisted);
    EXPECT_EQ(utils::valueAtPath(merged, "app.theme").toString(), "dark");
    EXPECT_EQ(utils::valueAtPath(merged, "app.sidebar").toString(), "left");
    EXPECT_FALSE(utils::valueAtPath(merged, "session.history").toBool(true));
}

TEST(SettingsUtils, DeepMergeKeepsUnknownKeysAndGroups) {
    const QJsonObject defaults = parse(R"({"app":{"theme":"system"}})");
    const QJsonObject persisted = parse(R"({"app":{"legacy":1},"extra":{"k":"v"},"app2":5})");

    const QJsonObject merged = utils::deepMerge(defaults, persisted);
    EXPECT_EQ(utils::valueAtPath(merged, "app.legacy").toInt(), 1);
    EXPECT_EQ(utils::valueAtPath(merged, "extra.k").toString(), "v");
    EXPECT_EQ(utils::valueAtPath(merged, "app2").toInt(), 5);
    EXPECT_EQ(utils::valueAtPath(merged, "app.theme").toString(), "system");
}

TEST(SettingsUtils, DeepMergeNeverReplacesGroupWithScalar) {
    const QJsonObject defaults = parse(R"({"app":{"theme":"system"}})");
    const QJsonObject persisted = parse(R"({"app":"broken"})");

    const QJsonObject merged = utils::deepMerge(defaults, persisted);
    EXPECT_EQ(utils::valueAtPath(merged, "app.theme").toString(), "system");
}

TEST(SettingsUtils, LeafPathsListsEveryScalar) {
    const QJsonObject doc = parse(R"({"a":{"b":1,"c":{"d":true}},"e":"x","f":[1,2]})");

    QStringList paths = utils::leafPaths(doc);
    paths.sort();
    EXPECT_EQ(paths, (QStringList{"a.b", "a.c.d", "e", "f"}));
}
