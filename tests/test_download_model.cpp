/**
 * @file test_download_model.cpp
 * @brief Tests for the QML list model over registry views
 */

#include <gtest/gtest.h>

#include <QSignalSpy>
#include <QStringList>
#include <QVariantList>
#include <QVariantMap>

import tondar.core.downloadmodel;

#include "test_support.h"

using testing_support::FakeEngine;

namespace {

QVariant roleData(const DownloadModel& model, int row, int role) {
    return model.data(model.index(row), role);
}

}  // namespace

TEST(DownloadModel, ExposesOverviewRows) {
    FakeEngine engine;
    DownloadRegistry registry(&engine);
    DownloadModel model(&registry);

    engine.queue("a", "movie.mkv", 2048);
    emit engine.started("a");
    engine.progress("a", 1024, 2048, 512, 50);

    ASSERT_EQ(model.rowCount(), 1);
    EXPECT_EQ(roleData(model, 0, DownloadModel::IdRole).toString(), "a");
    EXPECT_EQ(roleData(model, 0, DownloadModel::StatusRole).toString(), "downloading");
    EXPECT_EQ(roleData(model, 0, DownloadModel::ProgressRole).toInt(), 50);
    EXPECT_EQ(roleData(model, 0, DownloadModel::CategoryRole).toString(), "Video");
    EXPECT_EQ(roleData(model, 0, DownloadModel::ExtensionRole).toString(), "MKV");
    EXPECT_EQ(roleData(model, 0, DownloadModel::SizeTextRole).toString(), "2.00 KB");
    EXPECT_EQ(roleData(model, 0, DownloadModel::SpeedTextRole).toString(), "512.00 B/s");
    EXPECT_EQ(roleData(model, 0, DownloadModel::TimeLeftRole).toString(), "0:02");
    EXPECT_FALSE(roleData(model, 0, DownloadModel::PendingRole).toBool());
}

TEST(DownloadModel, RoleNamesCoverEveryRole) {
    DownloadModel model(nullptr);
    const auto names = model.roleNames();
    for (const char* name : {"id", "url", "fileName", "size", "downloaded", "speed", "progress",
                             "status", "destination", "resumeSupported", "segments", "error",
                             "category", "extension", "sizeText", "speedText", "timeLeft", "pending"}) {
        EXPECT_TRUE(names.values().contains(QByteArray(name))) << name;
    }
}

TEST(DownloadModel, InPlaceUpdateEmitsDataChangedNotReset) {
    FakeEngine engine;
    DownloadRegistry registry(&engine);
    DownloadModel model(&registry);
    engine.queue("a");
    engine.queue("b");
    emit engine.started("a");
    emit engine.started("b");

    QSignalSpy resets(&model, &QAbstractItemModel::modelReset);
    QSignalSpy changes(&model, &QAbstractItemModel::dataChanged);
    engine.progress("b", 1, 10, 1, 0);

    EXPECT_EQ(resets.count(), 0);
    ASSERT_EQ(changes.count(), 1);
    EXPECT_EQ(changes.at(0).at(0).value<QModelIndex>().row(), 1);
}

TEST(DownloadModel, ReorderResetsModel) {
    FakeEngine engine;
    DownloadRegistry registry(&engine);
    DownloadModel model(&registry);
    engine.queue("a");
    engine.queue("b");
    emit engine.started("a");
    emit engine.started("b");

    QSignalSpy resets(&model, &QAbstractItemModel::modelReset);
    engine.progress("b", 9, 10, 1, 90);

    EXPECT_EQ(resets.count(), 1);
    EXPECT_EQ(model.ids(), (QStringList{"b", "a"}));
}

TEST(DownloadModel, HistoryViewAppliesFilter) {
    FakeEngine engine;
    DownloadRegistry registry(&engine);
    DownloadModel model(&registry);
    model.setView(DownloadModel::HistoryView);

    engine.queue("a");
    engine.queue("b");
    emit engine.started("a");
    emit engine.completed("b");

    EXPECT_EQ(model.ids(), (QStringList{"a", "b"}));

    QSignalSpy count(&model, &DownloadModel::countChanged);
    model.setFilter(DownloadModel::CompletedFilter);
    EXPECT_EQ(model.ids(), QStringList{"b"});
    EXPECT_EQ(count.count(), 1);

    model.setFilter(DownloadModel::IncompleteFilter);
    EXPECT_EQ(model.ids(), QStringList{"a"});
}

TEST(DownloadModel, SegmentsAndUnknownSize) {
    FakeEngine engine;
    DownloadRegistry registry(&engine);
    DownloadModel model(&registry);
    engine.queue("a", "noext");
    emit engine.started("a");

    tondar::ProgressEvent event;
    event.id = "a";
    event.segments = {{0, 40}, {60, 80}};
    emit engine.progressed(event);

    const QVariantList segments = roleData(model, 0, DownloadModel::SegmentsRole).toList();
    ASSERT_EQ(segments.size(), 2);
    EXPECT_EQ(segments[1].toMap().value("start").toInt(), 60);
    EXPECT_EQ(roleData(model, 0, DownloadModel::SizeTextRole).toString(), "Unknown");
    EXPECT_EQ(roleData(model, 0, DownloadModel::ExtensionRole).toString(), "FILE");
    EXPECT_EQ(roleData(model, 0, DownloadModel::TimeLeftRole).toString(), "--:--");
}

TEST(DownloadModel, IdAtOutOfRange) {
    DownloadModel model(nullptr);
    EXPECT_TRUE(model.idAt(0).isEmpty());
    EXPECT_EQ(model.rowCount(), 0);
}
