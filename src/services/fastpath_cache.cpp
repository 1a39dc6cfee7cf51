module;
#include <memory>
#include <QDebug>
#include <QJsonObject>
#include <QJsonValue>
#include <QSettings>
#include <QString>
#include <QStringList>

module tondar.services.fastpath_cache;

import tondar.core.appsettings;
import tondar.utils.settings_utils;

namespace utils = tondar::utils;

static QString settingsGroup()
{
    return QStringLiteral("fastpath");
}

static std::unique_ptr<QSettings> openSettings(const QString& iniPath)
{
    if (iniPath.isEmpty()) return std::make_unique<QSettings>();
    return std::make_unique<QSettings>(iniPath, QSettings::IniFormat);
}

FastPathCache::FastPathCache(const QString& iniPath)
    : m_iniPath(iniPath)
{
}

QStringList FastPathCache::mirroredPaths()
{
    return { QStringLiteral("app.theme"), QStringLiteral("app.sidebar") };
}

QJsonObject FastPathCache::read() const
{
    QJsonObject out;
    const auto settings = openSettings(m_iniPath);
    settings->beginGroup(settingsGroup());
    for (const QString& path : mirroredPaths()) {
        if (!settings->contains(path)) continue;
        const QString value = settings->value(path).toString();
        const QStringList allowed = tondar::allowedSettingValues(path);
        if (value.isEmpty() || (!allowed.isEmpty() && !allowed.contains(value))) continue;
        out = utils::withValueAtPath(out, path, value);
    }
    settings->endGroup();
    return out;
}

void FastPathCache::write(const QJsonObject& document)
{
    const auto settings = openSettings(m_iniPath);
    settings->beginGroup(settingsGroup());
    for (const QString& path : mirroredPaths()) {
        const QJsonValue value = utils::valueAtPath(document, path);
        if (value.isString()) settings->setValue(path, value.toString());
    }
    settings->endGroup();
    settings->sync();
    if (settings->status() != QSettings::NoError) {
        qWarning() << "Failed to update fast-path settings cache";
    }
}
