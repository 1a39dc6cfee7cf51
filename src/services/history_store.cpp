module;
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSaveFile>
#include <QString>
#include <QTimer>
#include <QVector>
#include <QtGlobal>

module tondar.services.history_store;
import tondar.utils.number_utils;

namespace utils = tondar::utils;
using tondar::Download;

static const int kHistoryVersion = 1;

HistoryStore::HistoryStore(DownloadRegistry* registry,
                           SettingsStore* settings,
                           const QString& filePath,
                           QObject* parent)
    : QObject(parent),
    m_registry(registry),
    m_settings(settings),
    m_filePath(filePath)
{
    m_saveTimer.setSingleShot(true);
    m_saveTimer.setInterval(400);
    connect(&m_saveTimer, &QTimer::timeout, this, [this]() { saveNow(); });
    if (auto* app = QCoreApplication::instance()) {
        connect(app, &QCoreApplication::aboutToQuit, this, [this]() {
            if (m_saveTimer.isActive()) saveNow();
        });
    }

    if (registry) {
        connect(registry, &DownloadRegistry::downloadsChanged, this, &HistoryStore::scheduleSave);
    }
    if (settings) {
        connect(settings, &SettingsStore::valueChanged, this, [this](const QString& path) {
            if (path == QStringLiteral("session.history")) scheduleSave();
        });
    }
}

bool HistoryStore::isEnabled() const
{
    return m_settings && m_settings->isReady() && m_settings->settings().session.history;
}

void HistoryStore::scheduleSave()
{
    if (m_restoreInProgress || !isEnabled()) return;
    if (!m_saveTimer.isActive()) {
        m_saveTimer.start();
    }
}

int HistoryStore::restore()
{
    if (!isEnabled() || !m_registry) return 0;

    QFile file(m_filePath);
    if (!file.exists()) return 0;
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "Cannot open download history" << m_filePath << file.errorString();
        return 0;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "Ignoring malformed download history" << m_filePath << parseError.errorString();
        return 0;
    }

    QVector<Download> records;
    const QJsonArray items = doc.object().value("items").toArray();
    for (const QJsonValue& v : items) {
        Download d;
        if (decodeRecord(v.toObject(), &d)) records.append(d);
    }

    m_restoreInProgress = true;
    m_registry->restoreHistory(records);
    m_restoreInProgress = false;
    return records.size();
}

bool HistoryStore::saveNow()
{
    m_saveTimer.stop();
    if (!isEnabled() || !m_registry) return false;

    QJsonArray items;
    const QVector<Download> rows = m_registry->downloads();
    for (const Download& d : rows) {
        if (d.isTerminal()) items.append(encodeRecord(d));
    }

    QJsonObject root;
    root.insert("version", kHistoryVersion);
    root.insert("items", items);

    QString error;
    const QString dir = QFileInfo(m_filePath).absolutePath();
    QSaveFile file(m_filePath);
    if (!QDir().mkpath(dir)) {
        error = QStringLiteral("Cannot create directory %1").arg(dir);
    } else if (!file.open(QIODevice::WriteOnly)) {
        error = file.errorString();
    } else {
        file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
        if (!file.commit()) error = file.errorString();
    }

    if (!error.isEmpty()) {
        qWarning() << "Failed to save download history:" << error;
        emit saveFailed(error);
        return false;
    }
    return true;
}

QJsonObject HistoryStore::encodeRecord(const Download& download)
{
    QJsonObject obj;
    obj.insert("id", download.id);
    obj.insert("url", download.url);
    obj.insert("filename", download.fileName);
    obj.insert("destination", download.destination);
    obj.insert("size", static_cast<double>(download.size));
    obj.insert("downloaded", static_cast<double>(download.downloaded));
    obj.insert("progress", download.progress);
    obj.insert("status", tondar::statusToString(download.status));
    obj.insert("resume_supported", download.resumeSupported);
    if (!download.error.isEmpty()) obj.insert("error", download.error);
    obj.insert("added_at", static_cast<double>(download.addedAt));
    obj.insert("completed_at", static_cast<double>(download.completedAt));
    return obj;
}

bool HistoryStore::decodeRecord(const QJsonObject& object, Download* download)
{
    if (!download) return false;
    const QString id = object.value("id").toString();
    if (id.isEmpty()) return false;

    bool ok = false;
    const tondar::DownloadStatus status = tondar::statusFromString(object.value("status").toString(), &ok);
    if (!ok || !tondar::isTerminalStatus(status)) return false;

    Download d;
    d.id = id;
    d.url = object.value("url").toString();
    d.fileName = object.value("filename").toString();
    d.destination = object.value("destination").toString();
    d.size = utils::readInt64(object.value("size"), -1);
    d.downloaded = qMax<qint64>(0, utils::readInt64(object.value("downloaded"), 0));
    d.progress = qBound(0, utils::readInt(object.value("progress"), 0), 100);
    d.status = status;
    d.resumeSupported = object.value("resume_supported").toBool(false);
    if (status == tondar::DownloadStatus::Failed) {
        d.error = object.value("error").toString(QStringLiteral("Download failed"));
        if (d.error.isEmpty()) d.error = QStringLiteral("Download failed");
    }
    d.addedAt = utils::readInt64(object.value("added_at"), 0);
    d.completedAt = utils::readInt64(object.value("completed_at"), 0);
    *download = d;
    return true;
}
