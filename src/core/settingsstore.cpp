module;
#include <QDebug>
#include <QFutureWatcher>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <QStringList>
#include <QVariant>
#include <QtConcurrent>

module tondar.core.settingsstore;

import tondar.utils.settings_utils;
import tondar.utils.number_utils;

namespace utils = tondar::utils;

using tondar::SettingsLoadResult;

static void setError(QString* error, const QString& message)
{
    if (error) *error = message;
}

SettingsStore::SettingsStore(SettingsBackend* backend, FastPathCache* cache, QObject* parent)
    : QObject(parent),
    m_backend(backend),
    m_cache(cache)
{
    m_document = tondar::defaultSettingsDocument();
    if (m_cache) m_document = utils::deepMerge(m_document, m_cache->read());
}

SettingsStore::~SettingsStore()
{
    // The worker dereferences the backend; do not let it outlive us.
    if (m_loadWatcher) m_loadWatcher->waitForFinished();
}

void SettingsStore::load()
{
    if (m_loading || m_ready) return;
    m_loading = true;

    if (!m_backend) {
        SettingsLoadResult result;
        result.error = QStringLiteral("No settings backend");
        applyLoaded(result);
        return;
    }

    SettingsBackend* backend = m_backend;
    m_loadWatcher = new QFutureWatcher<SettingsLoadResult>(this);
    connect(m_loadWatcher, &QFutureWatcher<SettingsLoadResult>::finished, this, [this]() {
        SettingsLoadResult result;
        if (m_loadWatcher->future().resultCount() > 0) {
            result = m_loadWatcher->result();
        } else {
            result.error = QStringLiteral("Settings load was cancelled");
        }
        m_loadWatcher->deleteLater();
        m_loadWatcher = nullptr;
        applyLoaded(result);
    });

    m_loadWatcher->setFuture(QtConcurrent::run([backend]() {
        SettingsLoadResult result;
        result.ok = backend->load(&result.document, &result.error);
        return result;
    }));
}

void SettingsStore::applyLoaded(const SettingsLoadResult& result)
{
    if (result.ok) {
        const QJsonObject merged = utils::deepMerge(tondar::defaultSettingsDocument(), result.document);
        m_document = merged;
        if (merged != result.document) {
            QString error;
            if (!m_backend->save(merged, &error)) {
                qWarning() << "Failed to write merged settings:" << error;
            }
        }
        mirrorFastPath();
    } else {
        // Keep serving defaults plus the cached fast-path values.
        qWarning() << "Failed to load settings:" << result.error;
    }

    m_loading = false;
    m_ready = true;
    qInfo() << "Settings ready";
    emit settingsChanged();
    emit readyChanged();
}

QJsonValue SettingsStore::value(const QString& path) const
{
    return utils::valueAtPath(m_document, path);
}

QVariant SettingsStore::get(const QString& path) const
{
    const QJsonValue v = value(path);
    if (v.isUndefined()) return QVariant();
    return v.toVariant();
}

bool SettingsStore::isKnownPath(const QString& path)
{
    const QJsonValue d = utils::valueAtPath(tondar::defaultSettingsDocument(), path);
    return !d.isUndefined() && !d.isObject();
}

bool SettingsStore::setValue(const QString& path, const QJsonValue& value, QString* error)
{
    if (!m_ready) {
        setError(error, QStringLiteral("Settings are not loaded yet"));
        return false;
    }

    const QJsonValue schema = utils::valueAtPath(tondar::defaultSettingsDocument(), path);
    if (schema.isUndefined() || schema.isObject()) {
        setError(error, QStringLiteral("Unknown setting key: %1").arg(path));
        return false;
    }
    if (value.type() != schema.type()) {
        setError(error, QStringLiteral("Invalid value type for %1").arg(path));
        return false;
    }
    if (value.isDouble()) {
        const double d = value.toDouble();
        if (d < 0) {
            setError(error, QStringLiteral("Value of %1 must not be negative").arg(path));
            return false;
        }
        if (d > static_cast<double>(tondar::maxSettingValue(path))) {
            setError(error, QStringLiteral("Value of %1 is out of range").arg(path));
            return false;
        }
        if (!utils::isSafeInteger(d)) {
            setError(error, QStringLiteral("Value of %1 must be a whole number").arg(path));
            return false;
        }
    }
    const QStringList allowed = tondar::allowedSettingValues(path);
    if (!allowed.isEmpty() && !allowed.contains(value.toString())) {
        setError(error, QStringLiteral("Invalid value for %1: %2").arg(path, value.toString()));
        return false;
    }

    if (utils::valueAtPath(m_document, path) == value) return true;

    const QJsonObject next = utils::withValueAtPath(m_document, path, value);
    QString saveError;
    if (!m_backend || !m_backend->save(next, &saveError)) {
        if (!m_backend) saveError = QStringLiteral("No settings backend");
        qWarning() << "Failed to save settings:" << saveError;
        setError(error, saveError);
        return false;
    }

    m_document = next;
    if (FastPathCache::mirroredPaths().contains(path)) mirrorFastPath();
    emit valueChanged(path);
    emit settingsChanged();
    return true;
}

bool SettingsStore::set(const QString& path, const QVariant& value)
{
    QString error;
    const bool ok = setValue(path, QJsonValue::fromVariant(value), &error);
    setLastError(ok ? QString() : error);
    return ok;
}

tondar::AppSettings SettingsStore::settings() const
{
    return tondar::AppSettings::fromJson(m_document);
}

QJsonObject SettingsStore::backendSettings() const
{
    QJsonObject out;
    for (const char* group : { "download", "thread", "session" }) {
        out.insert(QLatin1StringView(group), m_document.value(QLatin1StringView(group)));
    }
    return out;
}

QString SettingsStore::theme() const
{
    return value(QStringLiteral("app.theme")).toString();
}

QString SettingsStore::sidebar() const
{
    return value(QStringLiteral("app.sidebar")).toString();
}

bool SettingsStore::showDownloadProgress() const
{
    return value(QStringLiteral("app.show_download_progress")).toBool(true);
}

void SettingsStore::mirrorFastPath()
{
    if (m_cache) m_cache->write(m_document);
}

void SettingsStore::setLastError(const QString& error)
{
    if (m_lastError == error) return;
    m_lastError = error;
    emit lastErrorChanged();
}
