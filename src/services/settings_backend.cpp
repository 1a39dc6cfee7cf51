module;
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSaveFile>
#include <QString>

module tondar.services.settings_backend;

static const char* const kSettingsKey = "settings";

static void setError(QString* error, const QString& message)
{
    if (error) *error = message;
}

JsonFileSettingsBackend::JsonFileSettingsBackend(const QString& filePath)
    : m_filePath(filePath)
{
}

bool JsonFileSettingsBackend::load(QJsonObject* document, QString* error)
{
    if (!document) return false;
    *document = QJsonObject();

    QFile file(m_filePath);
    if (!file.exists()) return true;
    if (!file.open(QIODevice::ReadOnly)) {
        setError(error, QStringLiteral("Cannot open %1: %2").arg(m_filePath, file.errorString()));
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        setError(error, QStringLiteral("Malformed settings file %1: %2").arg(m_filePath, parseError.errorString()));
        return false;
    }
    if (!doc.isObject()) {
        setError(error, QStringLiteral("Settings file %1 is not a JSON object").arg(m_filePath));
        return false;
    }

    *document = doc.object().value(kSettingsKey).toObject();
    return true;
}

bool JsonFileSettingsBackend::save(const QJsonObject& document, QString* error)
{
    const QString dir = QFileInfo(m_filePath).absolutePath();
    if (!QDir().mkpath(dir)) {
        setError(error, QStringLiteral("Cannot create directory %1").arg(dir));
        return false;
    }

    QJsonObject root;
    root.insert(kSettingsKey, document);

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        setError(error, QStringLiteral("Cannot write %1: %2").arg(m_filePath, file.errorString()));
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        setError(error, QStringLiteral("Cannot write %1: %2").arg(m_filePath, file.errorString()));
        return false;
    }
    return true;
}
