module;
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <QStringList>

module tondar.utils.settings_utils;

namespace tondar::utils {

QStringList splitSettingsPath(const QString& path)
{
    if (path.isEmpty()) return {};
    const QStringList parts = path.split(QLatin1Char('.'));
    for (const QString& part : parts) {
        if (part.isEmpty()) return {};
    }
    return parts;
}

QJsonValue valueAtPath(const QJsonObject& document, const QString& path)
{
    const QStringList parts = splitSettingsPath(path);
    if (parts.isEmpty()) return QJsonValue(QJsonValue::Undefined);

    QJsonValue node(document);
    for (const QString& part : parts) {
        if (!node.isObject()) return QJsonValue(QJsonValue::Undefined);
        const QJsonObject obj = node.toObject();
        if (!obj.contains(part)) return QJsonValue(QJsonValue::Undefined);
        node = obj.value(part);
    }
    return node;
}

static QJsonObject assignAt(const QJsonObject& node, const QStringList& parts, int depth, const QJsonValue& value)
{
    QJsonObject out = node;
    const QString& key = parts.at(depth);
    if (depth == parts.size() - 1) {
        out.insert(key, value);
        return out;
    }
    const QJsonObject child = out.value(key).toObject();
    out.insert(key, assignAt(child, parts, depth + 1, value));
    return out;
}

QJsonObject withValueAtPath(const QJsonObject& document, const QString& path, const QJsonValue& value)
{
    const QStringList parts = splitSettingsPath(path);
    if (parts.isEmpty()) return document;
    return assignAt(document, parts, 0, value);
}

QJsonObject deepMerge(const QJsonObject& defaults, const QJsonObject& overlay)
{
    QJsonObject out = defaults;
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        const QJsonValue base = defaults.value(it.key());
        if (base.isObject()) {
            if (!it.value().isObject()) continue;
            out.insert(it.key(), deepMerge(base.toObject(), it.value().toObject()));
            continue;
        }
        out.insert(it.key(), it.value());
    }
    return out;
}

static void collectLeaves(const QJsonObject& node, const QString& prefix, QStringList& out)
{
    for (auto it = node.begin(); it != node.end(); ++it) {
        const QString path = prefix.isEmpty() ? it.key() : prefix + QLatin1Char('.') + it.key();
        if (it.value().isObject()) {
            collectLeaves(it.value().toObject(), path, out);
        } else {
            out.append(path);
        }
    }
}

QStringList leafPaths(const QJsonObject& document)
{
    QStringList out;
    collectLeaves(document, QString(), out);
    return out;
}

} // namespace tondar::utils
