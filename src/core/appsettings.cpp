module;
#include <QJsonObject>
#include <QJsonValue>
#include <QStandardPaths>
#include <QString>
#include <QStringList>
#include <limits>

module tondar.core.appsettings;
import tondar.utils.number_utils;

namespace tondar {

static bool readBool(const QJsonObject& obj, const char* key, bool fallback)
{
    const QJsonValue v = obj.value(QLatin1StringView(key));
    return v.isBool() ? v.toBool() : fallback;
}

static QString readString(const QJsonObject& obj, const char* key, const QString& fallback)
{
    const QJsonValue v = obj.value(QLatin1StringView(key));
    return v.isString() ? v.toString() : fallback;
}

static qint64 readInt64(const QJsonObject& obj, const char* key, qint64 fallback)
{
    const qint64 v = utils::readInt64(obj.value(QLatin1StringView(key)), -1);
    return v < 0 ? fallback : v;
}

static int readInt(const QJsonObject& obj, const char* key, int fallback)
{
    const int v = utils::readInt(obj.value(QLatin1StringView(key)), -1);
    return v < 0 ? fallback : v;
}

AppSettings AppSettings::defaults()
{
    AppSettings s;
    s.download.downloadLocation = QStandardPaths::writableLocation(QStandardPaths::DownloadLocation);
    return s;
}

AppSettings AppSettings::fromJson(const QJsonObject& document)
{
    const AppSettings d = defaults();
    AppSettings s = d;

    const QJsonObject app = document.value("app").toObject();
    s.app.showTrayIcon = readBool(app, "show_tray_icon", d.app.showTrayIcon);
    s.app.quitOnClose = readBool(app, "quit_on_close", d.app.quitOnClose);
    s.app.sidebar = readString(app, "sidebar", d.app.sidebar);
    s.app.theme = readString(app, "theme", d.app.theme);
    s.app.buttonLabel = readString(app, "button_label", d.app.buttonLabel);
    s.app.showDownloadProgress = readBool(app, "show_download_progress", d.app.showDownloadProgress);
    s.app.showSegmentProgress = readBool(app, "show_segment_progress", d.app.showSegmentProgress);
    s.app.autostart = readBool(app, "autostart", d.app.autostart);

    const QJsonObject keys = document.value("shortcuts").toObject();
    s.shortcuts.goHome = readString(keys, "go_home", d.shortcuts.goHome);
    s.shortcuts.openSettings = readString(keys, "open_settings", d.shortcuts.openSettings);
    s.shortcuts.addDownload = readString(keys, "add_download", d.shortcuts.addDownload);
    s.shortcuts.openDetails = readString(keys, "open_details", d.shortcuts.openDetails);
    s.shortcuts.openHistory = readString(keys, "open_history", d.shortcuts.openHistory);
    s.shortcuts.toggleSidebar = readString(keys, "toggle_sidebar", d.shortcuts.toggleSidebar);
    s.shortcuts.cancelDownload = readString(keys, "cancel_download", d.shortcuts.cancelDownload);
    s.shortcuts.quitApp = readString(keys, "quit_app", d.shortcuts.quitApp);

    const QJsonObject dl = document.value("download").toObject();
    s.download.downloadLocation = readString(dl, "download_location", d.download.downloadLocation);
    s.download.numThreads = readInt(dl, "num_threads", d.download.numThreads);
    s.download.chunkSize = readInt(dl, "chunk_size", d.download.chunkSize);
    s.download.socketBufferSize = readInt(dl, "socket_buffer_size", d.download.socketBufferSize);
    s.download.speedLimit = readInt64(dl, "speed_limit", d.download.speedLimit);

    const QJsonObject thread = document.value("thread").toObject();
    s.thread.totalConnections = readInt(thread, "total_connections", d.thread.totalConnections);
    s.thread.perTaskConnections = readInt(thread, "per_task_connections", d.thread.perTaskConnections);

    const QJsonObject session = document.value("session").toObject();
    s.session.history = readBool(session, "history", d.session.history);
    s.session.metadata = readBool(session, "metadata", d.session.metadata);

    s.sendAnonymousMetrics = readBool(document, "send_anonymous_metrics", d.sendAnonymousMetrics);
    s.showNotifications = readBool(document, "show_notifications", d.showNotifications);
    return s;
}

QJsonObject AppSettings::toJson() const
{
    QJsonObject appObj;
    appObj.insert("show_tray_icon", app.showTrayIcon);
    appObj.insert("quit_on_close", app.quitOnClose);
    appObj.insert("sidebar", app.sidebar);
    appObj.insert("theme", app.theme);
    appObj.insert("button_label", app.buttonLabel);
    appObj.insert("show_download_progress", app.showDownloadProgress);
    appObj.insert("show_segment_progress", app.showSegmentProgress);
    appObj.insert("autostart", app.autostart);

    QJsonObject keys;
    keys.insert("go_home", shortcuts.goHome);
    keys.insert("open_settings", shortcuts.openSettings);
    keys.insert("add_download", shortcuts.addDownload);
    keys.insert("open_details", shortcuts.openDetails);
    keys.insert("open_history", shortcuts.openHistory);
    keys.insert("toggle_sidebar", shortcuts.toggleSidebar);
    keys.insert("cancel_download", shortcuts.cancelDownload);
    keys.insert("quit_app", shortcuts.quitApp);

    QJsonObject dl;
    dl.insert("download_location", download.downloadLocation);
    dl.insert("num_threads", download.numThreads);
    dl.insert("chunk_size", download.chunkSize);
    dl.insert("socket_buffer_size", download.socketBufferSize);
    dl.insert("speed_limit", static_cast<double>(download.speedLimit));

    QJsonObject threadObj;
    threadObj.insert("total_connections", thread.totalConnections);
    threadObj.insert("per_task_connections", thread.perTaskConnections);

    QJsonObject sessionObj;
    sessionObj.insert("history", session.history);
    sessionObj.insert("metadata", session.metadata);

    QJsonObject root;
    root.insert("app", appObj);
    root.insert("shortcuts", keys);
    root.insert("download", dl);
    root.insert("thread", threadObj);
    root.insert("session", sessionObj);
    root.insert("send_anonymous_metrics", sendAnonymousMetrics);
    root.insert("show_notifications", showNotifications);
    return root;
}

QJsonObject defaultSettingsDocument()
{
    return AppSettings::defaults().toJson();
}

qint64 maxSettingValue(const QString& path)
{
    if (path == "download.speed_limit") return static_cast<qint64>(utils::kMaxSafeInteger);
    return std::numeric_limits<int>::max();
}

QStringList allowedSettingValues(const QString& path)
{
    if (path == "app.sidebar") return { "left", "right" };
    if (path == "app.theme") return { "light", "dark", "system" };
    if (path == "app.button_label") return { "text", "icon", "both" };
    return {};
}

} // namespace tondar
