#include <QGuiApplication>
#include <QCoreApplication>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QQmlApplicationEngine>
#include <QQmlContext>
#include <QQuickStyle>
#include <QStandardPaths>
#include <QDir>

import tondar.core.downloadmodel;
import tondar.core.shellbus;
import tondar.services.socket_engine;
import tondar.services.history_store;

#ifndef APP_VERSION
#define APP_VERSION "0.1.0"
#endif

int main(int argc, char *argv[])
{
    QGuiApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("Genyleap"));
    QCoreApplication::setApplicationName(QStringLiteral("Tondar"));
    QCoreApplication::setApplicationVersion(QStringLiteral(APP_VERSION));
    QQuickStyle::setStyle("Basic");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Tondar download manager"));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption engineOption(QStringLiteral("engine-server"),
                                          QStringLiteral("Local socket name of the download engine."),
                                          QStringLiteral("name"),
                                          QStringLiteral("tondar-engine"));
    const QCommandLineOption configOption(QStringLiteral("config-dir"),
                                          QStringLiteral("Directory holding settings and history."),
                                          QStringLiteral("path"));
    parser.addOption(engineOption);
    parser.addOption(configOption);
    parser.process(app);

    QString configDir = parser.value(configOption);
    QString dataDir = configDir;
    if (configDir.isEmpty()) {
        configDir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
        dataDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    }

    // Settings: defaults and the fast-path cache now, the persisted document in the background.
    JsonFileSettingsBackend settingsBackend(QDir(configDir).filePath(QStringLiteral("config.json")));
    FastPathCache fastPath;
    SettingsStore settings(&settingsBackend, &fastPath);

    SocketEngine engineChannel(parser.value(engineOption));
    DownloadRegistry registry(&engineChannel);
    SelectionSet selection;
    ShellBus shell(&settings);

    HistoryStore history(&registry, &settings, QDir(dataDir).filePath(QStringLiteral("history.json")));
    QObject::connect(&settings, &SettingsStore::readyChanged, &history, [&history]() { history.restore(); });

    DownloadModel overviewModel(&registry);
    DownloadModel historyModel(&registry);
    historyModel.setView(DownloadModel::HistoryView);

    // Drop selected ids that left the visible list.
    QObject::connect(&historyModel, &QAbstractItemModel::modelReset, &selection, [&selection, &historyModel]() {
        selection.retainOnly(historyModel.ids());
    });
    QObject::connect(&shell, &ShellBus::quitRequested, &app, &QCoreApplication::quit, Qt::QueuedConnection);

    // Set up QML engine
    QQmlApplicationEngine engine;

    engine.rootContext()->setContextProperty("settingsStore", &settings);
    engine.rootContext()->setContextProperty("downloadRegistry", &registry);
    engine.rootContext()->setContextProperty("engineChannel", &engineChannel);
    engine.rootContext()->setContextProperty("selection", &selection);
    engine.rootContext()->setContextProperty("shellBus", &shell);
    engine.rootContext()->setContextProperty("overviewModel", &overviewModel);
    engine.rootContext()->setContextProperty("historyModel", &historyModel);

    // Handle QML loading errors
    QObject::connect(
        &engine,
        &QQmlApplicationEngine::objectCreationFailed,
        &app,
        []() { QCoreApplication::exit(-1); },
        Qt::QueuedConnection);
    engine.loadFromModule("Tondar", "Main");

    if (engine.rootObjects().isEmpty())
        return -1;

    settings.load();
    engineChannel.connectToEngine();

    return app.exec();
}
