module;
#include <QObject>
#include <QString>

module tondar.core.shellbus;

import tondar.utils.shortcut_utils;

namespace utils = tondar::utils;

ShellBus::ShellBus(SettingsStore* settings, QObject* parent)
    : QObject(parent),
    m_settings(settings)
{
}

void ShellBus::setHomeEmpty(bool empty)
{
    if (m_homeEmpty == empty) return;
    m_homeEmpty = empty;
    emit homeEmptyChanged(empty);
}

bool ShellBus::handleShortcut(bool ctrl, bool shift, bool alt, bool meta, const QString& key)
{
    if (!m_settings || !m_settings->isReady()) return false;

    const tondar::ShortcutConfig bindings = m_settings->settings().shortcuts;
    const auto matches = [&](const QString& binding) {
        return utils::matchesShortcut(utils::parseShortcut(binding), ctrl, shift, alt, meta, key);
    };

    // First matching binding wins.
    if (matches(bindings.goHome)) {
        emit navigationRequested(QStringLiteral("home"));
    } else if (matches(bindings.openSettings)) {
        emit navigationRequested(QStringLiteral("settings"));
    } else if (matches(bindings.addDownload)) {
        emit addDownloadRequested();
    } else if (matches(bindings.openDetails)) {
        emit navigationRequested(QStringLiteral("detail"));
    } else if (matches(bindings.openHistory)) {
        emit navigationRequested(QStringLiteral("history"));
    } else if (matches(bindings.toggleSidebar)) {
        if (m_homeEmpty) return false;
        emit sidebarToggleRequested();
    } else if (matches(bindings.cancelDownload)) {
        emit cancelDownloadRequested();
    } else if (matches(bindings.quitApp)) {
        emit quitRequested();
    } else {
        return false;
    }
    return true;
}
