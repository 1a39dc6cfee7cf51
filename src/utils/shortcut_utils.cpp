module;
#include <QString>
#include <QStringList>

module tondar.utils.shortcut_utils;

namespace tondar::utils {

Shortcut parseShortcut(const QString& binding)
{
    Shortcut out;
    const QStringList parts = binding.split(QLatin1Char('+'));
    if (parts.isEmpty()) return out;

    for (int i = 0; i < parts.size() - 1; ++i) {
        const QString mod = parts.at(i).trimmed().toLower();
        if (mod == "ctrl" || mod == "control") out.ctrl = true;
        else if (mod == "shift") out.shift = true;
        else if (mod == "alt" || mod == "option") out.alt = true;
        else if (mod == "meta" || mod == "cmd" || mod == "super") out.meta = true;
        else return Shortcut();
    }
    out.key = parts.last().trimmed().toLower();
    return out;
}

bool matchesShortcut(const Shortcut& shortcut, bool ctrl, bool shift, bool alt, bool meta, const QString& key)
{
    if (!shortcut.isValid()) return false;
    return shortcut.ctrl == ctrl
        && shortcut.shift == shift
        && shortcut.alt == alt
        && shortcut.meta == meta
        && shortcut.key == key.trimmed().toLower();
}

} // namespace tondar::utils
