/*!
 * @file        shortcut_utils.cppm
 * @brief       Keyboard shortcut parsing and matching.
 * @details     Shortcut bindings are stored in the settings document as
 *              plain strings such as "Ctrl+Shift+K". These helpers turn a
 *              binding into its modifiers and key and match it against a
 *              key press reported by the UI layer.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QString>

#ifndef Q_MOC_RUN
export module tondar.utils.shortcut_utils;
#endif

#ifdef Q_MOC_RUN
#define TONDAR_MODULE_EXPORT
#else
#define TONDAR_MODULE_EXPORT export
#endif

TONDAR_MODULE_EXPORT namespace tondar::utils {

/**
 * @brief Parsed form of a shortcut binding.
 */
struct Shortcut {
    bool ctrl = false;
    bool shift = false;
    bool alt = false;
    bool meta = false;
    QString key;        //!< Lower-case key name, empty when the binding is invalid.

    bool isValid() const { return !key.isEmpty(); }
};

/**
 * @brief Parses a binding such as "Ctrl+Shift+K".
 *
 * Modifier names are case-insensitive ("Control" and "Cmd" are accepted
 * as aliases). The last segment is the key.
 */
Shortcut parseShortcut(const QString& binding);

/**
 * @brief Checks whether a key press matches a parsed binding.
 *
 * All four modifiers must match exactly and the key is compared
 * case-insensitively.
 */
bool matchesShortcut(const Shortcut& shortcut, bool ctrl, bool shift, bool alt, bool meta, const QString& key);

} // namespace tondar::utils
