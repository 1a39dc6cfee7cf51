/*!
 * @file        settings_utils.cppm
 * @brief       Dotted-path helpers over nested JSON settings documents.
 * @details     Provides path resolution, copy-on-write assignment and the
 *              deep merge used to fill a persisted settings document with
 *              compiled-in defaults.
 *
 *              Every helper works on values: the input documents are never
 *              modified, callers receive a new document and decide when to
 *              publish it.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <QStringList>

#ifndef Q_MOC_RUN
export module tondar.utils.settings_utils;
#endif

#ifdef Q_MOC_RUN
#define TONDAR_MODULE_EXPORT
#else
#define TONDAR_MODULE_EXPORT export
#endif

TONDAR_MODULE_EXPORT namespace tondar::utils {

/**
 * @brief Splits a dotted settings path into its segments.
 *
 * Returns an empty list when the path is empty or contains an empty
 * segment ("app..theme", ".app", "app.").
 */
QStringList splitSettingsPath(const QString& path);

/**
 * @brief Resolves a dotted path against a document.
 *
 * @return The value at the path, or an undefined QJsonValue when any
 *         segment is missing or traverses a non-object value.
 */
QJsonValue valueAtPath(const QJsonObject& document, const QString& path);

/**
 * @brief Returns a copy of @p document with @p value assigned at @p path.
 *
 * Missing intermediate groups are created. The input document is left
 * untouched.
 */
QJsonObject withValueAtPath(const QJsonObject& document, const QString& path, const QJsonValue& value);

/**
 * @brief Deep-merges @p overlay over @p defaults.
 *
 * Values present in the overlay win at every path. Nested objects are
 * merged recursively so keys missing from the overlay keep their default.
 * A non-object overlay value never replaces a default group.
 * Keys unknown to the defaults are carried over unchanged.
 */
QJsonObject deepMerge(const QJsonObject& defaults, const QJsonObject& overlay);

/**
 * @brief Lists the dotted paths of every leaf value of a document.
 */
QStringList leafPaths(const QJsonObject& document);

} // namespace tondar::utils
