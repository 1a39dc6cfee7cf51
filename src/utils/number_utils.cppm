/*!
 * @file        number_utils.cppm
 * @brief       Range-checked conversions of JSON numbers to integers.
 * @details     JSON numbers arrive as doubles from the engine socket, the
 *              settings file, the history file and QML. These helpers convert
 *              them to integer fields only when the value is exactly
 *              representable, and fall back otherwise.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QJsonValue>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module tondar.utils.number_utils;
#endif

#ifdef Q_MOC_RUN
#define TONDAR_MODULE_EXPORT
#else
#define TONDAR_MODULE_EXPORT export
#endif

TONDAR_MODULE_EXPORT namespace tondar::utils {

//!< @brief Largest magnitude a double holds without losing integer precision (2^53).
inline constexpr double kMaxSafeInteger = 9007199254740992.0;

/**
 * @brief True for finite whole numbers within +/- 2^53.
 */
bool isSafeInteger(double value);

/**
 * @brief Clamps a double into the qint64 range and truncates it.
 *
 * Non-finite values map to 0.
 */
qint64 clampToInt64(double value);

/**
 * @brief Reads a JSON number as a 64-bit integer.
 *
 * Fractions are truncated. Values that are not numbers, not finite or
 * beyond +/- 2^53 yield the fallback.
 */
qint64 readInt64(const QJsonValue& value, qint64 fallback);

/**
 * @brief Reads a JSON number as an int; out-of-range values yield the fallback.
 */
int readInt(const QJsonValue& value, int fallback);

} // namespace tondar::utils
