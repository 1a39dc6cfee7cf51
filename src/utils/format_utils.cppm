/*!
 * @file        format_utils.cppm
 * @brief       Human-readable formatting helpers for sizes, speeds and ETAs.
 * @details     Small, side-effect free helpers shared by the list model and
 *              the QML layer to render byte counts, transfer rates and the
 *              estimated time left of a download.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QString>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module tondar.utils.format_utils;
#endif

#ifdef Q_MOC_RUN
#define TONDAR_MODULE_EXPORT
#else
#define TONDAR_MODULE_EXPORT export
#endif

TONDAR_MODULE_EXPORT namespace tondar::utils {

/**
 * @brief Formats a byte count using binary (1024) units.
 *
 * Produces two decimals and one of the units B, KB, MB or GB,
 * e.g. "1.50 MB". Zero and negative values render as "0 B".
 *
 * @param bytes Byte count.
 * @return Formatted size string.
 */
QString formatSize(qint64 bytes);

/**
 * @brief Formats a transfer rate, e.g. "512.00 KB/s".
 */
QString formatSpeed(double bytesPerSecond);

/**
 * @brief Formats the estimated time left of a transfer.
 *
 * Returns "--:--" when the speed or the total is unknown, "m:ss" below
 * an hour and "Hh Mm" beyond it.
 *
 * @param downloaded Bytes already received.
 * @param total Total bytes expected.
 * @param bytesPerSecond Current transfer rate.
 * @return Formatted remaining time.
 */
QString formatTimeLeft(qint64 downloaded, qint64 total, double bytesPerSecond);

} // namespace tondar::utils
