/*!
 * @file        category_utils.cppm
 * @brief       File type classification helpers for download rows.
 * @details     Maps a download's file name to a coarse category (Video, Audio,
 *              Archives, ...) and to the short extension badge shown next to
 *              each row in the overview and history views.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QString>

#ifndef Q_MOC_RUN
export module tondar.utils.category_utils;
#endif

#ifdef Q_MOC_RUN
#define TONDAR_MODULE_EXPORT
#else
#define TONDAR_MODULE_EXPORT export
#endif

TONDAR_MODULE_EXPORT namespace tondar::utils {

/**
 * @brief Detects the category of a file from its extension.
 *
 * @param fileName File name or path.
 * @return One of "Video", "Audio", "Images", "Archives", "Documents",
 *         "Programs" or "Other".
 */
QString detectCategory(const QString& fileName);

/**
 * @brief Returns the upper-case extension of a file name.
 *
 * Names without an extension yield "FILE".
 */
QString extensionLabel(const QString& fileName);

} // namespace tondar::utils
