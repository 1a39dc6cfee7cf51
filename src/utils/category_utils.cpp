module;
#include <QString>
#include <QStringList>

module tondar.utils.category_utils;

namespace tondar::utils {

static QString extensionOf(const QString& fileName)
{
    const int slash = qMax(fileName.lastIndexOf('/'), fileName.lastIndexOf('\\'));
    const QString base = slash >= 0 ? fileName.mid(slash + 1) : fileName;
    const int dot = base.lastIndexOf('.');
    if (dot <= 0 || dot == base.size() - 1) return QString();
    return base.mid(dot + 1);
}

QString detectCategory(const QString& fileName)
{
    const QString ext = extensionOf(fileName).toLower();

    static const QStringList video = { "mp4", "mkv", "mov", "avi", "webm" };
    static const QStringList audio = { "mp3", "wav", "aac", "flac", "m4a", "ogg" };
    static const QStringList images = { "jpg", "jpeg", "png", "gif", "bmp", "webp" };
    static const QStringList archives = { "zip", "rar", "7z", "tar", "gz", "bz2", "xz" };
    static const QStringList documents = { "pdf", "doc", "docx", "xls", "xlsx", "ppt", "pptx", "txt", "md" };
    static const QStringList programs = { "dmg", "exe", "msi", "pkg", "deb", "rpm", "appimage" };

    if (video.contains(ext)) return "Video";
    if (audio.contains(ext)) return "Audio";
    if (images.contains(ext)) return "Images";
    if (archives.contains(ext)) return "Archives";
    if (documents.contains(ext)) return "Documents";
    if (programs.contains(ext)) return "Programs";
    return "Other";
}

QString extensionLabel(const QString& fileName)
{
    const QString ext = extensionOf(fileName);
    return ext.isEmpty() ? QStringLiteral("FILE") : ext.toUpper();
}

} // namespace tondar::utils
