module;
#include <QString>
#include <QtMath>
#include <cmath>

module tondar.utils.format_utils;
import tondar.utils.number_utils;

namespace tondar::utils {

QString formatSize(qint64 bytes)
{
    if (bytes <= 0) return QStringLiteral("0 B");
    static const char* units[] = { "B", "KB", "MB", "GB" };
    const double value = static_cast<double>(bytes);
    int unit = static_cast<int>(qFloor(qLn(value) / qLn(1024.0)));
    unit = qBound(0, unit, 3);
    const double scaled = value / qPow(1024.0, unit);
    return QStringLiteral("%1 %2").arg(scaled, 0, 'f', 2).arg(QLatin1StringView(units[unit]));
}

QString formatSpeed(double bytesPerSecond)
{
    return formatSize(clampToInt64(bytesPerSecond)) + QStringLiteral("/s");
}

QString formatTimeLeft(qint64 downloaded, qint64 total, double bytesPerSecond)
{
    if (bytesPerSecond <= 0.0 || total <= 0) return QStringLiteral("--:--");
    const qint64 remaining = qMax<qint64>(0, total - downloaded);
    const qint64 seconds = clampToInt64(std::ceil(static_cast<double>(remaining) / bytesPerSecond));
    const qint64 mins = seconds / 60;
    const qint64 secs = seconds % 60;
    if (mins > 60) {
        const qint64 hours = mins / 60;
        return QStringLiteral("%1h %2m").arg(hours).arg(mins % 60);
    }
    return QStringLiteral("%1:%2").arg(mins).arg(secs, 2, 10, QLatin1Char('0'));
}

} // namespace tondar::utils
