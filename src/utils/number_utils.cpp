module;
#include <QJsonValue>
#include <QtGlobal>
#include <QtNumeric>
#include <limits>

module tondar.utils.number_utils;

namespace tondar::utils {

bool isSafeInteger(double value)
{
    if (!qIsFinite(value)) return false;
    if (qAbs(value) > kMaxSafeInteger) return false;
    return static_cast<double>(static_cast<qint64>(value)) == value;
}

qint64 clampToInt64(double value)
{
    if (!qIsFinite(value)) return 0;
    // 2^63 is exactly representable; anything at or above it overflows.
    constexpr double limit = 9223372036854775808.0;
    if (value >= limit) return std::numeric_limits<qint64>::max();
    if (value < -limit) return std::numeric_limits<qint64>::min();
    return static_cast<qint64>(value);
}

qint64 readInt64(const QJsonValue& value, qint64 fallback)
{
    if (!value.isDouble()) return fallback;
    const double d = value.toDouble();
    if (!qIsFinite(d) || qAbs(d) > kMaxSafeInteger) return fallback;
    return static_cast<qint64>(d);
}

int readInt(const QJsonValue& value, int fallback)
{
    const qint64 wide = readInt64(value, fallback);
    if (wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max()) return fallback;
    return static_cast<int>(wide);
}

} // namespace tondar::utils
