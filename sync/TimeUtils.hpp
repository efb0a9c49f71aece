// Small time helpers shared by the transfer and archive passes.
#pragma once
#include <QDateTime>
#include <QString>
#include <ctime>
#include <string>

namespace fetchsync {

// Format epoch seconds in LOCAL time with a strftime pattern
// (e.g. "%Y%m%d%H%M"). Returns an empty string when the result does not fit.
inline std::string formatLocalTime(qint64 secs, const std::string &pattern) {
    if (pattern.empty())
        return {};
    const std::time_t t = static_cast<std::time_t>(secs);
    std::tm tmv{};
    if (!localtime_r(&t, &tmv))
        return {};
    char buf[256];
    const std::size_t n = std::strftime(buf, sizeof(buf), pattern.c_str(), &tmv);
    return std::string(buf, n);
}

// ISO-8601 local modification time as stored in the ledgers.
inline std::string isoModDate(const QDateTime &dt) {
    if (!dt.isValid())
        return {};
    return dt.toLocalTime().toString(Qt::ISODate).toStdString();
}

inline std::string isoModDate(quint64 secs) {
    if (secs == 0)
        return {};
    return isoModDate(QDateTime::fromSecsSinceEpoch(static_cast<qint64>(secs)));
}

} // namespace fetchsync
