#include "LedgerFile.hpp"
#include <QFile>

namespace fetchsync {

std::vector<std::string> splitLedgerLine(const std::string &line) {
    std::vector<std::string> out;
    std::string::size_type start = 0;
    for (;;) {
        const auto bar = line.find('|', start);
        if (bar == std::string::npos) {
            out.push_back(line.substr(start));
            break;
        }
        out.push_back(line.substr(start, bar - start));
        start = bar + 1;
    }
    return out;
}

std::string joinLedgerFields(const std::vector<std::string> &fields) {
    std::string out;
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i)
            out += '|';
        out += fields[i];
    }
    return out;
}

bool appendLedgerLine(const QString &path, const std::string &line,
                      QString &err) {
    if (path.isEmpty()) {
        err = QStringLiteral("no ledger file configured");
        return false;
    }
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        err = f.errorString();
        return false;
    }
    const std::string data = line + "\n";
    const qint64 n = f.write(data.data(), static_cast<qint64>(data.size()));
    const bool flushed = f.flush();
    if (n != static_cast<qint64>(data.size()) || !flushed) {
        err = f.errorString();
        f.close();
        return false;
    }
    f.close();
    return true;
}

bool readLedgerLines(const QString &path,
                     const std::function<void(int, const std::string &)> &fn,
                     QString &err) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly | QIODevice::Text)) {
        err = f.errorString();
        return false;
    }
    int lineNo = 0;
    while (!f.atEnd()) {
        ++lineNo;
        std::string line = f.readLine().toStdString();
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
            line.pop_back();
        if (!line.empty())
            fn(lineNo, line);
    }
    return true;
}

bool removeLedgerFile(const QString &path, QString &err) {
    if (path.isEmpty() || !QFile::exists(path))
        return true;
    QFile f(path);
    if (!f.remove()) {
        err = f.errorString();
        return false;
    }
    return true;
}

} // namespace fetchsync
