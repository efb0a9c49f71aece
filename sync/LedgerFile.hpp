// Pipe-delimited, append-only text files shared by both ledgers.
#pragma once
#include <QString>
#include <functional>
#include <string>
#include <vector>

namespace fetchsync {

// Fields of one line, empty fields preserved. '|' is never escaped.
std::vector<std::string> splitLedgerLine(const std::string &line);
std::string joinLedgerFields(const std::vector<std::string> &fields);

// Opens, appends one line (newline added) and closes.
bool appendLedgerLine(const QString &path, const std::string &line,
                      QString &err);

// Calls fn(lineNumber, line) for each non-empty line with the line ending
// stripped. False when the file cannot be opened.
bool readLedgerLines(const QString &path,
                     const std::function<void(int, const std::string &)> &fn,
                     QString &err);

// True when the file is gone afterwards (including when it never existed).
bool removeLedgerFile(const QString &path, QString &err);

} // namespace fetchsync
