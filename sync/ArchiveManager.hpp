// Local-side deduplication and archiving of processed files.
#pragma once
#include <QString>
#include <QStringList>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace fetchsync {

struct LocalFileStat {
    std::string directory; // absolute
    std::string name;
    std::string md5;
    std::string moddate; // ISO-8601 local time
};

// directory|filename|moddate|md5sum, one line per archived file. Same
// append and fail-open rules as ProcessedRegistry.
class ArchiveLedger {
public:
    enum class Attribute { ModDate, Checksum };

    bool load(const QString &path);
    void setPath(const QString &path) { path_ = path; }
    const QString &path() const { return path_; }

    bool record(const std::string &directory, const std::string &name,
                const std::string &moddate, const std::string &md5);
    std::optional<std::string> lookup(const std::string &directory,
                                      const std::string &name,
                                      Attribute attribute) const;
    bool alreadyProcessed(const std::string &directory, const std::string &name,
                          Attribute attribute, const std::string &value) const;
    bool reset();

    std::size_t size() const { return records_.size(); }

private:
    struct Entry {
        std::string moddate;
        std::string md5;
    };
    QString path_;
    std::map<std::pair<std::string, std::string>, Entry> records_;
};

struct ArchiveSummary {
    int pending = 0;
    int archived = 0;
    int skipped = 0;
    int failed = 0;
};

// Collects files per category from glob specs, then moves the ones whose
// content changed since the last run into the archive directory, optionally
// stamping the name with the file's modification time.
class ArchiveManager {
public:
    explicit ArchiveManager(ArchiveLedger &ledger);

    static bool statFile(const QString &path, LocalFileStat &out);

    // Remembers dir and creates it when missing.
    bool setArchiveDir(const QString &dir, std::string &err);
    const QString &archiveDir() const { return archiveDir_; }

    void setDateFormat(const std::string &fmt) { dateFormat_ = fmt; }
    const std::string &dateFormat() const { return dateFormat_; }
    void setTimestamp(bool on) { timestamp_ = on; }
    bool timestamp() const { return timestamp_; }

    // glob may carry sub-directories, wildcards included ("*/IDW*.txt").
    // Returns the number of files added to the category.
    int expandFileSpec(const QString &originDir, const QString &glob,
                       const std::string &category);
    int expandFileSpecs(const QString &originDir, const QStringList &globs,
                        const std::string &category);
    QStringList pending(const std::string &category) const;

    QString archiveName(const QString &path) const;
    bool archiveFile(const QString &path, std::string &err);

    bool alreadyProcessed(const QString &path) const;
    bool markProcessed(const QString &path);

    // Archives every pending file of category not already in the ledger,
    // then clears the category.
    ArchiveSummary processCategory(const std::string &category);

private:
    ArchiveLedger &ledger_;
    QString archiveDir_;
    std::string dateFormat_ = "%Y%m%d%H%M";
    bool timestamp_ = true;
    std::map<std::string, QStringList> pending_;

    bool isRecorded(const LocalFileStat &st) const;
};

} // namespace fetchsync
