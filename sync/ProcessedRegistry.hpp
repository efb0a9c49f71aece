// Append-only ledger of transferred files; the source of truth for change
// detection between runs.
#pragma once
#include <QString>
#include <map>
#include <optional>
#include <string>
#include <tuple>

namespace fetchsync {

enum class Direction { Get, Put };

const char *directionName(Direction d);
std::optional<Direction> parseDirection(const std::string &s);

struct RegistryRecord {
    std::string moddate;
    std::string rawEntry; // listing line at transfer time
    std::string checksum; // MD5 of the local copy, may be empty
};

// One line per record: directory|filename|direction|moddate|rawEntry|checksum.
// The file is opened, appended to and closed for each record, so a crash can
// at worst leave one truncated trailing line. Loading skips malformed lines
// instead of failing: a damaged ledger only causes files to be fetched again.
class ProcessedRegistry {
public:
    enum class Attribute { ModDate, RawEntry, Checksum };

    ProcessedRegistry() = default;
    explicit ProcessedRegistry(const QString &path) : path_(path) {}

    // Rebuilds memory from path (which also becomes the append target).
    // Returns false when the file cannot be read; the registry is then empty
    // and every file counts as unprocessed.
    bool load(const QString &path);

    void setPath(const QString &path) { path_ = path; }
    const QString &path() const { return path_; }

    // Appends one line, then updates memory. On I/O failure memory is left
    // alone so the file is fetched again rather than treated as done.
    bool record(const std::string &directory, const std::string &filename,
                Direction direction, const std::string &moddate,
                const std::string &rawEntry, const std::string &checksum);

    std::optional<std::string> lookup(const std::string &directory,
                                      const std::string &filename,
                                      Direction direction,
                                      Attribute attribute) const;

    bool alreadyProcessed(const std::string &directory,
                          const std::string &filename, Direction direction,
                          Attribute attribute, const std::string &value) const;

    // Deletes the log and forgets everything (full resync).
    bool reset();
    // Deletes the log but keeps memory, so the next records start a
    // compacted log.
    bool restartLog();

    std::size_t size() const { return records_.size(); }
    int malformedLines() const { return malformed_; }

private:
    using Key = std::tuple<std::string, std::string, Direction>;

    QString path_;
    std::map<Key, RegistryRecord> records_;
    int malformed_ = 0;

    bool removeLog();
};

} // namespace fetchsync
