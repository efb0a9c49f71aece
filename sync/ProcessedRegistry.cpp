#include "ProcessedRegistry.hpp"
#include "LedgerFile.hpp"
#include <QLoggingCategory>
Q_LOGGING_CATEGORY(fsRegistry, "fetchsync.registry")

namespace fetchsync {

const char *directionName(Direction d) {
    return d == Direction::Get ? "get" : "put";
}

std::optional<Direction> parseDirection(const std::string &s) {
    if (s == "get")
        return Direction::Get;
    if (s == "put")
        return Direction::Put;
    return std::nullopt;
}

bool ProcessedRegistry::load(const QString &path) {
    path_ = path;
    records_.clear();
    malformed_ = 0;

    QString err;
    const bool ok = readLedgerLines(
        path,
        [this, &path](int lineNo, const std::string &line) {
            const auto fields = splitLedgerLine(line);
            const auto dir = fields.size() == 6 ? parseDirection(fields[2])
                                                : std::nullopt;
            if (!dir) {
                ++malformed_;
                qCDebug(fsRegistry) << "Skipping malformed ledger line"
                                    << lineNo << "in" << path;
                return;
            }
            records_[Key{fields[0], fields[1], *dir}] =
                RegistryRecord{fields[3], fields[4], fields[5]};
        },
        err);
    if (!ok) {
        qCWarning(fsRegistry) << "Couldn't open ledger" << path << ":" << err
                              << "- all files will be processed";
        return false;
    }
    qCInfo(fsRegistry) << records_.size()
                       << "previously-processed files loaded from" << path;
    return true;
}

bool ProcessedRegistry::record(const std::string &directory,
                               const std::string &filename,
                               Direction direction, const std::string &moddate,
                               const std::string &rawEntry,
                               const std::string &checksum) {
    const std::string line = joinLedgerFields(
        {directory, filename, directionName(direction), moddate, rawEntry,
         checksum});
    QString err;
    if (!appendLedgerLine(path_, line, err)) {
        qCWarning(fsRegistry) << "Failed writing ledger" << path_ << ":" << err
                              << "-" << filename.c_str()
                              << "will be fetched again next run";
        return false;
    }
    records_[Key{directory, filename, direction}] =
        RegistryRecord{moddate, rawEntry, checksum};
    qCDebug(fsRegistry) << "Recorded" << directory.c_str() << filename.c_str()
                        << directionName(direction);
    return true;
}

std::optional<std::string>
ProcessedRegistry::lookup(const std::string &directory,
                          const std::string &filename, Direction direction,
                          Attribute attribute) const {
    auto it = records_.find(Key{directory, filename, direction});
    if (it == records_.end()) {
        qCDebug(fsRegistry) << "No ledger entry for" << directory.c_str()
                            << filename.c_str() << directionName(direction);
        return std::nullopt;
    }
    switch (attribute) {
    case Attribute::ModDate:
        return it->second.moddate;
    case Attribute::RawEntry:
        return it->second.rawEntry;
    case Attribute::Checksum:
        return it->second.checksum;
    }
    return std::nullopt;
}

bool ProcessedRegistry::alreadyProcessed(const std::string &directory,
                                         const std::string &filename,
                                         Direction direction,
                                         Attribute attribute,
                                         const std::string &value) const {
    const auto stored = lookup(directory, filename, direction, attribute);
    return stored && *stored == value;
}

bool ProcessedRegistry::removeLog() {
    QString err;
    if (!removeLedgerFile(path_, err)) {
        qCWarning(fsRegistry) << "Unable to delete ledger" << path_ << ":"
                              << err;
        return false;
    }
    return true;
}

bool ProcessedRegistry::reset() {
    qCInfo(fsRegistry) << "Forgetting all processed files";
    records_.clear();
    return removeLog();
}

bool ProcessedRegistry::restartLog() {
    qCInfo(fsRegistry) << "Starting a new ledger file" << path_;
    return removeLog();
}

} // namespace fetchsync
