// Archive ledger and ArchiveManager tests on a scratch directory tree.
#include "ArchiveManager.hpp"

#include <QCryptographicHash>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include <cstdlib>
#include <iostream>
#include <string>

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

using Attr = fetchsync::ArchiveLedger::Attribute;

const QDateTime kStamp(QDate(2024, 1, 2), QTime(12, 30));

// Writes data to path and sets its modification time.
bool makeFile(const QString &path, const QByteArray &data,
              const QDateTime &mtime = kStamp) {
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate))
        return false;
    if (f.write(data) != data.size() || !f.flush())
        return false;
    const bool ok = f.setFileTime(mtime, QFileDevice::FileModificationTime);
    f.close();
    return ok;
}

void test_archive_name(TestContext &t) {
    QTemporaryDir tmp;
    fetchsync::ArchiveLedger ledger;
    fetchsync::ArchiveManager am(ledger);
    std::string err;
    const QString arch = tmp.filePath("archive");
    t.check(am.setArchiveDir(arch, err), "setArchiveDir should succeed");
    t.check(QDir(arch).exists(), "the archive directory should be created");
    am.setDateFormat("%Y%m%d");

    const QString foo = tmp.filePath("in/foo.txt");
    t.check(makeFile(foo, "x"), "fixture file should be written");
    t.check(am.archiveName(foo) == QDir(arch).filePath("foo.20240102.txt"),
            "timestamped name inserts the modification date");

    am.setTimestamp(false);
    t.check(am.archiveName(foo) == QDir(arch).filePath("foo.txt"),
            "without timestamping the name is unchanged");

    am.setTimestamp(true);
    const QString readme = tmp.filePath("in/README");
    makeFile(readme, "x");
    t.check(am.archiveName(readme) == QDir(arch).filePath("README.20240102"),
            "files without an extension get base.stamp");

    const QString tarball = tmp.filePath("in/a.tar.gz");
    makeFile(tarball, "x");
    t.check(am.archiveName(tarball) ==
                QDir(arch).filePath("a.tar.20240102.gz"),
            "only the last extension is kept after the stamp");

    am.setDateFormat("%Y%m%d%H%M");
    t.check(am.archiveName(foo) == QDir(arch).filePath("foo.202401021230.txt"),
            "the default-style pattern includes hours and minutes");
}

void test_set_archive_dir_failure(TestContext &t) {
    QTemporaryDir tmp;
    const QString blocker = tmp.filePath("file");
    makeFile(blocker, "x");
    fetchsync::ArchiveLedger ledger;
    fetchsync::ArchiveManager am(ledger);
    std::string err;
    t.check(!am.setArchiveDir(blocker + "/sub", err),
            "an archive dir below a regular file cannot be created");
    t.check(!err.empty(), "the failure should be described");
    t.check(!am.setArchiveDir(QString(), err), "an empty dir is rejected");
}

void test_stat_file(TestContext &t) {
    QTemporaryDir tmp;
    const QString p = tmp.filePath("obs.csv");
    makeFile(p, "t,p\n");
    fetchsync::LocalFileStat st;
    t.check(fetchsync::ArchiveManager::statFile(p, st), "stat should succeed");
    t.check(st.name == "obs.csv", "stat gives the file name");
    t.check(st.directory == QFileInfo(p).absolutePath().toStdString(),
            "stat gives the absolute directory");
    t.check(st.md5 == QCryptographicHash::hash("t,p\n", QCryptographicHash::Md5)
                          .toHex()
                          .toStdString(),
            "stat gives the content MD5");
    t.check(st.moddate.rfind("2024-01-02T12:30:00", 0) == 0,
            "stat gives the ISO modification time");
    t.check(!fetchsync::ArchiveManager::statFile(tmp.filePath("none"), st),
            "stat of a missing file fails");
}

void test_expand_file_spec(TestContext &t) {
    QTemporaryDir tmp;
    const QString origin = tmp.filePath("origin");
    makeFile(origin + "/a.txt", "a");
    makeFile(origin + "/b.txt", "b");
    makeFile(origin + "/empty.txt", "");
    makeFile(origin + "/c.log", "c");
    makeFile(origin + "/sub/d.txt", "d");

    fetchsync::ArchiveLedger ledger;
    fetchsync::ArchiveManager am(ledger);
    t.check(am.expandFileSpec(origin, "*.txt", "obs") == 2,
            "zero-byte files are skipped");
    t.check(am.expandFileSpec(origin, "a.*", "obs") == 0,
            "already-listed files are not added twice");
    t.check(am.expandFileSpec(origin, "sub/*.txt", "obs") == 1,
            "a glob may carry a sub-directory");
    t.check(am.pending("obs").size() == 3, "three files are pending");
    t.check(am.expandFileSpecs(origin, {"*.log", "*.none"}, "logs") == 1,
            "expandFileSpecs applies every glob");
    t.check(am.pending("logs").size() == 1 && am.pending("obs").size() == 3,
            "categories are kept apart");
    t.check(am.pending("unknown").isEmpty(), "unknown categories are empty");
}

void test_expand_wildcard_directories(TestContext &t) {
    QTemporaryDir tmp;
    const QString origin = tmp.filePath("origin");
    makeFile(origin + "/north/IDW1.txt", "1");
    makeFile(origin + "/south/IDW2.txt", "2");
    makeFile(origin + "/south/other.txt", "3");
    makeFile(origin + "/top/deep/IDW3.txt", "4");

    fetchsync::ArchiveLedger ledger;
    fetchsync::ArchiveManager am(ledger);
    t.check(am.expandFileSpec(origin, "*/IDW*.txt", "obs") == 2,
            "a wildcard directory part matches every sub-directory");
    t.check(am.expandFileSpec(origin, "t?p/*/IDW*.txt", "obs") == 1,
            "wildcards may appear in several directory parts");
    t.check(am.expandFileSpec(origin, "missing/*/IDW*.txt", "obs") == 0,
            "a missing directory part matches nothing");
    t.check(am.expandFileSpec(origin + "/*", "IDW2.txt", "obs") == 0,
            "files already listed through a wildcard are not added twice");
    t.check(am.pending("obs").size() == 3, "three files are pending");
}

void test_process_category(TestContext &t) {
    QTemporaryDir tmp;
    const QString origin = tmp.filePath("origin");
    const QString arch = tmp.filePath("archive");
    const QString ledgerPath = tmp.filePath("archive.dat");
    makeFile(origin + "/a.txt", "alpha");
    makeFile(origin + "/b.txt", "beta");

    {
        fetchsync::ArchiveLedger ledger;
        ledger.setPath(ledgerPath);
        fetchsync::ArchiveManager am(ledger);
        std::string err;
        am.setArchiveDir(arch, err);
        am.setDateFormat("%Y%m%d");
        am.expandFileSpec(origin, "*.txt", "obs");
        const auto s = am.processCategory("obs");
        t.check(s.pending == 2 && s.archived == 2 && s.skipped == 0,
                "both files should be archived");
        t.check(QFile::exists(arch + "/a.20240102.txt") &&
                    QFile::exists(arch + "/b.20240102.txt"),
                "archived files carry the date stamp");
        t.check(!QFile::exists(origin + "/a.txt"),
                "archiving moves the file");
        t.check(am.pending("obs").isEmpty(), "processing clears the category");
        t.check(ledger.size() == 2, "archived files are recorded");
    }

    // Next run: the same file reappears unchanged, b changed.
    makeFile(origin + "/a.txt", "alpha");
    makeFile(origin + "/b.txt", "beta v2");
    fetchsync::ArchiveLedger ledger;
    t.check(ledger.load(ledgerPath), "archive ledger should reload");
    fetchsync::ArchiveManager am(ledger);
    std::string err;
    am.setArchiveDir(arch, err);
    t.check(am.alreadyProcessed(origin + "/a.txt"),
            "identical content and date are already processed");
    t.check(!am.alreadyProcessed(origin + "/b.txt"),
            "changed content is not processed");
    am.expandFileSpec(origin, "*.txt", "obs");
    const auto s = am.processCategory("obs");
    t.check(s.skipped == 1 && s.archived == 1, "only the changed file moves");
    t.check(QFile::exists(origin + "/a.txt"), "skipped files stay in place");
}

void test_moddate_change_is_not_processed(TestContext &t) {
    QTemporaryDir tmp;
    fetchsync::ArchiveLedger ledger;
    ledger.setPath(tmp.filePath("archive.dat"));
    fetchsync::ArchiveManager am(ledger);
    const QString p = tmp.filePath("x.txt");
    makeFile(p, "same");
    t.check(am.markProcessed(p), "markProcessed should record the file");
    t.check(am.alreadyProcessed(p), "marked file is processed");
    makeFile(p, "same", kStamp.addDays(1));
    t.check(!am.alreadyProcessed(p),
            "a new modification time alone means not processed");
}

void test_archive_ledger(TestContext &t) {
    QTemporaryDir tmp;
    const QString path = tmp.filePath("archive.dat");
    QFile f(path);
    f.open(QIODevice::WriteOnly);
    f.write("/data|a.txt|2024-01-02T12:30:00|abc\n"
            "broken line\n"
            "/data|b.txt|2024-01-02T12:30:00\n");
    f.close();

    fetchsync::ArchiveLedger ledger;
    t.check(ledger.load(path), "ledger with bad lines still loads");
    t.check(ledger.size() == 1, "only well-formed lines are kept");
    t.check(ledger.alreadyProcessed("/data", "a.txt", Attr::Checksum, "abc"),
            "checksum lookup");
    t.check(!ledger.alreadyProcessed("/data", "a.txt", Attr::Checksum, "abd"),
            "different checksum is not processed");
    t.check(ledger.record("/data", "c.txt", "d", "m"), "record appends");
    t.check(ledger.lookup("/data", "c.txt", Attr::ModDate) ==
                std::optional<std::string>("d"),
            "recorded moddate is available");
    t.check(ledger.reset() && ledger.size() == 0 && !QFile::exists(path),
            "reset clears memory and the file");

    fetchsync::ArchiveLedger missing;
    t.check(!missing.load(tmp.filePath("none.dat")),
            "a missing archive ledger reports false");
}

} // namespace

int main() {
    TestContext t;
    test_archive_name(t);
    test_set_archive_dir_failure(t);
    test_stat_file(t);
    test_expand_file_spec(t);
    test_expand_wildcard_directories(t);
    test_process_category(t);
    test_moddate_change_is_not_processed(t);
    test_archive_ledger(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] fetchsync_archive_tests\n";
    return EXIT_SUCCESS;
}
