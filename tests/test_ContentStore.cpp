//Catch includes
#include <catch2/catch_test_macros.hpp>

//Our includes
#include "ContentStore.h"
#include "HashUtilities.h"
#include "RetentionPolicy.h"
#include "TransferError.h"
#include "TestUtilities.h"
#include "ArchiveBuilder.h"

//Qt includes
#include <QDateTime>
#include <QFile>
#include <QFileInfo>
#include <QLockFile>

using namespace HubTransfer;

namespace {

const RepoRef Model(QStringLiteral("owner/model"));
const RepoRef Dataset(QStringLiteral("owner/set"), RepoRef::Type::Dataset);

CacheEntry promoteBytes(ContentStore& store,
                        const RepoRef& repo,
                        const QString& path,
                        const QByteArray& content,
                        bool withChecksum = true)
{
    const QString temp = store.tempPathFor(path + QString::number(qHash(content)));
    REQUIRE(ArchiveBuilder::writeFile(temp, content));
    const QString sha = withChecksum ? HashUtilities::sha256Hex(content) : QString();
    const auto promoted = store.promote(temp, repo, QStringLiteral("main"), path, sha, QStringLiteral("etag-") + path);
    REQUIRE(!promoted.hasError());
    return promoted.value();
}

void setAccessTime(const QString& path, const QDateTime& when)
{
    QFile file(path);
    REQUIRE(file.open(QIODevice::ReadOnly));
    REQUIRE(file.setFileTime(when, QFileDevice::FileAccessTime));
}

}

TEST_CASE("ContentStore lays entries out by scope, revision and path", "[ContentStore]")
{
    const QDir root = TestUtilities::createUniqueTempDir();
    ContentStore store(root.absolutePath());

    CHECK(store.entryPath(Model, QStringLiteral("main"), QStringLiteral("dir/weights.bin"))
          == root.filePath(QStringLiteral("models--owner--model/main/dir/weights.bin")));
    CHECK(store.revisionPath(Dataset, QStringLiteral("refs/pr/1"))
          == root.filePath(QStringLiteral("datasets--owner--set/refs%2Fpr%2F1")));
}

TEST_CASE("ContentStore locates promoted entries", "[ContentStore]")
{
    const QDir root = TestUtilities::createUniqueTempDir();
    ContentStore store(root.absolutePath());

    const auto miss = store.locate(Model, QStringLiteral("main"), QStringLiteral("config.json"));
    REQUIRE(miss.hasError());
    CHECK(miss.errorCode() == errorCode(TransferErrorCode::NotCached));
    CHECK_FALSE(store.isCached(Model, QStringLiteral("main"), QStringLiteral("config.json")));

    const QByteArray content("{\"hidden_size\": 768}");
    const CacheEntry entry = promoteBytes(store, Model, QStringLiteral("config.json"), content);
    CHECK(entry.size == content.size());
    CHECK(entry.sha256 == HashUtilities::sha256Hex(content));
    CHECK(entry.etag == QStringLiteral("etag-config.json"));
    CHECK(TestUtilities::readFile(entry.absolutePath) == content);
    CHECK(TestUtilities::readFile(entry.absolutePath + ContentStore::ChecksumSuffix) == HashUtilities::sha256Hex(content).toUtf8());

    const auto hit = store.locate(Model, QStringLiteral("main"), QStringLiteral("config.json"));
    REQUIRE(!hit.hasError());
    CHECK(hit.value().absolutePath == entry.absolutePath);
    CHECK(store.isCached(Model, QStringLiteral("main"), QStringLiteral("config.json")));

    SECTION("Unsafe paths never reach the disk") {
        const QString temp = store.tempPathFor(QStringLiteral("escape"));
        REQUIRE(ArchiveBuilder::writeFile(temp, content));
        CHECK(store.promote(temp, Model, QStringLiteral("main"), QStringLiteral("../escape"), QString(), QString()).hasError());
        CHECK(store.promote(temp, Model, QStringLiteral("main"), QStringLiteral("/etc/escape"), QString(), QString()).hasError());
        CHECK(store.locate(Model, QStringLiteral("main"), QStringLiteral("a/../../b")).hasError());
    }
}

TEST_CASE("Promoting identical content twice keeps one entry", "[ContentStore]")
{
    const QDir root = TestUtilities::createUniqueTempDir();
    ContentStore store(root.absolutePath());

    const QByteArray content = ArchiveBuilder::randomBytes(2048, 3);
    const CacheEntry first = promoteBytes(store, Model, QStringLiteral("weights.bin"), content);
    const QDateTime firstModified = QFileInfo(first.absolutePath).lastModified();

    const QString temp = store.tempPathFor(QStringLiteral("second"));
    REQUIRE(ArchiveBuilder::writeFile(temp, content));
    const auto second = store.promote(temp, Model, QStringLiteral("main"), QStringLiteral("weights.bin"),
                                      HashUtilities::sha256Hex(content), QStringLiteral("etag-weights.bin"));
    REQUIRE(!second.hasError());

    CHECK(second.value().absolutePath == first.absolutePath);
    CHECK_FALSE(QFileInfo::exists(temp));
    CHECK(QFileInfo(first.absolutePath).lastModified() == firstModified);
    CHECK(store.entries().size() == 1);

    SECTION("Different content replaces the entry") {
        const QByteArray replacement = ArchiveBuilder::randomBytes(1024, 4);
        const CacheEntry replaced = promoteBytes(store, Model, QStringLiteral("weights.bin"), replacement);
        CHECK(replaced.sha256 == HashUtilities::sha256Hex(replacement));
        CHECK(TestUtilities::readFile(replaced.absolutePath) == replacement);
        CHECK(store.entries().size() == 1);
    }
}

TEST_CASE("Eviction respects both the age and the size bound", "[ContentStore]")
{
    const QDir root = TestUtilities::createUniqueTempDir();
    ContentStore store(root.absolutePath());
    const QDateTime now = QDateTime::currentDateTimeUtc();

    const QStringList names = {QStringLiteral("a.bin"), QStringLiteral("b.bin"), QStringLiteral("c.bin"), QStringLiteral("d.bin")};
    for (int i = 0; i < names.size(); ++i) {
        const CacheEntry entry = promoteBytes(store, Model, names.at(i), ArchiveBuilder::randomBytes(100, i + 10));
        setAccessTime(entry.absolutePath, now.addSecs(-400 + i * 100));
    }

    //a is too old, then b goes to get under 250 bytes
    const RetentionPolicy policy(250, 350);
    const auto removed = store.evict(policy, now);
    REQUIRE(!removed.hasError());
    REQUIRE(removed.value().size() == 2);

    QStringList removedPaths;
    for (const auto& entry : removed.value()) {
        removedPaths.append(entry.relativePath);
        CHECK_FALSE(QFileInfo::exists(entry.absolutePath));
        CHECK_FALSE(QFileInfo::exists(entry.absolutePath + ContentStore::ChecksumSuffix));
        CHECK_FALSE(QFileInfo::exists(entry.absolutePath + ContentStore::EtagSuffix));
    }
    removedPaths.sort();
    CHECK(removedPaths == QStringList({QStringLiteral("a.bin"), QStringLiteral("b.bin")}));

    qint64 total = 0;
    for (const auto& entry : store.entries()) {
        total += entry.size;
        CHECK_FALSE(policy.isExpired(entry.lastAccess, now));
    }
    CHECK(total <= 250);
}

TEST_CASE("Eviction prefers larger entries on equal access time", "[ContentStore]")
{
    const QDir root = TestUtilities::createUniqueTempDir();
    ContentStore store(root.absolutePath());
    const QDateTime when = QDateTime::currentDateTimeUtc().addSecs(-60);

    const CacheEntry small = promoteBytes(store, Model, QStringLiteral("small.bin"), ArchiveBuilder::randomBytes(100, 1));
    const CacheEntry large = promoteBytes(store, Model, QStringLiteral("large.bin"), ArchiveBuilder::randomBytes(300, 2));
    setAccessTime(small.absolutePath, when);
    setAccessTime(large.absolutePath, when);

    const auto removed = store.evict(RetentionPolicy(300, -1));
    REQUIRE(!removed.hasError());
    REQUIRE(removed.value().size() == 1);
    CHECK(removed.value().first().relativePath == QStringLiteral("large.bin"));
    CHECK(QFileInfo::exists(small.absolutePath));
}

TEST_CASE("Eviction removes extracted directories and prunes empty folders", "[ContentStore]")
{
    const QDir root = TestUtilities::createUniqueTempDir();
    ContentStore store(root.absolutePath());

    const CacheEntry entry = promoteBytes(store, Dataset, QStringLiteral("data/archive.zip"), ArchiveBuilder::randomBytes(64, 5));
    const QString extracted = entry.absolutePath + ContentStore::ExtractedMarker + QStringLiteral("abcdef01");
    REQUIRE(QDir().mkpath(extracted));
    REQUIRE(ArchiveBuilder::writeFile(extracted + QStringLiteral("/inside.txt"), QByteArray("inside")));

    //Files inside an extraction are not entries of their own
    REQUIRE(store.entries().size() == 1);

    const auto removed = store.evict(RetentionPolicy(0, -1));
    REQUIRE(!removed.hasError());
    CHECK(removed.value().size() == 1);
    CHECK_FALSE(QFileInfo::exists(extracted));
    CHECK_FALSE(QFileInfo::exists(store.scopePath(Dataset)));
}

TEST_CASE("verifyAll classifies without deleting", "[ContentStore]")
{
    const QDir root = TestUtilities::createUniqueTempDir();
    ContentStore store(root.absolutePath());

    promoteBytes(store, Model, QStringLiteral("valid.bin"), ArchiveBuilder::randomBytes(512, 1));
    const CacheEntry corrupted = promoteBytes(store, Model, QStringLiteral("corrupted.bin"), ArchiveBuilder::randomBytes(512, 2));
    promoteBytes(store, Model, QStringLiteral("unchecked.bin"), ArchiveBuilder::randomBytes(512, 3), false);

    REQUIRE(ArchiveBuilder::writeFile(corrupted.absolutePath, QByteArray("tampered")));

    const IntegrityReport report = store.verifyAll();
    CHECK(report.total == 3);
    CHECK(report.valid == 1);
    CHECK(report.corrupted == 1);
    CHECK(report.unchecked == 1);

    for (const auto& detail : report.details) {
        if (detail.path.endsWith(QStringLiteral("corrupted.bin"))) {
            CHECK(detail.status == IntegrityReport::Status::Corrupted);
        }
    }
    CHECK(QFileInfo::exists(corrupted.absolutePath));
}

TEST_CASE("ContentStore statistics and clearing", "[ContentStore]")
{
    const QDir root = TestUtilities::createUniqueTempDir();
    ContentStore store(root.absolutePath());

    promoteBytes(store, Model, QStringLiteral("a.bin"), ArchiveBuilder::randomBytes(100, 1));
    promoteBytes(store, Model, QStringLiteral("nested/b.bin"), ArchiveBuilder::randomBytes(200, 2));
    promoteBytes(store, Dataset, QStringLiteral("c.csv"), ArchiveBuilder::randomBytes(300, 3));

    //Temp files and resume sidecars are never entries
    REQUIRE(ArchiveBuilder::writeFile(store.tempPathFor(QStringLiteral("pending")), QByteArray("partial")));

    const CacheStats stats = store.stats();
    CHECK(stats.totalSize == 600);
    CHECK(stats.fileCount == 3);
    CHECK(stats.scopes == QStringList({QStringLiteral("datasets--owner--set"), QStringLiteral("models--owner--model")}));
    CHECK(stats.lastAccess.isValid());

    SECTION("clearScope only touches one repository") {
        const auto cleared = store.clearScope(Model);
        REQUIRE(!cleared.hasError());
        CHECK(cleared.value() == 2);
        CHECK(store.stats().fileCount == 1);
        CHECK(store.isCached(Dataset, QStringLiteral("main"), QStringLiteral("c.csv")));
    }

    SECTION("clearAll empties the cache") {
        const auto cleared = store.clearAll();
        REQUIRE(!cleared.hasError());
        CHECK(cleared.value() == 3);
        CHECK(store.entries().isEmpty());
        CHECK_FALSE(QFileInfo::exists(store.tempDirPath()));
    }
}

TEST_CASE("lockFor hands out one lock per file", "[ContentStore]")
{
    const QDir root = TestUtilities::createUniqueTempDir();
    ContentStore store(root.absolutePath());

    auto first = store.lockFor(Model, QStringLiteral("main/weights.bin"), 100);
    REQUIRE(first);
    CHECK(first->isLocked());

    auto second = store.lockFor(Model, QStringLiteral("main/weights.bin"), 100);
    CHECK_FALSE(second);

    auto other = store.lockFor(Model, QStringLiteral("main/config.json"), 100);
    CHECK(other);

    first.reset();
    CHECK(store.lockFor(Model, QStringLiteral("main/weights.bin"), 100));
}

TEST_CASE("Replacing an entry rewrites its sidecars", "[ContentStore]")
{
    const QDir root = TestUtilities::createUniqueTempDir();
    ContentStore store(root.absolutePath());
    const QString path = QStringLiteral("weights.bin");

    const QByteArray first = ArchiveBuilder::randomBytes(256, 11);
    const QByteArray second = ArchiveBuilder::randomBytes(300, 12);

    const QString firstTemp = store.tempPathFor(QStringLiteral("first"));
    REQUIRE(ArchiveBuilder::writeFile(firstTemp, first));
    const auto promotedFirst = store.promote(firstTemp, Model, QStringLiteral("main"), path,
                                             HashUtilities::sha256Hex(first), QStringLiteral("etag-one"));
    REQUIRE(!promotedFirst.hasError());
    const QString entryPath = promotedFirst.value().absolutePath;

    SECTION("New checksum and etag") {
        const QString secondTemp = store.tempPathFor(QStringLiteral("second"));
        REQUIRE(ArchiveBuilder::writeFile(secondTemp, second));
        const auto promoted = store.promote(secondTemp, Model, QStringLiteral("main"), path,
                                            HashUtilities::sha256Hex(second), QStringLiteral("etag-two"));
        REQUIRE(!promoted.hasError());

        CHECK(TestUtilities::readFile(entryPath) == second);
        CHECK(TestUtilities::readFile(entryPath + ContentStore::ChecksumSuffix) == HashUtilities::sha256Hex(second).toUtf8());
        CHECK(TestUtilities::readFile(entryPath + ContentStore::EtagSuffix) == QByteArray("etag-two"));

        const auto located = store.locate(Model, QStringLiteral("main"), path);
        REQUIRE(!located.hasError());
        CHECK(located.value().sha256 == HashUtilities::sha256Hex(second));
        CHECK(located.value().etag == QStringLiteral("etag-two"));
        CHECK(located.value().size == second.size());

        const IntegrityReport report = store.verifyAll();
        CHECK(report.total == 1);
        CHECK(report.valid == 1);
        CHECK(report.corrupted == 0);
    }

    SECTION("Replacement without checksum or etag drops the old sidecars") {
        const QString secondTemp = store.tempPathFor(QStringLiteral("second"));
        REQUIRE(ArchiveBuilder::writeFile(secondTemp, second));
        const auto promoted = store.promote(secondTemp, Model, QStringLiteral("main"), path, QString(), QString());
        REQUIRE(!promoted.hasError());

        CHECK(TestUtilities::readFile(entryPath) == second);
        CHECK_FALSE(QFileInfo::exists(entryPath + ContentStore::ChecksumSuffix));
        CHECK_FALSE(QFileInfo::exists(entryPath + ContentStore::EtagSuffix));

        const IntegrityReport report = store.verifyAll();
        CHECK(report.total == 1);
        CHECK(report.unchecked == 1);
        CHECK(report.corrupted == 0);
    }
}

TEST_CASE("Private temp files are unique and never reused", "[ContentStore]")
{
    const QDir root = TestUtilities::createUniqueTempDir();
    ContentStore store(root.absolutePath());

    const auto first = store.createUniqueTempFile();
    const auto second = store.createUniqueTempFile();
    REQUIRE(!first.hasError());
    REQUIRE(!second.hasError());

    CHECK(first.value() != second.value());
    CHECK(first.value() != store.tempPathFor(QStringLiteral("weights.bin")));
    CHECK(QFileInfo::exists(first.value()));
    CHECK(QFileInfo(first.value()).size() == 0);
    CHECK(QFileInfo(first.value()).absolutePath() == QDir(store.tempDirPath()).absolutePath());
}
