#ifndef CONTENTSTORE_H
#define CONTENTSTORE_H

#include <QLockFile>
#include <QMutex>
#include <QString>
#include <QVector>

#include <memory>

#include "CacheEntry.h"
#include "RepoRef.h"
#include "RetentionPolicy.h"
#include "Monad/Result.h"

namespace HubTransfer {

/**
 * Disk layout of the local cache.
 *
 * <root>/<kind>s--<owner>--<name>/<revision>/<relative path> holds the bytes,
 * <file>.sha256 and <file>.etag sit beside them. The reserved .tmp and .locks
 * directories at the root never hold entries. The filesystem is the source of
 * truth, nothing is cached in memory.
 */
class ContentStore
{
public:
    static const QString TempDirName;
    static const QString LocksDirName;
    static const QString ChecksumSuffix;
    static const QString EtagSuffix;
    static const QString ExtractedMarker;
    static const QString IncompleteSuffix;

    explicit ContentStore(QString rootPath);

    const QString& rootPath() const { return mRootPath; }

    QString scopePath(const RepoRef& repo) const;
    QString revisionPath(const RepoRef& repo, const QString& revision) const;
    QString entryPath(const RepoRef& repo, const QString& revision, const QString& relativePath) const;

    //Pure lookup, no network. A hit bumps the access time. A miss carries
    //TransferErrorCode::NotCached.
    Monad::Result<CacheEntry> locate(const RepoRef& repo,
                                     const QString& revision,
                                     const QString& relativePath) const;
    bool isCached(const RepoRef& repo, const QString& revision, const QString& relativePath) const;

    //Atomically moves a validated temp file into place and writes its sidecars.
    //Promoting the same content again discards the temp file.
    Monad::Result<CacheEntry> promote(const QString& tempPath,
                                      const RepoRef& repo,
                                      const QString& revision,
                                      const QString& relativePath,
                                      const QString& sha256,
                                      const QString& etag) const;

    Monad::Result<QVector<CacheEntry>> evict(const RetentionPolicy& policy,
                                             const QDateTime& now = QDateTime::currentDateTimeUtc()) const;

    IntegrityReport verifyAll() const;

    QVector<CacheEntry> entries() const;
    CacheStats stats() const;

    Monad::Result<int> clearScope(const RepoRef& repo) const;
    Monad::Result<int> clearAll() const;

    QString tempDirPath() const;
    //Shared by every writer of the same key, only the lock holder may touch it
    QString tempPathFor(const QString& key) const;

    //A fresh empty file under .tmp owned by the caller
    Monad::Result<QString> createUniqueTempFile() const;

    //Advisory cross-process lock for one file in a scope. Returns null when
    //the lock could not be taken within timeoutMs.
    std::unique_ptr<QLockFile> lockFor(const RepoRef& repo, const QString& relativePath, int timeoutMs) const;

    static bool isSafeRelativePath(const QString& relativePath);
    static QStringList extractedDirsFor(const QString& absolutePath);

private:
    QString mRootPath;

    //Serializes promotions made through this instance
    mutable QMutex mPromoteMutex;

    CacheEntry readEntry(const RepoRef& repo,
                         const QString& revision,
                         const QString& relativePath,
                         const QString& absolutePath) const;
    Monad::ResultBase removeEntry(const CacheEntry& entry) const;
    void pruneEmptyParents(const QString& absolutePath, const QString& stopAt) const;

    static void bumpAccessTime(const QString& absolutePath, const QDateTime& when);
    static QString readSidecar(const QString& path);
    static Monad::ResultBase writeSidecar(const QString& path, const QString& value);
    static Monad::ResultBase writeSidecars(const QString& absolutePath, const QString& sha256, const QString& etag);
};

} // namespace HubTransfer

#endif // CONTENTSTORE_H
