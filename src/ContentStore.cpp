#include "ContentStore.h"
#include "HashUtilities.h"
#include "TransferError.h"

#include <QDebug>
#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QMutexLocker>
#include <QSaveFile>
#include <QSet>
#include <QTemporaryFile>
#include <QUrl>
#include <QtConcurrent>

#include <algorithm>
#include <cstdio>

namespace {

QString encodeRevision(const QString& revision)
{
    return QString::fromLatin1(QUrl::toPercentEncoding(revision));
}

QString decodeRevision(const QString& folderName)
{
    return QUrl::fromPercentEncoding(folderName.toLatin1());
}

bool isSidecar(const QString& fileName)
{
    return fileName.endsWith(HubTransfer::ContentStore::ChecksumSuffix)
           || fileName.endsWith(HubTransfer::ContentStore::EtagSuffix);
}

bool isInsideExtractedDir(const QString& relativePath)
{
    const QStringList segments = relativePath.split(QLatin1Char('/'));
    for (int i = 0; i < segments.size() - 1; ++i) {
        if (segments.at(i).contains(HubTransfer::ContentStore::ExtractedMarker)) {
            return true;
        }
    }
    return false;
}

bool renameReplacing(const QString& from, const QString& to)
{
    return std::rename(QFile::encodeName(from).constData(), QFile::encodeName(to).constData()) == 0;
}

} // namespace

namespace HubTransfer {

const QString ContentStore::TempDirName = QStringLiteral(".tmp");
const QString ContentStore::LocksDirName = QStringLiteral(".locks");
const QString ContentStore::ChecksumSuffix = QStringLiteral(".sha256");
const QString ContentStore::EtagSuffix = QStringLiteral(".etag");
const QString ContentStore::ExtractedMarker = QStringLiteral(".extracted-");
const QString ContentStore::IncompleteSuffix = QStringLiteral(".incomplete");

ContentStore::ContentStore(QString rootPath)
    : mRootPath(QDir(rootPath).absolutePath())
{
}

QString ContentStore::scopePath(const RepoRef& repo) const
{
    return QDir(mRootPath).filePath(repo.cacheFolderName());
}

QString ContentStore::revisionPath(const RepoRef& repo, const QString& revision) const
{
    return QDir(scopePath(repo)).filePath(encodeRevision(revision));
}

QString ContentStore::entryPath(const RepoRef& repo, const QString& revision, const QString& relativePath) const
{
    return QDir(revisionPath(repo, revision)).filePath(relativePath);
}

Monad::Result<CacheEntry> ContentStore::locate(const RepoRef& repo,
                                               const QString& revision,
                                               const QString& relativePath) const
{
    const QString key = CacheEntry::key(repo, revision, relativePath);
    if (!repo.isValid() || !isSafeRelativePath(relativePath)) {
        return Monad::Result<CacheEntry>(QStringLiteral("Invalid cache key %1").arg(key),
                                         errorCode(TransferErrorCode::NotCached));
    }

    const QString path = entryPath(repo, revision, relativePath);
    const QFileInfo info(path);
    if (!info.isFile()) {
        return Monad::Result<CacheEntry>(QStringLiteral("Not cached: %1").arg(key),
                                         errorCode(TransferErrorCode::NotCached));
    }

    bumpAccessTime(path, QDateTime::currentDateTimeUtc());
    return Monad::Result<CacheEntry>(readEntry(repo, revision, relativePath, path));
}

bool ContentStore::isCached(const RepoRef& repo, const QString& revision, const QString& relativePath) const
{
    if (!isSafeRelativePath(relativePath)) {
        return false;
    }
    return QFileInfo(entryPath(repo, revision, relativePath)).isFile();
}

Monad::Result<CacheEntry> ContentStore::promote(const QString& tempPath,
                                                const RepoRef& repo,
                                                const QString& revision,
                                                const QString& relativePath,
                                                const QString& sha256,
                                                const QString& etag) const
{
    if (!repo.isValid() || !isSafeRelativePath(relativePath)) {
        return Monad::Result<CacheEntry>(QStringLiteral("Refusing to promote to unsafe path %1").arg(relativePath),
                                         errorCode(TransferErrorCode::Io));
    }

    if (!QFileInfo(tempPath).isFile()) {
        return Monad::Result<CacheEntry>(QStringLiteral("Missing temp file %1").arg(tempPath),
                                         errorCode(TransferErrorCode::Io));
    }

    const QString destination = entryPath(repo, revision, relativePath);
    const QString checksumPath = destination + ChecksumSuffix;
    const QString etagPath = destination + EtagSuffix;

    if (!QDir().mkpath(QFileInfo(destination).absolutePath())) {
        return Monad::Result<CacheEntry>(QStringLiteral("Failed to create cache directory for %1").arg(destination),
                                         errorCode(TransferErrorCode::Io));
    }

    QMutexLocker locker(&mPromoteMutex);

    const QString normalizedSha = sha256.toLower();
    if (!normalizedSha.isEmpty()
        && QFileInfo(destination).isFile()
        && readSidecar(checksumPath) == normalizedSha) {
        qDebug() << "[ContentStore] identical content already cached" << destination;
        QFile::remove(tempPath);
        if (!etag.isEmpty() && readSidecar(etagPath) != etag) {
            auto etagResult = writeSidecar(etagPath, etag);
            if (etagResult.hasError()) {
                return Monad::Result<CacheEntry>(etagResult.errorMessage(), etagResult.errorCode());
            }
        }
        bumpAccessTime(destination, QDateTime::currentDateTimeUtc());
        return Monad::Result<CacheEntry>(readEntry(repo, revision, relativePath, destination));
    }

    //Sidecars of the replaced content must never describe the new bytes
    QFile::remove(checksumPath);
    QFile::remove(etagPath);

    if (!renameReplacing(tempPath, destination)) {
        //Cross-device temp dir, fall back to copy then rename inside the target directory
        const QString staging = destination + IncompleteSuffix;
        QFile::remove(staging);
        if (!QFile::copy(tempPath, staging) || !renameReplacing(staging, destination)) {
            QFile::remove(staging);
            return Monad::Result<CacheEntry>(QStringLiteral("Failed to move %1 into the cache").arg(tempPath),
                                             errorCode(TransferErrorCode::Io));
        }
        QFile::remove(tempPath);
    }

    auto sidecars = writeSidecars(destination, normalizedSha, etag);
    if (sidecars.hasError()) {
        QFile::remove(checksumPath);
        QFile::remove(etagPath);
        return Monad::Result<CacheEntry>(sidecars.errorMessage(), sidecars.errorCode());
    }

    bumpAccessTime(destination, QDateTime::currentDateTimeUtc());
    const CacheEntry entry = readEntry(repo, revision, relativePath, destination);
    qDebug() << "[ContentStore] promoted" << entry.key() << entry.size << "bytes";
    return Monad::Result<CacheEntry>(entry);
}

Monad::Result<QVector<CacheEntry>> ContentStore::evict(const RetentionPolicy& policy, const QDateTime& now) const
{
    const QVector<CacheEntry> all = entries();

    QSet<QString> selectedKeys;
    QVector<CacheEntry> selected;
    QVector<CacheEntry> remaining;

    for (const auto& entry : all) {
        if (policy.isExpired(entry.lastAccess, now)) {
            selectedKeys.insert(entry.key());
            selected.append(entry);
        } else {
            remaining.append(entry);
        }
    }

    if (policy.hasMaxSize()) {
        qint64 total = 0;
        for (const auto& entry : remaining) {
            total += entry.size;
        }

        std::sort(remaining.begin(), remaining.end(), [](const CacheEntry& a, const CacheEntry& b) {
            if (a.lastAccess != b.lastAccess) {
                return a.lastAccess < b.lastAccess;
            }
            return a.size > b.size;
        });

        for (const auto& entry : remaining) {
            if (total <= policy.maxSize()) {
                break;
            }
            if (!selectedKeys.contains(entry.key())) {
                selectedKeys.insert(entry.key());
                selected.append(entry);
            }
            total -= entry.size;
        }
    }

    QVector<CacheEntry> removed;
    removed.reserve(selected.size());
    for (const auto& entry : selected) {
        auto result = removeEntry(entry);
        if (result.hasError()) {
            qWarning() << "[ContentStore] eviction failed for" << entry.key() << result.errorMessage();
            return Monad::Result<QVector<CacheEntry>>(result.errorMessage(), result.errorCode());
        }
        removed.append(entry);
    }

    if (!removed.isEmpty()) {
        qInfo() << "[ContentStore] evicted" << removed.size() << "of" << all.size() << "entries";
    }
    return Monad::Result<QVector<CacheEntry>>(removed);
}

IntegrityReport ContentStore::verifyAll() const
{
    const QVector<CacheEntry> all = entries();

    const QVector<IntegrityReport::FileStatus> statuses = QtConcurrent::blockingMapped<QVector<IntegrityReport::FileStatus>>(
        all,
        [](const CacheEntry& entry) {
            IntegrityReport::FileStatus status;
            status.path = entry.key();
            if (entry.sha256.isEmpty()) {
                status.status = IntegrityReport::Status::Unchecked;
                return status;
            }

            const auto digest = HashUtilities::sha256HexForFile(entry.absolutePath);
            if (digest.hasError() || digest.value().sha256 != entry.sha256.toLower()) {
                status.status = IntegrityReport::Status::Corrupted;
            } else {
                status.status = IntegrityReport::Status::Valid;
            }
            return status;
        });

    IntegrityReport report;
    report.total = statuses.size();
    report.details = statuses;
    for (const auto& status : statuses) {
        switch (status.status) {
        case IntegrityReport::Status::Valid:
            report.valid++;
            break;
        case IntegrityReport::Status::Corrupted:
            qWarning() << "[ContentStore] corrupted entry" << status.path;
            report.corrupted++;
            break;
        case IntegrityReport::Status::Unchecked:
            report.unchecked++;
            break;
        }
    }
    return report;
}

QVector<CacheEntry> ContentStore::entries() const
{
    QVector<CacheEntry> result;

    const QDir root(mRootPath);
    if (!root.exists()) {
        return result;
    }

    const QStringList scopes = root.entryList(QDir::Dirs | QDir::NoDotAndDotDot | QDir::Hidden, QDir::Name);
    for (const auto& scopeName : scopes) {
        if (scopeName.startsWith(QLatin1Char('.'))) {
            continue;
        }

        const auto repoResult = RepoRef::fromCacheFolderName(scopeName);
        if (repoResult.hasError()) {
            qDebug() << "[ContentStore] skipping unknown folder" << scopeName;
            continue;
        }
        const RepoRef repo = repoResult.value();

        const QDir scopeDir(root.filePath(scopeName));
        const QStringList revisions = scopeDir.entryList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);
        for (const auto& revisionFolder : revisions) {
            const QDir revisionDir(scopeDir.filePath(revisionFolder));
            const QString revision = decodeRevision(revisionFolder);

            QDirIterator it(revisionDir.absolutePath(),
                            QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot,
                            QDirIterator::Subdirectories);
            while (it.hasNext()) {
                const QString absolutePath = it.next();
                const QString relativePath = revisionDir.relativeFilePath(absolutePath);
                if (isSidecar(relativePath)
                    || relativePath.endsWith(IncompleteSuffix)
                    || isInsideExtractedDir(relativePath)) {
                    continue;
                }
                result.append(readEntry(repo, revision, relativePath, absolutePath));
            }
        }
    }

    return result;
}

CacheStats ContentStore::stats() const
{
    CacheStats stats;
    QSet<QString> scopes;
    for (const auto& entry : entries()) {
        stats.totalSize += entry.size;
        stats.fileCount++;
        scopes.insert(entry.repo.cacheFolderName());
        if (!stats.lastAccess.isValid() || entry.lastAccess > stats.lastAccess) {
            stats.lastAccess = entry.lastAccess;
        }
    }
    stats.scopes = QStringList(scopes.begin(), scopes.end());
    stats.scopes.sort();
    return stats;
}

Monad::Result<int> ContentStore::clearScope(const RepoRef& repo) const
{
    if (!repo.isValid()) {
        return Monad::Result<int>(QStringLiteral("Invalid repository %1").arg(repo.repoId()),
                                  errorCode(TransferErrorCode::Io));
    }

    int count = 0;
    for (const auto& entry : entries()) {
        if (entry.repo == repo) {
            count++;
        }
    }

    QDir scopeDir(scopePath(repo));
    if (scopeDir.exists() && !scopeDir.removeRecursively()) {
        return Monad::Result<int>(QStringLiteral("Failed to remove %1").arg(scopeDir.absolutePath()),
                                  errorCode(TransferErrorCode::Io));
    }

    QDir locksDir(QDir(mRootPath).filePath(LocksDirName + QLatin1Char('/') + repo.cacheFolderName()));
    if (locksDir.exists()) {
        locksDir.removeRecursively();
    }

    qInfo() << "[ContentStore] cleared" << repo.cacheFolderName() << count << "entries";
    return Monad::Result<int>(count);
}

Monad::Result<int> ContentStore::clearAll() const
{
    const QVector<CacheEntry> all = entries();

    const QDir root(mRootPath);
    const QStringList folders = root.entryList(QDir::Dirs | QDir::NoDotAndDotDot | QDir::Hidden);
    for (const auto& folder : folders) {
        if (folder == LocksDirName) {
            continue;
        }
        QDir dir(root.filePath(folder));
        if (!dir.removeRecursively()) {
            return Monad::Result<int>(QStringLiteral("Failed to remove %1").arg(dir.absolutePath()),
                                      errorCode(TransferErrorCode::Io));
        }
    }

    qInfo() << "[ContentStore] cleared" << all.size() << "entries from" << mRootPath;
    return Monad::Result<int>(all.size());
}

QString ContentStore::tempDirPath() const
{
    return QDir(mRootPath).filePath(TempDirName);
}

QString ContentStore::tempPathFor(const QString& key) const
{
    QDir().mkpath(tempDirPath());
    return QDir(tempDirPath()).filePath(HashUtilities::sha256Hex(key.toUtf8()) + IncompleteSuffix);
}

Monad::Result<QString> ContentStore::createUniqueTempFile() const
{
    QDir().mkpath(tempDirPath());
    QTemporaryFile file(QDir(tempDirPath()).filePath(QStringLiteral("private-XXXXXX") + IncompleteSuffix));
    file.setAutoRemove(false);
    if (!file.open()) {
        return Monad::Result<QString>(QStringLiteral("Failed to create temp file in %1: %2").arg(tempDirPath(), file.errorString()),
                                      errorCode(TransferErrorCode::Io));
    }
    const QString path = file.fileName();
    file.close();
    return Monad::Result<QString>(path);
}

std::unique_ptr<QLockFile> ContentStore::lockFor(const RepoRef& repo, const QString& relativePath, int timeoutMs) const
{
    const QString lockDir = QDir(mRootPath).filePath(LocksDirName + QLatin1Char('/') + repo.cacheFolderName());
    if (!QDir().mkpath(lockDir)) {
        qWarning() << "[ContentStore] failed to create lock directory" << lockDir;
        return nullptr;
    }

    const QString lockPath = QDir(lockDir).filePath(HashUtilities::sha256Hex(relativePath.toUtf8()) + QStringLiteral(".lock"));
    auto lock = std::make_unique<QLockFile>(lockPath);

    //Held for the whole transfer, only a dead owner makes it stale
    lock->setStaleLockTime(0);
    if (!lock->tryLock(timeoutMs)) {
        qWarning() << "[ContentStore] lock busy" << lockPath << "error" << lock->error();
        return nullptr;
    }
    return lock;
}

bool ContentStore::isSafeRelativePath(const QString& relativePath)
{
    if (relativePath.isEmpty() || relativePath.startsWith(QLatin1Char('/')) || relativePath.contains(QLatin1Char('\\'))) {
        return false;
    }
    if (QDir::isAbsolutePath(relativePath)) {
        return false;
    }
    const QStringList segments = relativePath.split(QLatin1Char('/'));
    for (const auto& segment : segments) {
        if (segment.isEmpty() || segment == QStringLiteral(".") || segment == QStringLiteral("..")) {
            return false;
        }
    }
    return true;
}

QStringList ContentStore::extractedDirsFor(const QString& absolutePath)
{
    const QFileInfo info(absolutePath);
    const QDir parent = info.absoluteDir();
    const QStringList names = parent.entryList({info.fileName() + ExtractedMarker + QLatin1Char('*')},
                                               QDir::Dirs | QDir::NoDotAndDotDot);
    QStringList paths;
    for (const auto& name : names) {
        paths.append(parent.filePath(name));
    }
    return paths;
}

CacheEntry ContentStore::readEntry(const RepoRef& repo,
                                   const QString& revision,
                                   const QString& relativePath,
                                   const QString& absolutePath) const
{
    const QFileInfo info(absolutePath);

    CacheEntry entry;
    entry.repo = repo;
    entry.revision = revision;
    entry.relativePath = relativePath;
    entry.absolutePath = info.absoluteFilePath();
    entry.size = info.size();
    entry.lastAccess = info.fileTime(QFileDevice::FileAccessTime);
    entry.sha256 = readSidecar(absolutePath + ChecksumSuffix);
    entry.etag = readSidecar(absolutePath + EtagSuffix);
    return entry;
}

Monad::ResultBase ContentStore::removeEntry(const CacheEntry& entry) const
{
    for (const auto& dirPath : extractedDirsFor(entry.absolutePath)) {
        QDir dir(dirPath);
        if (!dir.removeRecursively()) {
            return Monad::ResultBase(QStringLiteral("Failed to remove extracted directory %1").arg(dirPath),
                                     errorCode(TransferErrorCode::Io));
        }
    }

    QFile::remove(entry.absolutePath + ChecksumSuffix);
    QFile::remove(entry.absolutePath + EtagSuffix);
    if (QFileInfo::exists(entry.absolutePath) && !QFile::remove(entry.absolutePath)) {
        return Monad::ResultBase(QStringLiteral("Failed to remove %1").arg(entry.absolutePath),
                                 errorCode(TransferErrorCode::Io));
    }

    pruneEmptyParents(entry.absolutePath, mRootPath);
    return Monad::ResultBase();
}

void ContentStore::pruneEmptyParents(const QString& absolutePath, const QString& stopAt) const
{
    QDir dir = QFileInfo(absolutePath).absoluteDir();
    const QString stop = QDir(stopAt).absolutePath();
    while (dir.absolutePath() != stop && dir.absolutePath().startsWith(stop)) {
        if (!dir.isEmpty(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden)) {
            break;
        }
        const QString name = dir.dirName();
        if (!dir.cdUp() || !dir.rmdir(name)) {
            break;
        }
    }
}

Monad::ResultBase ContentStore::writeSidecars(const QString& absolutePath, const QString& sha256, const QString& etag)
{
    if (!sha256.isEmpty()) {
        auto result = writeSidecar(absolutePath + ChecksumSuffix, sha256);
        if (result.hasError()) {
            return result;
        }
    }
    if (!etag.isEmpty()) {
        return writeSidecar(absolutePath + EtagSuffix, etag);
    }
    return Monad::ResultBase();
}

void ContentStore::bumpAccessTime(const QString& absolutePath, const QDateTime& when)
{
    QFile file(absolutePath);
    if (!file.open(QIODevice::ReadOnly)) {
        return;
    }
    if (!file.setFileTime(when, QFileDevice::FileAccessTime)) {
        qDebug() << "[ContentStore] could not update access time of" << absolutePath;
    }
}

QString ContentStore::readSidecar(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return QString();
    }
    return QString::fromUtf8(file.readAll()).trimmed();
}

Monad::ResultBase ContentStore::writeSidecar(const QString& path, const QString& value)
{
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return Monad::ResultBase(QStringLiteral("Failed to open sidecar %1: %2").arg(path, file.errorString()),
                                 errorCode(TransferErrorCode::Io));
    }
    file.write(value.toUtf8());
    if (!file.commit()) {
        return Monad::ResultBase(QStringLiteral("Failed to write sidecar %1: %2").arg(path, file.errorString()),
                                 errorCode(TransferErrorCode::Io));
    }
    return Monad::ResultBase();
}

} // namespace HubTransfer
