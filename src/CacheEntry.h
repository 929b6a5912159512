#ifndef CACHEENTRY_H
#define CACHEENTRY_H

#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QVector>

#include "RepoRef.h"

namespace HubTransfer {

struct CacheEntry {
    RepoRef repo;
    QString revision;
    QString relativePath;

    QString absolutePath;
    qint64 size = 0;
    QDateTime lastAccess;

    //Hex sha-256 from the checksum sidecar, empty when unknown
    QString sha256;
    QString etag;

    bool isValid() const { return !absolutePath.isEmpty(); }

    //Identity of the entry inside the cache: scope/revision/path
    QString key() const
    {
        return key(repo, revision, relativePath);
    }

    static QString key(const RepoRef& repo, const QString& revision, const QString& relativePath)
    {
        return repo.cacheFolderName() + QLatin1Char('/') + revision + QLatin1Char('/') + relativePath;
    }
};

struct IntegrityReport {
    enum class Status {
        Valid,
        Corrupted,
        Unchecked
    };

    struct FileStatus {
        QString path;
        Status status = Status::Unchecked;
    };

    int total = 0;
    int valid = 0;
    int corrupted = 0;
    int unchecked = 0;
    QVector<FileStatus> details;
};

struct CacheStats {
    qint64 totalSize = 0;
    int fileCount = 0;
    QStringList scopes;
    QDateTime lastAccess;
};

} // namespace HubTransfer

#endif // CACHEENTRY_H
