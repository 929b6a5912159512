#ifndef DOWNLOADENGINE_H
#define DOWNLOADENGINE_H

//Qt includes
#include <QFuture>
#include <QString>
#include <QStringList>
#include <QThreadPool>
#include <QVector>

//Std includes
#include <memory>

//Our includes
#include "ArchiveExtractor.h"
#include "CacheEntry.h"
#include "HubSettings.h"
#include "ProgressState.h"
#include "TransferPlanner.h"
#include "Monad/Result.h"

namespace HubTransfer {

class ContentStore;
class HttpClient;

struct DownloadResult {
    enum class Outcome {
        CacheHit,
        Downloaded,
        Resumed
    };

    Outcome outcome = Outcome::CacheHit;
    CacheEntry entry;

    //Bytes that crossed the network in this call
    qint64 bytesFetched = 0;

    //Set when extraction was requested and the file is an archive
    QString extractedPath;
    ArchiveExtractor::Extraction extraction;
};

struct SnapshotFile {
    QString path;
    qint64 size = -1;
    QString etag;
};

struct SnapshotRequest {
    RepoRef repo;
    QString revision = QStringLiteral("main");
    QVector<SnapshotFile> files;
    QStringList allowPatterns;
    QStringList ignorePatterns;
    bool forceDownload = false;
    bool extract = false;
};

struct SnapshotResult {
    struct FileOutcome {
        QString path;
        DownloadResult result;
        QString errorMessage;
        int errorCode = 0;

        bool hasError() const { return errorCode != 0; }
    };

    QString snapshotPath;
    QVector<FileOutcome> files;
    QStringList skipped;

    int failedCount() const;

    //No error when every selected file succeeded
    Monad::ResultBase overall() const;
};

/**
 * Executes transfer plans: streams into a temp file under the store's .tmp
 * directory, checkpoints a resume sidecar, validates the sha-256 and
 * promotes into the ContentStore.
 *
 * download() and snapshot() run on the engine's own pool, its width is
 * HubSettings::maxWorkers(). Progress text of the returned futures is
 * ProgressState JSON.
 */
class DownloadEngine
{
public:
    explicit DownloadEngine(const HubSettings& settings);
    DownloadEngine(std::shared_ptr<ContentStore> store,
                   std::shared_ptr<HttpClient> client,
                   const HubSettings& settings);
    ~DownloadEngine();

    DownloadEngine(const DownloadEngine&) = delete;
    DownloadEngine& operator=(const DownloadEngine&) = delete;

    std::shared_ptr<ContentStore> store() const { return mStore; }
    std::shared_ptr<TransferPlanner> planner() const { return mPlanner; }
    const HubSettings& settings() const { return mSettings; }

    QFuture<Monad::Result<DownloadResult>> download(const DownloadRequest& request,
                                                    ProgressCallback progress = ProgressCallback());
    Monad::Result<DownloadResult> downloadBlocking(const DownloadRequest& request,
                                                   ProgressCallback progress = ProgressCallback()) const;

    QFuture<SnapshotResult> snapshot(const SnapshotRequest& request,
                                     ProgressCallback progress = ProgressCallback());
    SnapshotResult snapshotBlocking(const SnapshotRequest& request,
                                    ProgressCallback progress = ProgressCallback());

    //Extracts a cached archive into <file>.extracted-<hash8>, reusing a
    //non-empty existing target
    Monad::Result<ArchiveExtractor::Extraction> extractEntry(const CacheEntry& entry) const;

    //Allow list empty means everything; a pattern matches the whole path
    //or the file name
    static bool matchesPatterns(const QString& path,
                                const QStringList& allowPatterns,
                                const QStringList& ignorePatterns);

private:
    std::shared_ptr<ContentStore> mStore;
    std::shared_ptr<HttpClient> mClient;
    std::shared_ptr<TransferPlanner> mPlanner;
    HubSettings mSettings;
    std::unique_ptr<QThreadPool> mPool;
    std::unique_ptr<QThreadPool> mCoordinatorPool;

    Monad::Result<qint64> fetch(TransferPlan* plan,
                                const QString& displayPath,
                                const ProgressCallback& progress) const;
    Monad::Result<qint64> fetchAttempt(TransferPlan* plan,
                                       const QString& displayPath,
                                       const ProgressCallback& progress,
                                       qint64* fetchedOut) const;
    Monad::Result<DownloadResult> finish(const DownloadRequest& request,
                                         const TransferPlan& plan,
                                         qint64 bytesFetched) const;
    Monad::Result<DownloadResult> completeHit(const DownloadRequest& request, const CacheEntry& entry) const;
    bool isResumable(const TransferPlan& plan) const;
    static void discardTemp(const QString& tempPath);
};

} // namespace HubTransfer

#endif // DOWNLOADENGINE_H
