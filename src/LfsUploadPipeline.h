#ifndef LFSUPLOADPIPELINE_H
#define LFSUPLOADPIPELINE_H

//Qt includes
#include <QFuture>
#include <QString>
#include <QThreadPool>
#include <QVector>

//Std includes
#include <memory>

//Our includes
#include "HubSettings.h"
#include "LfsBatchClient.h"
#include "ProgressState.h"
#include "RepoRef.h"
#include "UploadUnit.h"
#include "Monad/Result.h"

namespace HubTransfer {

class HttpClient;

struct UploadFile {
    QString localPath;
    QString pathInRepo;
};

struct UploadPlan {
    //At or above the large object threshold
    QVector<UploadUnit> units;

    //Small enough for the regular commit api
    QVector<UploadFile> regularFiles;
};

struct UploadResult {
    QVector<UploadUnit> units;

    int failedCount() const;

    //No error when every unit is Verified or AlreadyPresent
    Monad::ResultBase overall() const;
};

/**
 * Large object upload: hash and classify, negotiate one batch, upload each
 * object on a bounded object pool, split multipart objects onto a second
 * bounded part pool, complete and verify.
 *
 * A failing object never cancels its siblings, and every task is awaited
 * before the result is returned.
 */
class LfsUploadPipeline
{
public:
    explicit LfsUploadPipeline(const HubSettings& settings);
    LfsUploadPipeline(std::shared_ptr<HttpClient> client, const HubSettings& settings);
    ~LfsUploadPipeline();

    LfsUploadPipeline(const LfsUploadPipeline&) = delete;
    LfsUploadPipeline& operator=(const LfsUploadPipeline&) = delete;

    const HubSettings& settings() const { return mSettings; }
    const LfsBatchClient& batchClient() const { return mBatchClient; }

    Monad::Result<UploadPlan> plan(const QVector<UploadFile>& files) const;
    static Monad::Result<UploadPlan> plan(const QVector<UploadFile>& files, qint64 largeFileThreshold);

    QFuture<UploadResult> upload(const RepoRef& repo,
                                 const QVector<UploadUnit>& units,
                                 ProgressCallback progress = ProgressCallback());
    UploadResult uploadBlocking(const RepoRef& repo,
                                QVector<UploadUnit> units,
                                ProgressCallback progress = ProgressCallback());

private:
    HubSettings mSettings;
    std::shared_ptr<HttpClient> mClient;
    LfsBatchClient mBatchClient;
    std::unique_ptr<QThreadPool> mObjectPool;
    std::unique_ptr<QThreadPool> mPartPool;
    std::unique_ptr<QThreadPool> mCoordinatorPool;

    void uploadObject(UploadUnit* unit,
                      const LfsBatchClient::ObjectResponse& response,
                      const ProgressCallback& progress);
    Monad::ResultBase uploadMultipart(UploadUnit* unit,
                                      const LfsBatchClient::Action& action,
                                      qint64 chunkSize,
                                      const ProgressCallback& progress);
};

} // namespace HubTransfer

#endif // LFSUPLOADPIPELINE_H
