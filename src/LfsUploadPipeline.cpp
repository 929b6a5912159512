//Our includes
#include "LfsUploadPipeline.h"
#include "HttpClient.h"
#include "TransferError.h"

//Qt includes
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QHash>
#include <QtConcurrent>

//AsyncFuture
#include "asyncfuture.h"

using namespace HubTransfer;

namespace {

const QString UploadAction = QStringLiteral("upload");
const QString VerifyAction = QStringLiteral("verify");

Monad::Result<QByteArray> readChunk(const QString& localPath, qint64 offset, qint64 length)
{
    QFile file(localPath);
    if (!file.open(QIODevice::ReadOnly)) {
        return Monad::Result<QByteArray>(QStringLiteral("Failed to open %1: %2").arg(localPath, file.errorString()),
                                         errorCode(TransferErrorCode::Io));
    }
    if (!file.seek(offset)) {
        return Monad::Result<QByteArray>(QStringLiteral("Failed to seek %1 to %2").arg(localPath).arg(offset),
                                         errorCode(TransferErrorCode::Io));
    }
    const QByteArray data = file.read(length);
    if (data.size() != length) {
        return Monad::Result<QByteArray>(QStringLiteral("Short read from %1 at %2, expected %3 bytes got %4")
                                             .arg(localPath)
                                             .arg(offset)
                                             .arg(length)
                                             .arg(data.size()),
                                         errorCode(TransferErrorCode::Io));
    }
    return Monad::Result<QByteArray>(data);
}

}

int UploadResult::failedCount() const
{
    int count = 0;
    for (const auto& unit : units) {
        if (unit.hasError()) {
            count++;
        }
    }
    return count;
}

Monad::ResultBase UploadResult::overall() const
{
    const int failed = failedCount();
    if (failed == 0) {
        return Monad::ResultBase();
    }

    const UploadUnit* firstFailure = nullptr;
    for (const auto& unit : units) {
        if (unit.hasError()) {
            firstFailure = &unit;
            break;
        }
    }

    const QString message = QStringLiteral("%1 of %2 uploads failed, first: %3: %4")
                                .arg(failed)
                                .arg(units.size())
                                .arg(firstFailure->pathInRepo(), firstFailure->errorMessage());
    if (failed < units.size()) {
        return Monad::ResultBase(message, errorCode(TransferErrorCode::PartialBatchFailure));
    }
    return Monad::ResultBase(message, firstFailure->errorCode());
}

LfsUploadPipeline::LfsUploadPipeline(const HubSettings& settings)
    : LfsUploadPipeline(std::make_shared<HttpClient>(settings.requestTimeoutMs(), settings.userAgent(), settings.authProvider()),
                        settings)
{
}

LfsUploadPipeline::LfsUploadPipeline(std::shared_ptr<HttpClient> client, const HubSettings& settings)
    : mSettings(settings),
      mClient(std::move(client)),
      mBatchClient(mClient, settings.endpoint()),
      mObjectPool(std::make_unique<QThreadPool>()),
      mPartPool(std::make_unique<QThreadPool>()),
      mCoordinatorPool(std::make_unique<QThreadPool>())
{
    mObjectPool->setMaxThreadCount(mSettings.maxWorkers());
    mPartPool->setMaxThreadCount(mSettings.maxWorkers());
    mCoordinatorPool->setMaxThreadCount(mSettings.maxWorkers());
}

LfsUploadPipeline::~LfsUploadPipeline()
{
    mCoordinatorPool->waitForDone();
    mObjectPool->waitForDone();
    mPartPool->waitForDone();
}

Monad::Result<UploadPlan> LfsUploadPipeline::plan(const QVector<UploadFile>& files) const
{
    return plan(files, mSettings.largeFileThreshold());
}

Monad::Result<UploadPlan> LfsUploadPipeline::plan(const QVector<UploadFile>& files, qint64 largeFileThreshold)
{
    UploadPlan uploadPlan;
    for (const auto& file : files) {
        const QFileInfo info(file.localPath);
        if (!info.isFile()) {
            return Monad::Result<UploadPlan>(QStringLiteral("Upload source %1 is not a file").arg(file.localPath),
                                             errorCode(TransferErrorCode::Io));
        }

        if (info.size() < largeFileThreshold) {
            uploadPlan.regularFiles.append(file);
            continue;
        }

        const auto unit = UploadUnit::fromFile(file.localPath, file.pathInRepo);
        if (unit.hasError()) {
            return Monad::Result<UploadPlan>(unit.errorMessage(), unit.errorCode());
        }
        uploadPlan.units.append(unit.value());
    }

    qDebug() << "[LfsUploadPipeline] planned" << uploadPlan.units.size() << "large objects and"
             << uploadPlan.regularFiles.size() << "regular files";
    return Monad::Result<UploadPlan>(uploadPlan);
}

QFuture<UploadResult> LfsUploadPipeline::upload(const RepoRef& repo,
                                                const QVector<UploadUnit>& units,
                                                ProgressCallback progress)
{
    if (units.isEmpty()) {
        return AsyncFuture::completed(UploadResult());
    }

    auto deferred = AsyncFuture::deferred<UploadResult>();

    //The coordinator only waits on the object pool
    mCoordinatorPool->start([this, repo, units, progress, deferred]() mutable {
        deferred.complete(uploadBlocking(repo, units, progress));
    });

    return deferred.future();
}

UploadResult LfsUploadPipeline::uploadBlocking(const RepoRef& repo,
                                               QVector<UploadUnit> units,
                                               ProgressCallback progress)
{
    UploadResult result;

    //Identical content shares an oid, only the first unit is negotiated
    QHash<QString, int> primaryIndex;
    QVector<int> duplicates;
    QVector<LfsBatchClient::ObjectSpec> specs;
    for (int i = 0; i < units.size(); ++i) {
        const QString oid = units.at(i).oid();
        if (primaryIndex.contains(oid)) {
            duplicates.append(i);
            continue;
        }
        primaryIndex.insert(oid, i);
        specs.append({oid, units.at(i).size()});
    }

    if (specs.isEmpty()) {
        result.units = units;
        return result;
    }

    const auto batch = mBatchClient.batchUpload(repo, specs);
    if (batch.hasError()) {
        qWarning() << "[LfsUploadPipeline] batch negotiation failed" << errorCodeName(batch.errorCode())
                   << batch.errorMessage();
        for (auto& unit : units) {
            unit.fail(batch.errorMessage(), batch.errorCode());
        }
        result.units = units;
        return result;
    }

    const LfsBatchClient::BatchResponse response = batch.value();

    //Pointers are taken after the last detach, workers touch distinct units
    UploadUnit* data = units.data();
    QVector<QFuture<void>> running;

    for (auto it = primaryIndex.constBegin(); it != primaryIndex.constEnd(); ++it) {
        UploadUnit* unit = data + it.value();
        const LfsBatchClient::ObjectResponse* object = response.find(unit->oid());

        if (object == nullptr) {
            unit->fail(QStringLiteral("LFS batch response has no entry for %1").arg(unit->oid()),
                       errorCode(TransferErrorCode::Protocol));
            continue;
        }
        if (object->hasError()) {
            unit->fail(object->errorMessage, object->errorCode);
            continue;
        }

        unit->setState(UploadUnit::State::BatchNegotiated);
        if (!object->hasAction(UploadAction)) {
            qDebug() << "[LfsUploadPipeline] already present" << unit->pathInRepo() << unit->oid();
            unit->setState(UploadUnit::State::AlreadyPresent);
            continue;
        }

        const LfsBatchClient::ObjectResponse objectResponse = *object;
        running.append(QtConcurrent::run(mObjectPool.get(), [this, unit, objectResponse, progress]() {
            uploadObject(unit, objectResponse, progress);
        }));
    }

    for (auto& future : running) {
        future.waitForFinished();
    }

    for (int index : duplicates) {
        UploadUnit& duplicate = units[index];
        const UploadUnit& primary = units.at(primaryIndex.value(duplicate.oid()));
        if (primary.hasError()) {
            duplicate.fail(primary.errorMessage(), primary.errorCode());
        } else {
            qDebug() << "[LfsUploadPipeline] already present" << duplicate.pathInRepo() << "same content as"
                     << primary.pathInRepo();
            duplicate.setState(UploadUnit::State::AlreadyPresent);
        }
    }

    result.units = units;
    if (result.failedCount() > 0) {
        const auto overall = result.overall();
        qWarning() << "[LfsUploadPipeline]" << errorCodeName(overall.errorCode()) << overall.errorMessage();
    }
    return result;
}

void LfsUploadPipeline::uploadObject(UploadUnit* unit,
                                     const LfsBatchClient::ObjectResponse& response,
                                     const ProgressCallback& progress)
{
    unit->setState(UploadUnit::State::Uploading);

    const LfsBatchClient::Action action = response.actions.value(UploadAction);
    const qint64 chunkSize = LfsBatchClient::chunkSize(action);

    const Monad::ResultBase uploaded = chunkSize > 0
                                           ? uploadMultipart(unit, action, chunkSize, progress)
                                           : mBatchClient.uploadSinglePart(action, unit->localPath(), unit->size());
    if (uploaded.hasError()) {
        qWarning() << "[LfsUploadPipeline] upload failed" << unit->pathInRepo() << uploaded.errorMessage();
        unit->fail(uploaded.errorMessage(), uploaded.errorCode());
        return;
    }

    if (progress) {
        progress(ProgressState(unit->pathInRepo(), unit->size(), unit->size()));
    }

    if (response.hasAction(VerifyAction)) {
        const auto verified = mBatchClient.verifyObject(response.actions.value(VerifyAction), {unit->oid(), unit->size()});
        if (verified.hasError()) {
            qWarning() << "[LfsUploadPipeline] verify failed" << unit->pathInRepo() << verified.errorMessage();
            unit->fail(verified.errorMessage(), verified.errorCode());
            return;
        }
    }

    unit->setState(UploadUnit::State::Verified);
    qDebug() << "[LfsUploadPipeline] uploaded" << unit->pathInRepo() << unit->oid();
}

Monad::ResultBase LfsUploadPipeline::uploadMultipart(UploadUnit* unit,
                                                     const LfsBatchClient::Action& action,
                                                     qint64 chunkSize,
                                                     const ProgressCallback& progress)
{
    unit->splitIntoChunks(chunkSize);
    const QVector<UploadChunk> chunks = unit->chunks();
    const QMap<int, QUrl> urls = LfsBatchClient::partUrls(action);

    for (const auto& chunk : chunks) {
        if (!urls.contains(chunk.partNumber)) {
            return Monad::ResultBase(QStringLiteral("Missing url for part %1 of %2, server sent %3 part urls for %4 chunks")
                                         .arg(chunk.partNumber)
                                         .arg(unit->pathInRepo())
                                         .arg(urls.size())
                                         .arg(chunks.size()),
                                     errorCode(TransferErrorCode::Protocol));
        }
    }

    const QString localPath = unit->localPath();
    const QString displayPath = unit->pathInRepo();
    const qint64 total = unit->size();

    QVector<QFuture<Monad::Result<QString>>> parts;
    parts.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        const QUrl url = urls.value(chunk.partNumber);
        parts.append(QtConcurrent::run(mPartPool.get(), [this, localPath, url, chunk]() {
            const auto data = readChunk(localPath, chunk.offset, chunk.length);
            if (data.hasError()) {
                return Monad::Result<QString>(data.errorMessage(), data.errorCode());
            }
            return mBatchClient.uploadPart(url, data.value());
        }));
    }

    Monad::ResultBase firstError;
    qint64 sent = 0;
    for (int i = 0; i < parts.size(); ++i) {
        parts[i].waitForFinished();
        const auto partResult = parts[i].result();
        if (partResult.hasError()) {
            if (!firstError.hasError()) {
                firstError = Monad::ResultBase(QStringLiteral("Part %1: %2").arg(chunks.at(i).partNumber).arg(partResult.errorMessage()),
                                               partResult.errorCode());
            }
            continue;
        }

        unit->markChunkDone(chunks.at(i).partNumber, partResult.value());
        sent += chunks.at(i).length;
        if (progress) {
            progress(ProgressState(displayPath, sent, total));
        }
    }

    if (firstError.hasError()) {
        return firstError;
    }

    return mBatchClient.completeMultipart(action, unit->oid(), unit->chunks());
}
