//Our includes
#include "DownloadEngine.h"
#include "ContentStore.h"
#include "HashUtilities.h"
#include "HttpClient.h"
#include "TransferError.h"

//Qt includes
#include <QDebug>
#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QFutureInterface>
#include <QLockFile>
#include <QPair>
#include <QRegularExpression>
#include <QThread>

//Std includes
#include <algorithm>

using namespace HubTransfer;

namespace {

template<typename ProgressInterface>
void setProgress(ProgressInterface* interface, const ProgressState& progress) {
    //Increment the value by one so watchers see the text change
    interface->setProgressValueAndText(interface->progressValue() + 1, progress.toJsonString());
}

//"bytes <start>-<end>/<total>"
qint64 contentRangeStart(const QByteArray& header)
{
    const QByteArray trimmed = header.trimmed();
    if (!trimmed.startsWith("bytes ")) {
        return -1;
    }
    const int dash = trimmed.indexOf('-');
    if (dash < 0) {
        return -1;
    }
    bool ok = false;
    const qint64 start = trimmed.mid(6, dash - 6).toLongLong(&ok);
    return ok ? start : -1;
}

Monad::ResultBase errorFor(TransferErrorCode code, const QString& message)
{
    return Monad::ResultBase(message, errorCode(code));
}

ArchiveExtractor::Extraction listExtracted(const QString& root, ArchiveExtractor::Format format)
{
    ArchiveExtractor::Extraction extraction;
    extraction.isArchive = true;
    extraction.format = format;
    extraction.destination = root;

    const QDir rootDir(root);
    QDirIterator it(root, QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QString path = it.next();
        extraction.files.append(rootDir.relativeFilePath(path));
        extraction.totalSize += QFileInfo(path).size();
    }
    extraction.files.sort();
    return extraction;
}

}

int SnapshotResult::failedCount() const
{
    int count = 0;
    for (const auto& file : files) {
        if (file.hasError()) {
            count++;
        }
    }
    return count;
}

Monad::ResultBase SnapshotResult::overall() const
{
    const int failed = failedCount();
    if (failed == 0) {
        return Monad::ResultBase();
    }

    const FileOutcome* firstFailure = nullptr;
    for (const auto& file : files) {
        if (file.hasError()) {
            firstFailure = &file;
            break;
        }
    }

    const QString message = QStringLiteral("%1 of %2 files failed, first: %3: %4")
                                .arg(failed)
                                .arg(files.size())
                                .arg(firstFailure->path, firstFailure->errorMessage);
    if (failed < files.size()) {
        return Monad::ResultBase(message, errorCode(TransferErrorCode::PartialBatchFailure));
    }
    return Monad::ResultBase(message, firstFailure->errorCode);
}

DownloadEngine::DownloadEngine(const HubSettings& settings)
    : DownloadEngine(std::make_shared<ContentStore>(settings.cacheDir()),
                     std::make_shared<HttpClient>(settings.requestTimeoutMs(), settings.userAgent(), settings.authProvider()),
                     settings)
{
}

DownloadEngine::DownloadEngine(std::shared_ptr<ContentStore> store,
                               std::shared_ptr<HttpClient> client,
                               const HubSettings& settings)
    : mStore(std::move(store)),
      mClient(std::move(client)),
      mPlanner(std::make_shared<TransferPlanner>(mStore, mClient, settings)),
      mSettings(settings),
      mPool(std::make_unique<QThreadPool>()),
      mCoordinatorPool(std::make_unique<QThreadPool>())
{
    mPool->setMaxThreadCount(mSettings.maxWorkers());
    mCoordinatorPool->setMaxThreadCount(mSettings.maxWorkers());
}

DownloadEngine::~DownloadEngine()
{
    //Coordinators queue work on mPool, drain them first
    mCoordinatorPool->waitForDone();
    mPool->waitForDone();
}

QFuture<Monad::Result<DownloadResult>> DownloadEngine::download(const DownloadRequest& request,
                                                                ProgressCallback progress)
{
    QFutureInterface<Monad::Result<DownloadResult>> interface;
    interface.reportStarted();

    mPool->start([this, request, progress, interface]() mutable {
        auto result = downloadBlocking(request, [&interface, &progress](const ProgressState& state) {
            setProgress(&interface, state);
            if (progress) {
                progress(state);
            }
        });
        interface.reportResult(result);
        interface.reportFinished();
    });

    return interface.future();
}

Monad::Result<DownloadResult> DownloadEngine::downloadBlocking(const DownloadRequest& request,
                                                               ProgressCallback progress) const
{
    const auto planned = mPlanner->plan(request);
    if (planned.hasError()) {
        qWarning() << "[DownloadEngine] planning failed for" << request.path << errorCodeName(planned.errorCode())
                   << planned.errorMessage();
        return Monad::Result<DownloadResult>(planned.errorMessage(), planned.errorCode());
    }

    TransferPlan plan = planned.value();
    if (plan.kind == TransferPlan::Kind::CacheHit) {
        return completeHit(request, plan.entry);
    }

    const auto lock = mStore->lockFor(request.repo, request.revision + QLatin1Char('/') + request.path, mSettings.lockTimeoutMs());
    if (!lock) {
        //The shared temp file and its sidecar belong to the lock holder
        const auto privateTemp = mStore->createUniqueTempFile();
        if (privateTemp.hasError()) {
            return Monad::Result<DownloadResult>(privateTemp.errorMessage(), privateTemp.errorCode());
        }
        qWarning() << "[DownloadEngine] lock busy, downloading" << request.path << "into" << privateTemp.value();

        TransferState state(plan.resolveUrl.toString(), privateTemp.value(), plan.remote.size, plan.remote.etag);
        state.setSha256(plan.state.sha256());
        plan.kind = TransferPlan::Kind::FetchFull;
        plan.state = state;
        plan.privateTemp = true;
    } else {
        if (!request.forceDownload) {
            //Another writer may have finished the same file while we waited
            const auto located = mStore->locate(request.repo, request.revision, request.path);
            if (!located.hasError() && TransferPlanner::entryMatchesRemote(located.value(), plan.remote)) {
                return completeHit(request, located.value());
            }
            plan = mPlanner->planFor(request, plan.resolveUrl, located, plan.remote);
        }
        if (plan.kind == TransferPlan::Kind::FetchFull) {
            TransferState::remove(plan.state.tempPath());
        }
    }

    qDebug() << "[DownloadEngine] fetching" << plan.resolveUrl.toString()
             << (plan.kind == TransferPlan::Kind::FetchResume ? "resume at" : "from")
             << plan.state.bytesTransferred();

    const auto fetched = fetch(&plan, request.path, progress);
    if (fetched.hasError()) {
        return Monad::Result<DownloadResult>(fetched.errorMessage(), fetched.errorCode());
    }

    return finish(request, plan, fetched.value());
}

QFuture<SnapshotResult> DownloadEngine::snapshot(const SnapshotRequest& request, ProgressCallback progress)
{
    QFutureInterface<SnapshotResult> interface;
    interface.reportStarted();

    //The coordinator only waits, so it stays off the download pool
    mCoordinatorPool->start([this, request, progress, interface]() mutable {
        auto result = snapshotBlocking(request, progress);
        interface.reportResult(result);
        interface.reportFinished();
    });

    return interface.future();
}

SnapshotResult DownloadEngine::snapshotBlocking(const SnapshotRequest& request, ProgressCallback progress)
{
    SnapshotResult result;
    result.snapshotPath = mStore->revisionPath(request.repo, request.revision);

    QVector<QPair<QString, QFuture<Monad::Result<DownloadResult>>>> pending;
    for (const auto& file : request.files) {
        if (!matchesPatterns(file.path, request.allowPatterns, request.ignorePatterns)) {
            result.skipped.append(file.path);
            continue;
        }

        DownloadRequest fileRequest;
        fileRequest.repo = request.repo;
        fileRequest.revision = request.revision;
        fileRequest.path = file.path;
        fileRequest.forceDownload = request.forceDownload;
        fileRequest.extract = request.extract;
        fileRequest.knownSize = file.size;
        fileRequest.knownEtag = file.etag;
        pending.append(qMakePair(file.path, download(fileRequest, progress)));
    }

    qInfo() << "[DownloadEngine] snapshot" << request.repo.repoId() << request.revision
            << pending.size() << "files," << result.skipped.size() << "skipped";

    for (auto& item : pending) {
        item.second.waitForFinished();
        const auto fileResult = item.second.result();

        SnapshotResult::FileOutcome outcome;
        outcome.path = item.first;
        if (fileResult.hasError()) {
            outcome.errorMessage = fileResult.errorMessage();
            outcome.errorCode = fileResult.errorCode() != 0 ? fileResult.errorCode() : errorCode(TransferErrorCode::Io);
        } else {
            outcome.result = fileResult.value();
        }
        result.files.append(outcome);
    }

    const auto overall = result.overall();
    if (overall.hasError()) {
        qWarning() << "[DownloadEngine] snapshot incomplete" << overall.errorMessage();
    }
    return result;
}

Monad::Result<ArchiveExtractor::Extraction> DownloadEngine::extractEntry(const CacheEntry& entry) const
{
    const auto format = ArchiveExtractor::detectFormat(entry.relativePath);
    if (format == ArchiveExtractor::Format::Unknown) {
        ArchiveExtractor::Extraction notArchive;
        notArchive.destination = entry.absolutePath;
        return Monad::Result<ArchiveExtractor::Extraction>(notArchive);
    }

    QString sha256 = entry.sha256;
    if (sha256.isEmpty()) {
        const auto digest = HashUtilities::sha256HexForFile(entry.absolutePath);
        if (digest.hasError()) {
            return Monad::Result<ArchiveExtractor::Extraction>(digest.errorMessage(), digest.errorCode());
        }
        sha256 = digest.value().sha256;
    }

    const QString target = entry.absolutePath + ContentStore::ExtractedMarker + HashUtilities::shortHash(sha256);
    const QString outputName = QFileInfo(ArchiveExtractor::defaultExtractPath(entry.absolutePath)).fileName();
    const bool singleFile = format == ArchiveExtractor::Format::Gzip;

    QDir targetDir(target);
    if (targetDir.exists() && !targetDir.isEmpty()) {
        qDebug() << "[DownloadEngine] reusing extraction" << target;
        auto extraction = listExtracted(target, format);
        if (singleFile) {
            extraction.destination = targetDir.filePath(outputName);
        }
        return Monad::Result<ArchiveExtractor::Extraction>(extraction);
    }

    const QString staging = target + QStringLiteral(".partial");
    QDir(staging).removeRecursively();

    const QString destination = singleFile ? QDir(staging).filePath(outputName) : staging;
    const auto extracted = ArchiveExtractor::extract(entry.absolutePath, destination);
    if (extracted.hasError()) {
        QDir(staging).removeRecursively();
        return extracted;
    }

    if (targetDir.exists()) {
        targetDir.removeRecursively();
    }
    if (!QDir().rename(staging, target)) {
        QDir(staging).removeRecursively();
        return Monad::Result<ArchiveExtractor::Extraction>(QStringLiteral("Failed to move extraction into %1").arg(target),
                                                           errorCode(TransferErrorCode::Io));
    }

    auto extraction = extracted.value();
    extraction.destination = singleFile ? QDir(target).filePath(outputName) : target;
    qInfo() << "[DownloadEngine] extracted" << extraction.files.size() << "files into" << target;
    return Monad::Result<ArchiveExtractor::Extraction>(extraction);
}

bool DownloadEngine::matchesPatterns(const QString& path,
                                     const QStringList& allowPatterns,
                                     const QStringList& ignorePatterns)
{
    const QString fileName = QFileInfo(path).fileName();
    auto matches = [&path, &fileName](QString pattern) {
        if (pattern.endsWith(QLatin1Char('/'))) {
            pattern += QLatin1Char('*');
        }
        const QRegularExpression expression(QRegularExpression::wildcardToRegularExpression(pattern));
        return expression.match(path).hasMatch() || expression.match(fileName).hasMatch();
    };

    if (!allowPatterns.isEmpty() && std::none_of(allowPatterns.begin(), allowPatterns.end(), matches)) {
        return false;
    }
    return std::none_of(ignorePatterns.begin(), ignorePatterns.end(), matches);
}

Monad::Result<qint64> DownloadEngine::fetch(TransferPlan* plan,
                                            const QString& displayPath,
                                            const ProgressCallback& progress) const
{
    qint64 total = 0;
    const int attempts = mSettings.maxRetries() + 1;

    for (int attempt = 0; attempt < attempts; ++attempt) {
        qint64 fetched = 0;
        const auto result = fetchAttempt(plan, displayPath, progress, &fetched);
        total += fetched;
        if (!result.hasError()) {
            return Monad::Result<qint64>(total);
        }

        const bool retryable = isRetryableError(result.errorCode());
        if (!retryable || attempt + 1 >= attempts) {
            if (!retryable || !isResumable(*plan)) {
                discardTemp(plan->state.tempPath());
            }
            qWarning() << "[DownloadEngine] giving up on" << displayPath << "after" << attempt + 1 << "attempts:"
                       << errorCodeName(result.errorCode()) << result.errorMessage();
            return result;
        }

        if (!isResumable(*plan)) {
            plan->kind = TransferPlan::Kind::FetchFull;
        }

        const int backoff = mSettings.retryBackoffMs() * (1 << qMin(attempt, 5));
        qWarning() << "[DownloadEngine] retrying" << displayPath << "in" << backoff << "ms:" << result.errorMessage();
        QThread::msleep(static_cast<unsigned long>(backoff));
    }

    return Monad::Result<qint64>(QStringLiteral("No download attempts for %1").arg(displayPath),
                                 errorCode(TransferErrorCode::NetworkFailure));
}

Monad::Result<qint64> DownloadEngine::fetchAttempt(TransferPlan* plan,
                                                   const QString& displayPath,
                                                   const ProgressCallback& progress,
                                                   qint64* fetchedOut) const
{
    TransferState& state = plan->state;
    const bool resumable = isResumable(*plan);
    qint64 offset = plan->kind == TransferPlan::Kind::FetchResume ? state.bytesTransferred() : 0;
    qint64 expected = state.expectedSize();

    QFile file(state.tempPath());
    const QIODevice::OpenMode mode = offset > 0 ? QIODevice::ReadWrite : (QIODevice::WriteOnly | QIODevice::Truncate);
    if (!file.open(mode)) {
        return Monad::Result<qint64>(QStringLiteral("Failed to open temp file %1: %2").arg(file.fileName(), file.errorString()),
                                     errorCode(TransferErrorCode::Io));
    }
    if (offset > 0 && (!file.resize(offset) || !file.seek(offset))) {
        return Monad::Result<qint64>(QStringLiteral("Failed to position temp file %1 at %2").arg(file.fileName()).arg(offset),
                                     errorCode(TransferErrorCode::Io));
    }

    HttpClient::Request request;
    request.url = plan->remote.downloadUrl.isValid() ? plan->remote.downloadUrl : plan->resolveUrl;
    request.authenticate = !plan->remote.redirected;
    request.headers.insert(QByteArrayLiteral("Accept-Encoding"), QByteArrayLiteral("identity"));
    if (offset > 0) {
        request.headers.insert(QByteArrayLiteral("Range"), QByteArrayLiteral("bytes=") + QByteArray::number(offset) + '-');
    }

    qint64 written = 0;
    qint64 sinceCheckpoint = 0;

    HttpClient::StreamHandler handler;
    handler.onHeaders = [&](const HttpClient::Response& response) -> Monad::ResultBase {
        if (offset > 0 && response.status != 206) {
            qInfo() << "[DownloadEngine] server ignored range for" << displayPath << "restarting from zero";
            if (!file.resize(0) || !file.seek(0)) {
                return errorFor(TransferErrorCode::Io, QStringLiteral("Failed to truncate %1").arg(file.fileName()));
            }
            offset = 0;
        } else if (offset > 0) {
            const qint64 start = contentRangeStart(response.header(QByteArrayLiteral("content-range")));
            if (start != offset) {
                return errorFor(TransferErrorCode::Protocol,
                                QStringLiteral("Range answer starts at %1, expected %2").arg(start).arg(offset));
            }
        }

        if (expected <= 0) {
            bool ok = false;
            const qint64 length = response.header(QByteArrayLiteral("content-length")).toLongLong(&ok);
            if (ok) {
                expected = offset + length;
            }
        }
        return Monad::ResultBase();
    };

    handler.onData = [&](const QByteArray& chunk) -> Monad::ResultBase {
        if (file.write(chunk) != chunk.size()) {
            return errorFor(TransferErrorCode::Io, QStringLiteral("Failed to write %1: %2").arg(file.fileName(), file.errorString()));
        }
        written += chunk.size();
        sinceCheckpoint += chunk.size();

        const qint64 current = offset + written;
        if (expected > 0 && current > expected) {
            return errorFor(TransferErrorCode::ChecksumMismatch,
                            QStringLiteral("Received %1 bytes for %2, expected %3").arg(current).arg(displayPath).arg(expected));
        }

        if (resumable && sinceCheckpoint >= mSettings.checkpointWindow()) {
            file.flush();
            state.setBytesTransferred(current);
            const auto saved = state.save();
            if (saved.hasError()) {
                return saved;
            }
            sinceCheckpoint = 0;
        }

        if (progress) {
            progress(ProgressState(displayPath, current, expected));
        }
        return Monad::ResultBase();
    };

    const auto response = mClient->stream(request, handler);
    file.flush();
    file.close();

    const qint64 onDisk = offset + written;
    if (fetchedOut) {
        *fetchedOut = written;
    }

    auto preserve = [&]() {
        if (!resumable || onDisk <= 0) {
            return;
        }
        state.setBytesTransferred(onDisk);
        const auto saved = state.save();
        if (saved.hasError()) {
            qWarning() << "[DownloadEngine] failed to save resume state" << saved.errorMessage();
            return;
        }
        plan->kind = TransferPlan::Kind::FetchResume;
    };

    if (response.hasError()) {
        if (isRetryableError(response.errorCode())) {
            preserve();
        }
        return Monad::Result<qint64>(response.errorMessage(), response.errorCode());
    }

    if (expected > 0 && onDisk < expected) {
        preserve();
        return Monad::Result<qint64>(QStringLiteral("Connection closed after %1 of %2 bytes for %3")
                                         .arg(onDisk).arg(expected).arg(displayPath),
                                     errorCode(TransferErrorCode::NetworkFailure));
    }

    return Monad::Result<qint64>(onDisk);
}

Monad::Result<DownloadResult> DownloadEngine::finish(const DownloadRequest& request,
                                                     const TransferPlan& plan,
                                                     qint64 bytesFetched) const
{
    const QString tempPath = plan.state.tempPath();
    const QString etag = plan.remote.etag;

    const auto digest = HashUtilities::sha256HexForFile(tempPath);
    if (digest.hasError()) {
        discardTemp(tempPath);
        return Monad::Result<DownloadResult>(digest.errorMessage(), digest.errorCode());
    }

    const qint64 expected = plan.state.expectedSize();
    if (expected > 0 && digest.value().size != expected) {
        discardTemp(tempPath);
        return Monad::Result<DownloadResult>(QStringLiteral("Size mismatch for %1: got %2 bytes, expected %3")
                                                 .arg(request.path).arg(digest.value().size).arg(expected),
                                             errorCode(TransferErrorCode::ChecksumMismatch));
    }

    if (HashUtilities::isSha256Hex(etag) && digest.value().sha256 != etag.toLower()) {
        discardTemp(tempPath);
        qWarning() << "[DownloadEngine] checksum mismatch for" << request.path << digest.value().sha256 << etag;
        return Monad::Result<DownloadResult>(QStringLiteral("Checksum mismatch for %1: got %2, expected %3")
                                                 .arg(request.path, digest.value().sha256, etag.toLower()),
                                             errorCode(TransferErrorCode::ChecksumMismatch));
    }

    const auto promoted = mStore->promote(tempPath, request.repo, request.revision, request.path, digest.value().sha256, etag);
    if (promoted.hasError()) {
        discardTemp(tempPath);
        return Monad::Result<DownloadResult>(promoted.errorMessage(), promoted.errorCode());
    }
    TransferState::remove(tempPath);

    DownloadResult result;
    result.outcome = plan.kind == TransferPlan::Kind::FetchResume ? DownloadResult::Outcome::Resumed
                                                                  : DownloadResult::Outcome::Downloaded;
    result.entry = promoted.value();
    result.bytesFetched = bytesFetched;

    if (request.extract) {
        const auto extraction = extractEntry(result.entry);
        if (extraction.hasError()) {
            return Monad::Result<DownloadResult>(extraction.errorMessage(), extraction.errorCode());
        }
        result.extraction = extraction.value();
        if (result.extraction.isArchive) {
            result.extractedPath = result.extraction.destination;
        }
    }

    qInfo() << "[DownloadEngine]" << (result.outcome == DownloadResult::Outcome::Resumed ? "resumed" : "downloaded")
            << request.path << ProgressState::bytesToString(bytesFetched);
    return Monad::Result<DownloadResult>(result);
}

Monad::Result<DownloadResult> DownloadEngine::completeHit(const DownloadRequest& request, const CacheEntry& entry) const
{
    DownloadResult result;
    result.outcome = DownloadResult::Outcome::CacheHit;
    result.entry = entry;

    if (request.extract) {
        const auto extraction = extractEntry(entry);
        if (extraction.hasError()) {
            return Monad::Result<DownloadResult>(extraction.errorMessage(), extraction.errorCode());
        }
        result.extraction = extraction.value();
        if (result.extraction.isArchive) {
            result.extractedPath = result.extraction.destination;
        }
    }

    qDebug() << "[DownloadEngine] cache hit" << entry.key();
    return Monad::Result<DownloadResult>(result);
}

bool DownloadEngine::isResumable(const TransferPlan& plan) const
{
    return !plan.privateTemp && plan.state.expectedSize() >= mSettings.largeFileThreshold();
}

void DownloadEngine::discardTemp(const QString& tempPath)
{
    QFile::remove(tempPath);
    TransferState::remove(tempPath);
}
