//Our includes
#include "UploadUnit.h"
#include "HashUtilities.h"
#include "TransferError.h"

//Qt includes
#include <QFile>

using namespace HubTransfer;

Monad::Result<UploadUnit> UploadUnit::fromFile(const QString& localPath, const QString& pathInRepo)
{
    QFile file(localPath);
    if (!file.open(QIODevice::ReadOnly)) {
        return Monad::Result<UploadUnit>(QStringLiteral("Failed to open %1 for upload: %2").arg(localPath, file.errorString()),
                                         errorCode(TransferErrorCode::Io));
    }
    const QByteArray sample = file.read(SampleBytes);
    file.close();

    const auto digest = HashUtilities::sha256HexForFile(localPath);
    if (digest.hasError()) {
        return Monad::Result<UploadUnit>(digest.errorMessage(), digest.errorCode());
    }

    UploadUnit unit;
    unit.mPathInRepo = pathInRepo;
    unit.mLocalPath = localPath;
    unit.mOid = digest.value().sha256;
    unit.mSize = digest.value().size;
    unit.mSample = sample;
    return Monad::Result<UploadUnit>(unit);
}

void UploadUnit::markChunkDone(int partNumber, const QString& etag)
{
    for (auto& chunk : mChunks) {
        if (chunk.partNumber == partNumber) {
            chunk.etag = etag;
            chunk.done = true;
            return;
        }
    }
}

bool UploadUnit::allChunksDone() const
{
    for (const auto& chunk : mChunks) {
        if (!chunk.done) {
            return false;
        }
    }
    return true;
}

void UploadUnit::splitIntoChunks(qint64 chunkSize)
{
    mMode = Mode::Multipart;
    mChunks.clear();
    if (chunkSize <= 0) {
        return;
    }

    int partNumber = 1;
    for (qint64 offset = 0; offset < mSize; offset += chunkSize) {
        UploadChunk chunk;
        chunk.partNumber = partNumber++;
        chunk.offset = offset;
        chunk.length = qMin(chunkSize, mSize - offset);
        mChunks.append(chunk);
    }
}

void UploadUnit::fail(const QString& message, int code)
{
    mState = State::Failed;
    mErrorMessage = message;
    mErrorCode = code;
}

bool UploadUnit::isDone() const
{
    return mState == State::Verified || mState == State::AlreadyPresent;
}

QString UploadUnit::stateName(State state)
{
    switch (state) {
    case State::Planned:
        return QStringLiteral("Planned");
    case State::BatchNegotiated:
        return QStringLiteral("BatchNegotiated");
    case State::Uploading:
        return QStringLiteral("Uploading");
    case State::Verified:
        return QStringLiteral("Verified");
    case State::AlreadyPresent:
        return QStringLiteral("AlreadyPresent");
    case State::Failed:
        return QStringLiteral("Failed");
    }
    return QString();
}
