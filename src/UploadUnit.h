#ifndef UPLOADUNIT_H
#define UPLOADUNIT_H

//Qt includes
#include <QByteArray>
#include <QString>
#include <QVector>

//Our includes
#include "Monad/Result.h"

namespace HubTransfer {

struct UploadChunk {
    int partNumber = 0;
    qint64 offset = 0;
    qint64 length = 0;
    QString etag;
    bool done = false;
};

/**
 * One file queued for the large object pipeline. The OID is the hex sha-256
 * of the content, so identical files always share an OID.
 */
class UploadUnit
{
public:
    static constexpr int SampleBytes = 512;

    enum class Mode {
        SinglePart,
        Multipart
    };

    enum class State {
        Planned,
        BatchNegotiated,
        Uploading,
        Verified,
        AlreadyPresent,
        Failed
    };

    UploadUnit() = default;

    //Streams the file through sha-256 and keeps the first bytes as a sample
    static Monad::Result<UploadUnit> fromFile(const QString& localPath, const QString& pathInRepo);

    QString pathInRepo() const { return mPathInRepo; }
    QString localPath() const { return mLocalPath; }
    QString oid() const { return mOid; }
    qint64 size() const { return mSize; }
    QByteArray sample() const { return mSample; }

    Mode mode() const { return mMode; }
    State state() const { return mState; }
    void setState(State state) { mState = state; }

    const QVector<UploadChunk>& chunks() const { return mChunks; }
    void markChunkDone(int partNumber, const QString& etag);
    bool allChunksDone() const;

    //Switches to multipart and splits [0, size) into fixed-size parts
    //numbered from 1
    void splitIntoChunks(qint64 chunkSize);

    QString errorMessage() const { return mErrorMessage; }
    int errorCode() const { return mErrorCode; }
    bool hasError() const { return mState == State::Failed; }
    void fail(const QString& message, int code);

    //Verified or AlreadyPresent
    bool isDone() const;

    static QString stateName(State state);

private:
    QString mPathInRepo;
    QString mLocalPath;
    QString mOid;
    qint64 mSize = 0;
    QByteArray mSample;
    Mode mMode = Mode::SinglePart;
    State mState = State::Planned;
    QVector<UploadChunk> mChunks;
    QString mErrorMessage;
    int mErrorCode = 0;
};

} // namespace HubTransfer

#endif // UPLOADUNIT_H
