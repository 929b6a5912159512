#ifndef TRANSFERSTATE_H
#define TRANSFERSTATE_H

#include <QDateTime>
#include <QString>
#include <QVariantMap>

#include "Monad/Result.h"

namespace HubTransfer {

/**
 * Resume record of one interrupted download, persisted as a JSON sidecar
 * beside the temp file so it survives a process restart.
 */
class TransferState
{
public:
    TransferState() = default;
    TransferState(QString url, QString tempPath, qint64 expectedSize, QString etag);

    QString url() const { return mUrl; }
    QString tempPath() const { return mTempPath; }
    qint64 expectedSize() const { return mExpectedSize; }
    QString etag() const { return mEtag; }

    QString sha256() const { return mSha256; }
    void setSha256(const QString& sha256) { mSha256 = sha256; }

    qint64 bytesTransferred() const { return mBytesTransferred; }
    void setBytesTransferred(qint64 bytes);

    QDateTime createdAt() const { return mCreatedAt; }
    QDateTime updatedAt() const { return mUpdatedAt; }

    bool isValid() const { return !mUrl.isEmpty() && !mTempPath.isEmpty(); }
    bool isComplete() const { return mExpectedSize > 0 && mBytesTransferred >= mExpectedSize; }

    //Same url and etag, incomplete, and the temp file still holds the
    //recorded bytes
    bool canResume(const QString& url, const QString& etag) const;

    QString sidecarPath() const { return sidecarPathFor(mTempPath); }

    QVariantMap data() const;
    QByteArray toJson() const;
    static Monad::Result<TransferState> fromJson(const QByteArray& json);

    Monad::ResultBase save();
    static Monad::Result<TransferState> load(const QString& tempPath);
    static void remove(const QString& tempPath);

    static QString sidecarPathFor(const QString& tempPath);

private:
    QString mUrl;
    QString mTempPath;
    qint64 mExpectedSize = 0;
    QString mEtag;
    QString mSha256;
    qint64 mBytesTransferred = 0;
    QDateTime mCreatedAt;
    QDateTime mUpdatedAt;
};

} // namespace HubTransfer

#endif // TRANSFERSTATE_H
