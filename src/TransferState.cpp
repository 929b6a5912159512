//Our includes
#include "TransferState.h"
#include "TransferError.h"

//Qt includes
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>

static const QString urlKey = QStringLiteral("url");
static const QString tempPathKey = QStringLiteral("tempPath");
static const QString expectedSizeKey = QStringLiteral("expectedSize");
static const QString etagKey = QStringLiteral("etag");
static const QString sha256Key = QStringLiteral("sha256");
static const QString bytesTransferredKey = QStringLiteral("bytesTransferred");
static const QString createdAtKey = QStringLiteral("createdAt");
static const QString updatedAtKey = QStringLiteral("updatedAt");

using namespace HubTransfer;

TransferState::TransferState(QString url, QString tempPath, qint64 expectedSize, QString etag) :
    mUrl(std::move(url)),
    mTempPath(std::move(tempPath)),
    mExpectedSize(expectedSize),
    mEtag(std::move(etag)),
    mCreatedAt(QDateTime::currentDateTimeUtc()),
    mUpdatedAt(mCreatedAt)
{
}

void TransferState::setBytesTransferred(qint64 bytes)
{
    if(mExpectedSize > 0) {
        bytes = qMin(bytes, mExpectedSize);
    }
    mBytesTransferred = qMax<qint64>(0, bytes);
    mUpdatedAt = QDateTime::currentDateTimeUtc();
}

bool TransferState::canResume(const QString& url, const QString& etag) const
{
    if(!isValid() || mUrl != url || mEtag != etag) {
        return false;
    }
    if(mBytesTransferred <= 0 || isComplete()) {
        return false;
    }
    const QFileInfo info(mTempPath);
    return info.isFile() && info.size() >= mBytesTransferred;
}

QVariantMap TransferState::data() const
{
    return {
        {urlKey, mUrl},
        {tempPathKey, mTempPath},
        {expectedSizeKey, mExpectedSize},
        {etagKey, mEtag},
        {sha256Key, mSha256},
        {bytesTransferredKey, mBytesTransferred},
        {createdAtKey, mCreatedAt.toString(Qt::ISODateWithMs)},
        {updatedAtKey, mUpdatedAt.toString(Qt::ISODateWithMs)}
    };
}

QByteArray TransferState::toJson() const
{
    return QJsonDocument::fromVariant(data()).toJson(QJsonDocument::Compact);
}

Monad::Result<TransferState> TransferState::fromJson(const QByteArray& json)
{
    QJsonParseError parseError{};
    const QJsonDocument document = QJsonDocument::fromJson(json, &parseError);
    if(document.isNull() || !document.isObject()) {
        return Monad::Result<TransferState>(QStringLiteral("Invalid resume sidecar: %1").arg(parseError.errorString()),
                                            errorCode(TransferErrorCode::Io));
    }

    const QJsonObject root = document.object();
    TransferState state;
    state.mUrl = root.value(urlKey).toString();
    state.mTempPath = root.value(tempPathKey).toString();
    state.mExpectedSize = static_cast<qint64>(root.value(expectedSizeKey).toDouble());
    state.mEtag = root.value(etagKey).toString();
    state.mSha256 = root.value(sha256Key).toString();
    state.mBytesTransferred = static_cast<qint64>(root.value(bytesTransferredKey).toDouble());
    state.mCreatedAt = QDateTime::fromString(root.value(createdAtKey).toString(), Qt::ISODateWithMs);
    state.mUpdatedAt = QDateTime::fromString(root.value(updatedAtKey).toString(), Qt::ISODateWithMs);

    if(!state.isValid()) {
        return Monad::Result<TransferState>(QStringLiteral("Resume sidecar is missing url or temp path"),
                                            errorCode(TransferErrorCode::Io));
    }
    return Monad::Result<TransferState>(state);
}

Monad::ResultBase TransferState::save()
{
    mUpdatedAt = QDateTime::currentDateTimeUtc();

    QSaveFile file(sidecarPath());
    if(!file.open(QIODevice::WriteOnly)) {
        return Monad::ResultBase(QStringLiteral("Failed to open resume sidecar %1: %2").arg(sidecarPath(), file.errorString()),
                                 errorCode(TransferErrorCode::Io));
    }
    file.write(toJson());
    if(!file.commit()) {
        return Monad::ResultBase(QStringLiteral("Failed to write resume sidecar %1: %2").arg(sidecarPath(), file.errorString()),
                                 errorCode(TransferErrorCode::Io));
    }
    return Monad::ResultBase();
}

Monad::Result<TransferState> TransferState::load(const QString& tempPath)
{
    QFile file(sidecarPathFor(tempPath));
    if(!file.open(QIODevice::ReadOnly)) {
        return Monad::Result<TransferState>(QStringLiteral("No resume sidecar for %1").arg(tempPath),
                                            errorCode(TransferErrorCode::NotCached));
    }
    return fromJson(file.readAll());
}

void TransferState::remove(const QString& tempPath)
{
    QFile::remove(sidecarPathFor(tempPath));
}

QString TransferState::sidecarPathFor(const QString& tempPath)
{
    return tempPath + QStringLiteral(".json");
}
