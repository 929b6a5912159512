#ifndef LFSBATCHCLIENT_H
#define LFSBATCHCLIENT_H

//Qt includes
#include <QByteArray>
#include <QHash>
#include <QMap>
#include <QUrl>
#include <QVector>

//Std includes
#include <memory>

//Our includes
#include "RepoRef.h"
#include "UploadUnit.h"
#include "Monad/Result.h"

namespace HubTransfer {

class HttpClient;

/**
 * Large object batch protocol for uploads: negotiation, single part PUT,
 * multipart part upload and completion, and verification.
 *
 * All calls block the calling thread, the upload pipeline calls them from
 * its worker pools. Action hrefs are pre-signed, so only the batch request
 * itself carries the hub bearer token.
 */
class LfsBatchClient
{
public:
    struct ObjectSpec {
        QString oid;
        qint64 size = 0;
    };

    struct Action {
        QUrl href;
        QMap<QByteArray, QByteArray> headers;
    };

    struct ObjectResponse {
        QString oid;
        qint64 size = 0;
        QHash<QString, Action> actions;
        int errorCode = 0;
        QString errorMessage;

        bool hasError() const { return errorCode != 0; }
        bool hasAction(const QString& name) const { return actions.contains(name); }
    };

    struct BatchResponse {
        QString transfer;
        QVector<ObjectResponse> objects;

        const ObjectResponse* find(const QString& oid) const;
    };

    LfsBatchClient(std::shared_ptr<HttpClient> client, QUrl endpoint);

    //<endpoint>/<prefix><repo_id>.git/info/lfs/objects/batch
    QUrl batchUrl(const RepoRef& repo) const;

    Monad::Result<BatchResponse> batchUpload(const RepoRef& repo, const QVector<ObjectSpec>& objects) const;

    Monad::ResultBase uploadSinglePart(const Action& action, const QString& localPath, qint64 expectedSize) const;

    //Returns the ETag the storage assigned to the part
    Monad::Result<QString> uploadPart(const QUrl& partUrl, const QByteArray& data) const;

    Monad::ResultBase completeMultipart(const Action& action,
                                       const QString& oid,
                                       const QVector<UploadChunk>& chunks) const;

    Monad::ResultBase verifyObject(const Action& action, const ObjectSpec& object) const;

    static QByteArray buildBatchRequestBody(const QVector<ObjectSpec>& objects);
    static Monad::Result<BatchResponse> parseBatchResponse(const QByteArray& body);

    //Parts sorted ascending by number whatever order they finished in
    static QByteArray buildCompletionBody(const QString& oid, const QVector<UploadChunk>& chunks);
    static QByteArray buildVerifyBody(const ObjectSpec& object);

    //-1 when the action describes a single part upload
    static qint64 chunkSize(const Action& action);

    //Keyed by part number. Accepts "1", "2", ... and x-amz-meta-part-<n>-url
    static QMap<int, QUrl> partUrls(const Action& action);

    static const QByteArray LfsMediaType;

private:
    std::shared_ptr<HttpClient> mClient;
    QUrl mEndpoint;
};

} // namespace HubTransfer

#endif // LFSBATCHCLIENT_H
