//Our includes
#include "LfsBatchClient.h"
#include "HttpClient.h"
#include "TransferError.h"

//Qt includes
#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QRegularExpression>

//Std includes
#include <algorithm>

using namespace HubTransfer;

const QByteArray LfsBatchClient::LfsMediaType = QByteArrayLiteral("application/vnd.git-lfs+json");

namespace {

QByteArray actionHeader(const LfsBatchClient::Action& action, const QByteArray& name)
{
    for (auto it = action.headers.constBegin(); it != action.headers.constEnd(); ++it) {
        if (it.key().compare(name, Qt::CaseInsensitive) == 0) {
            return it.value();
        }
    }
    return QByteArray();
}

Monad::ResultBase missingHref(const QString& what)
{
    return Monad::ResultBase(QStringLiteral("Missing LFS %1 href").arg(what),
                             errorCode(TransferErrorCode::Protocol));
}

//Error codes the batch api puts on individual objects follow http status
int objectErrorCode(int lfsCode)
{
    if (lfsCode >= 400) {
        return HttpClient::errorCodeForStatus(lfsCode, QByteArray());
    }
    return errorCode(TransferErrorCode::Protocol);
}

}

const LfsBatchClient::ObjectResponse* LfsBatchClient::BatchResponse::find(const QString& oid) const
{
    for (const auto& object : objects) {
        if (object.oid == oid) {
            return &object;
        }
    }
    return nullptr;
}

LfsBatchClient::LfsBatchClient(std::shared_ptr<HttpClient> client, QUrl endpoint)
    : mClient(std::move(client)),
      mEndpoint(std::move(endpoint))
{
}

QUrl LfsBatchClient::batchUrl(const RepoRef& repo) const
{
    const QByteArray encoded = mEndpoint.toEncoded()
                               + '/'
                               + repo.urlPrefix().toUtf8()
                               + QUrl::toPercentEncoding(repo.repoId(), "/")
                               + ".git/info/lfs/objects/batch";
    return QUrl::fromEncoded(encoded);
}

Monad::Result<LfsBatchClient::BatchResponse> LfsBatchClient::batchUpload(const RepoRef& repo,
                                                                         const QVector<ObjectSpec>& objects) const
{
    HttpClient::Request request;
    request.method = QByteArrayLiteral("POST");
    request.url = batchUrl(repo);
    request.headers.insert(QByteArrayLiteral("Accept"), LfsMediaType);
    request.headers.insert(QByteArrayLiteral("Content-Type"), LfsMediaType);
    request.body = buildBatchRequestBody(objects);

    qDebug() << "[LfsBatchClient] batch upload" << request.url.toString() << "objects" << objects.size();

    const auto sent = mClient->send(request);
    if (sent.hasError()) {
        return Monad::Result<BatchResponse>(QStringLiteral("LFS batch request failed: %1").arg(sent.errorMessage()),
                                            sent.errorCode());
    }
    return parseBatchResponse(sent.value().body);
}

Monad::ResultBase LfsBatchClient::uploadSinglePart(const Action& action, const QString& localPath, qint64 expectedSize) const
{
    if (!action.href.isValid() || action.href.isEmpty()) {
        return missingHref(QStringLiteral("upload"));
    }

    QFile file(localPath);
    if (!file.open(QIODevice::ReadOnly)) {
        return Monad::ResultBase(QStringLiteral("Failed to open %1 for upload: %2").arg(localPath, file.errorString()),
                                 errorCode(TransferErrorCode::Io));
    }
    if (file.size() != expectedSize) {
        return Monad::ResultBase(QStringLiteral("%1 changed size before upload, expected %2 got %3")
                                     .arg(localPath)
                                     .arg(expectedSize)
                                     .arg(file.size()),
                                 errorCode(TransferErrorCode::Io));
    }

    HttpClient::Request request;
    request.method = QByteArrayLiteral("PUT");
    request.url = action.href;
    request.authenticate = false;
    request.followRedirects = false;
    request.headers = action.headers;
    request.headers.insert(QByteArrayLiteral("Content-Type"), QByteArrayLiteral("application/octet-stream"));
    request.headers.insert(QByteArrayLiteral("Content-Length"), QByteArray::number(expectedSize));
    request.bodyDevice = &file;

    const auto sent = mClient->send(request);
    if (sent.hasError()) {
        return Monad::ResultBase(QStringLiteral("LFS upload failed: %1").arg(sent.errorMessage()), sent.errorCode());
    }
    return Monad::ResultBase();
}

Monad::Result<QString> LfsBatchClient::uploadPart(const QUrl& partUrl, const QByteArray& data) const
{
    if (!partUrl.isValid() || partUrl.isEmpty()) {
        const auto missing = missingHref(QStringLiteral("part"));
        return Monad::Result<QString>(missing.errorMessage(), missing.errorCode());
    }

    HttpClient::Request request;
    request.method = QByteArrayLiteral("PUT");
    request.url = partUrl;
    request.authenticate = false;
    request.body = data;

    const auto sent = mClient->send(request);
    if (sent.hasError()) {
        return Monad::Result<QString>(QStringLiteral("LFS part upload failed: %1").arg(sent.errorMessage()),
                                      sent.errorCode());
    }

    const QByteArray etag = sent.value().header(QByteArrayLiteral("etag")).trimmed();
    if (etag.isEmpty()) {
        return Monad::Result<QString>(QStringLiteral("No ETag returned for part %1").arg(partUrl.toString()),
                                      errorCode(TransferErrorCode::Protocol));
    }
    return Monad::Result<QString>(QString::fromUtf8(etag));
}

Monad::ResultBase LfsBatchClient::completeMultipart(const Action& action,
                                                   const QString& oid,
                                                   const QVector<UploadChunk>& chunks) const
{
    if (!action.href.isValid() || action.href.isEmpty()) {
        return missingHref(QStringLiteral("completion"));
    }

    HttpClient::Request request;
    request.method = QByteArrayLiteral("POST");
    request.url = action.href;
    request.authenticate = false;
    request.headers.insert(QByteArrayLiteral("Accept"), LfsMediaType);
    request.headers.insert(QByteArrayLiteral("Content-Type"), LfsMediaType);
    request.body = buildCompletionBody(oid, chunks);

    const auto sent = mClient->send(request);
    if (sent.hasError()) {
        return Monad::ResultBase(QStringLiteral("LFS multipart completion failed: %1").arg(sent.errorMessage()),
                                 sent.errorCode());
    }
    return Monad::ResultBase();
}

Monad::ResultBase LfsBatchClient::verifyObject(const Action& action, const ObjectSpec& object) const
{
    if (!action.href.isValid() || action.href.isEmpty()) {
        return missingHref(QStringLiteral("verify"));
    }

    HttpClient::Request request;
    request.method = QByteArrayLiteral("POST");
    request.url = action.href;
    request.authenticate = false;
    request.headers = action.headers;
    request.headers.insert(QByteArrayLiteral("Accept"), LfsMediaType);
    request.headers.insert(QByteArrayLiteral("Content-Type"), LfsMediaType);
    request.body = buildVerifyBody(object);

    const auto sent = mClient->send(request);
    if (sent.hasError()) {
        return Monad::ResultBase(QStringLiteral("LFS verify failed for %1: %2").arg(object.oid, sent.errorMessage()),
                                 sent.errorCode());
    }
    return Monad::ResultBase();
}

QByteArray LfsBatchClient::buildBatchRequestBody(const QVector<ObjectSpec>& objects)
{
    QJsonObject root;
    root.insert(QStringLiteral("operation"), QStringLiteral("upload"));

    QJsonArray transfers;
    transfers.append(QStringLiteral("basic"));
    transfers.append(QStringLiteral("multipart"));
    root.insert(QStringLiteral("transfers"), transfers);

    QJsonArray objectArray;
    for (const auto& object : objects) {
        QJsonObject entry;
        entry.insert(QStringLiteral("oid"), object.oid);
        entry.insert(QStringLiteral("size"), static_cast<double>(object.size));
        objectArray.append(entry);
    }
    root.insert(QStringLiteral("objects"), objectArray);
    root.insert(QStringLiteral("hash_algo"), QStringLiteral("sha256"));

    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

Monad::Result<LfsBatchClient::BatchResponse> LfsBatchClient::parseBatchResponse(const QByteArray& body)
{
    QJsonParseError parseError{};
    const QJsonDocument document = QJsonDocument::fromJson(body, &parseError);
    if (document.isNull() || !document.isObject()) {
        return Monad::Result<BatchResponse>(QStringLiteral("Invalid LFS batch response: %1").arg(parseError.errorString()),
                                            errorCode(TransferErrorCode::Protocol));
    }

    BatchResponse response;
    const QJsonObject root = document.object();
    response.transfer = root.value(QStringLiteral("transfer")).toString();

    const QJsonArray objectsArray = root.value(QStringLiteral("objects")).toArray();
    response.objects.reserve(objectsArray.size());

    for (const auto& entry : objectsArray) {
        if (!entry.isObject()) {
            continue;
        }
        const QJsonObject object = entry.toObject();
        ObjectResponse objectResponse;
        objectResponse.oid = object.value(QStringLiteral("oid")).toString();
        objectResponse.size = static_cast<qint64>(object.value(QStringLiteral("size")).toDouble());

        const QJsonObject errorObject = object.value(QStringLiteral("error")).toObject();
        if (!errorObject.isEmpty()) {
            const int lfsCode = errorObject.value(QStringLiteral("code")).toInt();
            objectResponse.errorCode = objectErrorCode(lfsCode);
            objectResponse.errorMessage = QStringLiteral("LFS object error %1: %2")
                                              .arg(lfsCode)
                                              .arg(errorObject.value(QStringLiteral("message")).toString());
        }

        const QJsonObject actions = object.value(QStringLiteral("actions")).toObject();
        for (auto it = actions.begin(); it != actions.end(); ++it) {
            if (!it.value().isObject()) {
                continue;
            }
            const QJsonObject actionObject = it.value().toObject();
            Action action;
            action.href = QUrl(actionObject.value(QStringLiteral("href")).toString());
            const QJsonObject headers = actionObject.value(QStringLiteral("header")).toObject();
            for (auto headerIt = headers.begin(); headerIt != headers.end(); ++headerIt) {
                //chunk_size may arrive as a number
                const QJsonValue value = headerIt.value();
                const QString text = value.isDouble() ? QString::number(static_cast<qint64>(value.toDouble()))
                                                      : value.toString();
                action.headers.insert(headerIt.key().toUtf8(), text.toUtf8());
            }
            objectResponse.actions.insert(it.key(), action);
        }

        response.objects.push_back(objectResponse);
    }

    return Monad::Result<BatchResponse>(response);
}

QByteArray LfsBatchClient::buildCompletionBody(const QString& oid, const QVector<UploadChunk>& chunks)
{
    QVector<UploadChunk> sorted = chunks;
    std::sort(sorted.begin(), sorted.end(), [](const UploadChunk& a, const UploadChunk& b) {
        return a.partNumber < b.partNumber;
    });

    QJsonArray parts;
    for (const auto& chunk : sorted) {
        QJsonObject part;
        part.insert(QStringLiteral("partNumber"), chunk.partNumber);
        part.insert(QStringLiteral("etag"), chunk.etag);
        parts.append(part);
    }

    QJsonObject root;
    root.insert(QStringLiteral("oid"), oid);
    root.insert(QStringLiteral("parts"), parts);
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

QByteArray LfsBatchClient::buildVerifyBody(const ObjectSpec& object)
{
    QJsonObject body;
    body.insert(QStringLiteral("oid"), object.oid);
    body.insert(QStringLiteral("size"), static_cast<double>(object.size));
    return QJsonDocument(body).toJson(QJsonDocument::Compact);
}

qint64 LfsBatchClient::chunkSize(const Action& action)
{
    QByteArray value = actionHeader(action, QByteArrayLiteral("chunk_size"));
    if (value.isEmpty()) {
        value = actionHeader(action, QByteArrayLiteral("x-amz-meta-chunk-size"));
    }
    if (value.isEmpty()) {
        return -1;
    }

    bool ok = false;
    const qint64 size = value.trimmed().toLongLong(&ok);
    return ok && size > 0 ? size : -1;
}

QMap<int, QUrl> LfsBatchClient::partUrls(const Action& action)
{
    static const QRegularExpression amzPart(QStringLiteral("^x-amz-meta-part-(\\d+)-url$"),
                                            QRegularExpression::CaseInsensitiveOption);

    QMap<int, QUrl> urls;
    for (auto it = action.headers.constBegin(); it != action.headers.constEnd(); ++it) {
        const QString key = QString::fromUtf8(it.key());

        bool ok = false;
        int partNumber = key.toInt(&ok);
        if (!ok) {
            const auto match = amzPart.match(key);
            if (!match.hasMatch()) {
                continue;
            }
            partNumber = match.captured(1).toInt(&ok);
        }

        if (ok && partNumber > 0) {
            urls.insert(partNumber, QUrl(QString::fromUtf8(it.value())));
        }
    }
    return urls;
}
