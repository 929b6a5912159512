#include "HttpClient.h"
#include "TransferError.h"

#include <QDebug>
#include <QEventLoop>
#include <QIODevice>
#include <QNetworkAccessManager>
#include <QNetworkRequest>

using namespace HubTransfer;

namespace {

QString responseBodyPreview(const QByteArray& body)
{
    if (body.isEmpty()) {
        return QString();
    }

    const bool truncated = body.size() > HttpClient::ErrorBodyPreviewBytes;
    const QByteArray previewBytes = truncated ? body.left(HttpClient::ErrorBodyPreviewBytes) : body;
    const QString previewText = QString::fromUtf8(previewBytes).simplified();
    if (previewText.isEmpty()) {
        return QString();
    }

    if (truncated) {
        return QStringLiteral("%1 [truncated]").arg(previewText);
    }
    return previewText;
}

QString enrichReplyErrorMessage(const QString& baseMessage,
                                QNetworkReply* reply,
                                const QByteArray& body,
                                int httpStatus = 0)
{
    if (!reply) {
        return baseMessage;
    }

    QString message = baseMessage;
    message += QStringLiteral(" [networkError=%1").arg(static_cast<int>(reply->error()));

    const QString detail = reply->errorString();
    if (!detail.isEmpty()) {
        message += QStringLiteral(", detail=\"%1\"").arg(detail);
    }

    if (httpStatus > 0) {
        message += QStringLiteral(", httpStatus=%1").arg(httpStatus);
    }

    const QString bodyPreview = responseBodyPreview(body);
    if (!bodyPreview.isEmpty()) {
        message += QStringLiteral(", response=\"%1\"").arg(bodyPreview);
    }

    message += QLatin1Char(']');
    return message;
}

QString hubErrorMessage(int httpStatus, const QByteArray& hubErrorCode, const QUrl& url)
{
    if (hubErrorCode == "GatedRepo") {
        return QStringLiteral("Access to gated repository is restricted (%1)").arg(url.toString());
    }
    if (hubErrorCode == "RepoNotFound") {
        return QStringLiteral("Repository not found or not authorized (%1)").arg(url.toString());
    }
    if (hubErrorCode == "EntryNotFound") {
        return QStringLiteral("Entry not found (%1)").arg(url.toString());
    }
    if (hubErrorCode == "RevisionNotFound") {
        return QStringLiteral("Revision not found (%1)").arg(url.toString());
    }
    return QStringLiteral("HTTP request failed (%1) %2").arg(httpStatus).arg(url.toString());
}

}

QByteArray HttpClient::Response::header(const QByteArray& name) const
{
    return headers.value(name.toLower());
}

bool HttpClient::Response::hasHeader(const QByteArray& name) const
{
    return headers.contains(name.toLower());
}

QUrl HttpClient::Response::location() const
{
    const QByteArray raw = header(QByteArrayLiteral("location"));
    if (raw.isEmpty()) {
        return QUrl();
    }
    return url.resolved(QUrl::fromEncoded(raw));
}

HttpClient::HttpClient(int timeoutMs,
                       QByteArray userAgent,
                       std::shared_ptr<HubAuthProvider> authProvider)
    : mTimeoutMs(timeoutMs),
      mUserAgent(std::move(userAgent)),
      mAuthProvider(std::move(authProvider))
{
}

Monad::Result<HttpClient::Response> HttpClient::send(const Request& request) const
{
    return execute(request, nullptr);
}

Monad::Result<HttpClient::Response> HttpClient::stream(const Request& request, const StreamHandler& handler) const
{
    return execute(request, &handler);
}

Monad::Result<HttpClient::Response> HttpClient::execute(const Request& request, const StreamHandler* handler) const
{
    QUrl url = request.url;
    bool sendAuthorization = request.authenticate;

    for (int hop = 0; hop <= MaxRedirects; ++hop) {
        auto result = executeOnce(request, url, sendAuthorization, handler);
        if (result.hasError()) {
            return result;
        }

        const Response response = result.value();
        if (!request.followRedirects || !response.isRedirect()) {
            return result;
        }

        const QUrl next = response.location();
        if (!next.isValid() || next.isEmpty()) {
            return Monad::Result<Response>(QStringLiteral("Redirect without location from %1").arg(url.toString()),
                                           errorCode(TransferErrorCode::Protocol));
        }

        if (request.bodyDevice) {
            return Monad::Result<Response>(QStringLiteral("Cannot replay streamed body on redirect to %1").arg(next.toString()),
                                           errorCode(TransferErrorCode::Protocol));
        }

        if (!isSameOrigin(url, next)) {
            sendAuthorization = false;
        }

        qDebug() << "[HttpClient] redirect" << response.status << url.toString() << "->" << next.toString()
                 << "auth" << sendAuthorization;
        url = next;
    }

    return Monad::Result<Response>(QStringLiteral("Too many redirects for %1").arg(request.url.toString()),
                                   errorCode(TransferErrorCode::Protocol));
}

Monad::Result<HttpClient::Response> HttpClient::executeOnce(const Request& request,
                                                            const QUrl& url,
                                                            bool sendAuthorization,
                                                            const StreamHandler* handler) const
{
    QNetworkAccessManager manager;
    QNetworkRequest networkRequest(url);
    networkRequest.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::ManualRedirectPolicy);
    networkRequest.setTransferTimeout(mTimeoutMs);
    networkRequest.setHeader(QNetworkRequest::UserAgentHeader, mUserAgent);
    applyHeaders(&networkRequest, request.headers);
    if (sendAuthorization) {
        applyAuthHeader(&networkRequest, url);
    }

    QNetworkReply* reply = nullptr;
    const QByteArray method = request.method.toUpper();
    if (method == "GET") {
        reply = manager.get(networkRequest);
    } else if (method == "HEAD") {
        reply = manager.head(networkRequest);
    } else if (request.bodyDevice) {
        reply = manager.sendCustomRequest(networkRequest, method, request.bodyDevice);
    } else {
        reply = manager.sendCustomRequest(networkRequest, method, request.body);
    }

    Response response;
    response.url = url;

    bool headersSeen = false;
    bool streaming = false;
    bool abortedByHandler = false;
    Monad::ResultBase handlerError;

    auto captureHeaders = [&]() {
        if (headersSeen) {
            return;
        }
        headersSeen = true;
        response.status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        const auto pairs = reply->rawHeaderPairs();
        for (const auto& pair : pairs) {
            response.headers.insert(pair.first.toLower(), pair.second);
        }

        streaming = handler && response.status >= 200 && response.status < 300;
        if (streaming && handler->onHeaders) {
            auto result = handler->onHeaders(response);
            if (result.hasError()) {
                handlerError = result;
                abortedByHandler = true;
                reply->abort();
            }
        }
    };

    auto consume = [&]() {
        if (abortedByHandler) {
            return;
        }
        captureHeaders();
        if (abortedByHandler) {
            return;
        }
        const QByteArray chunk = reply->readAll();
        if (chunk.isEmpty()) {
            return;
        }
        if (streaming) {
            if (handler->onData) {
                auto result = handler->onData(chunk);
                if (result.hasError()) {
                    handlerError = result;
                    abortedByHandler = true;
                    reply->abort();
                }
            }
        } else {
            response.body.append(chunk);
        }
    };

    QEventLoop loop;
    QObject::connect(reply, &QNetworkReply::metaDataChanged, &loop, captureHeaders);
    QObject::connect(reply, &QNetworkReply::readyRead, &loop, consume);
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    if (!reply->isFinished()) {
        loop.exec();
    }

    if (!abortedByHandler) {
        consume();
    }

    std::unique_ptr<QNetworkReply> replyHolder(reply);

    if (abortedByHandler) {
        return Monad::Result<Response>(handlerError.errorMessage(), handlerError.errorCode());
    }

    const int httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    response.status = httpStatus;

    if (httpStatus >= 400) {
        const QByteArray hubErrorCode = response.header(QByteArrayLiteral("x-error-code"));
        const int code = errorCodeForStatus(httpStatus, hubErrorCode);
        const QString message = enrichReplyErrorMessage(hubErrorMessage(httpStatus, hubErrorCode, url),
                                                        reply,
                                                        response.body,
                                                        httpStatus);
        qWarning() << "[HttpClient]" << method << message;
        return Monad::Result<Response>(message, code);
    }

    const QNetworkReply::NetworkError netError = reply->error();
    if (netError != QNetworkReply::NoError) {
        if (netError == QNetworkReply::TimeoutError || netError == QNetworkReply::OperationCanceledError) {
            const QString message = enrichReplyErrorMessage(QStringLiteral("HTTP request timed out after %1 ms").arg(mTimeoutMs),
                                                            reply,
                                                            response.body,
                                                            httpStatus);
            qWarning() << "[HttpClient]" << method << url.toString() << message;
            return Monad::Result<Response>(message, errorCode(TransferErrorCode::Timeout));
        }

        const QString base = isOfflineError(netError)
                                 ? QStringLiteral("HTTP request failed (offline)")
                                 : QStringLiteral("HTTP request failed");
        const QString message = enrichReplyErrorMessage(base, reply, response.body, httpStatus);
        qWarning() << "[HttpClient]" << method << url.toString() << message;
        return Monad::Result<Response>(message, errorCode(TransferErrorCode::NetworkFailure));
    }

    if (httpStatus == 0) {
        return Monad::Result<Response>(QStringLiteral("Missing HTTP status from %1").arg(url.toString()),
                                       errorCode(TransferErrorCode::Protocol));
    }

    return Monad::Result<Response>(response);
}

int HttpClient::errorCodeForStatus(int httpStatus, const QByteArray& hubErrorCode)
{
    if (hubErrorCode == "RepoNotFound" || hubErrorCode == "GatedRepo") {
        return errorCode(TransferErrorCode::AuthorizationFailure);
    }
    if (hubErrorCode == "EntryNotFound" || hubErrorCode == "RevisionNotFound") {
        return errorCode(TransferErrorCode::NotFound);
    }

    switch (httpStatus) {
    case 401:
    case 403:
        return errorCode(TransferErrorCode::AuthorizationFailure);
    case 404:
        return errorCode(TransferErrorCode::NotFound);
    case 408:
        return errorCode(TransferErrorCode::Timeout);
    case 429:
        return errorCode(TransferErrorCode::NetworkFailure);
    default:
        break;
    }

    if (httpStatus >= 500) {
        return errorCode(TransferErrorCode::NetworkFailure);
    }
    return errorCode(TransferErrorCode::Protocol);
}

bool HttpClient::isOfflineError(QNetworkReply::NetworkError error)
{
    switch (error) {
    case QNetworkReply::HostNotFoundError:
    case QNetworkReply::TimeoutError:
    case QNetworkReply::ConnectionRefusedError:
    case QNetworkReply::NetworkSessionFailedError:
    case QNetworkReply::TemporaryNetworkFailureError:
        return true;
    default:
        return false;
    }
}

bool HttpClient::isSameOrigin(const QUrl& a, const QUrl& b)
{
    return a.scheme().compare(b.scheme(), Qt::CaseInsensitive) == 0
           && a.host().compare(b.host(), Qt::CaseInsensitive) == 0
           && a.port() == b.port();
}

void HttpClient::applyHeaders(QNetworkRequest* request, const QMap<QByteArray, QByteArray>& headers)
{
    if (!request) {
        return;
    }
    for (auto it = headers.begin(); it != headers.end(); ++it) {
        request->setRawHeader(it.key(), it.value());
    }
}

void HttpClient::applyAuthHeader(QNetworkRequest* request, const QUrl& url) const
{
    if (!request || request->hasRawHeader("Authorization") || !mAuthProvider) {
        return;
    }

    const QByteArray provided = mAuthProvider->authorizationHeader(url);
    if (!provided.isEmpty()) {
        request->setRawHeader("Authorization", provided);
    }
}
