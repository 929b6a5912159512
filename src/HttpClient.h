#ifndef HTTPCLIENT_H
#define HTTPCLIENT_H

//Qt includes
#include <QByteArray>
#include <QHash>
#include <QMap>
#include <QNetworkReply>
#include <QUrl>

//Std includes
#include <functional>
#include <memory>

//Our includes
#include "HubAuthProvider.h"
#include "Monad/Result.h"

class QIODevice;
class QNetworkRequest;

namespace HubTransfer {

/**
 * Blocking HTTP helper for transfer worker threads.
 *
 * Each call owns a QNetworkAccessManager and spins a local event loop, so a
 * client can be shared between QThreadPool workers. Redirects are followed by
 * hand: relative locations keep the Authorization header, a location on a
 * different host (a CDN) drops it.
 */
class HttpClient
{
public:
    static constexpr int MaxRedirects = 5;
    static constexpr int ErrorBodyPreviewBytes = 512;

    struct Request {
        QByteArray method = QByteArrayLiteral("GET");
        QUrl url;
        QMap<QByteArray, QByteArray> headers;
        QByteArray body;

        //Streams the body from a device instead, used for single part PUT
        QIODevice* bodyDevice = nullptr;

        //False for pre-signed action urls handed out by the batch api
        bool authenticate = true;
        bool followRedirects = true;
    };

    struct Response {
        int status = 0;
        QUrl url;
        QHash<QByteArray, QByteArray> headers;
        QByteArray body;

        //Case insensitive lookup
        QByteArray header(const QByteArray& name) const;
        bool hasHeader(const QByteArray& name) const;
        bool isRedirect() const { return status >= 300 && status < 400; }
        QUrl location() const;
    };

    //Invoked only for 2xx responses. An error result aborts the request
    //and is returned from stream().
    struct StreamHandler {
        std::function<Monad::ResultBase (const Response&)> onHeaders;
        std::function<Monad::ResultBase (const QByteArray&)> onData;
    };

    HttpClient(int timeoutMs,
               QByteArray userAgent,
               std::shared_ptr<HubAuthProvider> authProvider = nullptr);

    int timeoutMs() const { return mTimeoutMs; }

    Monad::Result<Response> send(const Request& request) const;
    Monad::Result<Response> stream(const Request& request, const StreamHandler& handler) const;

    static int errorCodeForStatus(int httpStatus, const QByteArray& hubErrorCode);
    static bool isOfflineError(QNetworkReply::NetworkError error);
    static bool isSameOrigin(const QUrl& a, const QUrl& b);

private:
    int mTimeoutMs;
    QByteArray mUserAgent;
    std::shared_ptr<HubAuthProvider> mAuthProvider;

    Monad::Result<Response> execute(const Request& request, const StreamHandler* handler) const;
    Monad::Result<Response> executeOnce(const Request& request,
                                        const QUrl& url,
                                        bool sendAuthorization,
                                        const StreamHandler* handler) const;

    static void applyHeaders(QNetworkRequest* request, const QMap<QByteArray, QByteArray>& headers);
    void applyAuthHeader(QNetworkRequest* request, const QUrl& url) const;
};

} // namespace HubTransfer

#endif // HTTPCLIENT_H
