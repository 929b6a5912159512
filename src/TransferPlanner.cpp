#include "TransferPlanner.h"
#include "ContentStore.h"
#include "HashUtilities.h"
#include "HttpClient.h"
#include "TransferError.h"

#include <QDebug>

namespace HubTransfer {

TransferPlanner::TransferPlanner(std::shared_ptr<ContentStore> store,
                                 std::shared_ptr<HttpClient> client,
                                 HubSettings settings)
    : mStore(std::move(store)),
      mClient(std::move(client)),
      mSettings(std::move(settings))
{
}

QUrl TransferPlanner::resolveUrl(const DownloadRequest& request) const
{
    const QByteArray encoded = mSettings.endpoint().toEncoded()
                               + '/'
                               + request.repo.urlPrefix().toUtf8()
                               + QUrl::toPercentEncoding(request.repo.repoId(), "/")
                               + "/resolve/"
                               + QUrl::toPercentEncoding(request.revision)
                               + '/'
                               + QUrl::toPercentEncoding(request.path, "/");
    return QUrl::fromEncoded(encoded);
}

Monad::Result<RemoteFileInfo> TransferPlanner::fetchRemoteInfo(const QUrl& url) const
{
    QUrl current = url;

    for (int hop = 0; hop <= HttpClient::MaxRedirects; ++hop) {
        HttpClient::Request request;
        request.method = QByteArrayLiteral("HEAD");
        request.url = current;
        request.followRedirects = false;
        request.headers.insert(QByteArrayLiteral("Accept-Encoding"), QByteArrayLiteral("identity"));

        const auto result = mClient->send(request);
        if (result.hasError()) {
            return Monad::Result<RemoteFileInfo>(result.errorMessage(), result.errorCode());
        }

        const HttpClient::Response response = result.value();

        RemoteFileInfo info;
        info.commit = QString::fromUtf8(response.header(QByteArrayLiteral("x-repo-commit")));

        const QByteArray linkedEtag = response.header(QByteArrayLiteral("x-linked-etag"));
        info.etag = normalizeEtag(linkedEtag.isEmpty() ? response.header(QByteArrayLiteral("etag")) : linkedEtag);

        const QByteArray linkedSize = response.header(QByteArrayLiteral("x-linked-size"));
        const QByteArray sizeText = linkedSize.isEmpty() ? response.header(QByteArrayLiteral("content-length")) : linkedSize;
        bool sizeOk = false;
        const qint64 size = sizeText.toLongLong(&sizeOk);
        info.size = sizeOk ? size : -1;

        if (response.isRedirect()) {
            const QByteArray rawLocation = response.header(QByteArrayLiteral("location"));
            const QUrl location = response.location();
            if (rawLocation.isEmpty() || !location.isValid()) {
                return Monad::Result<RemoteFileInfo>(QStringLiteral("Redirect without location from %1").arg(current.toString()),
                                                     errorCode(TransferErrorCode::Protocol));
            }

            if (QUrl::fromEncoded(rawLocation).isRelative() || HttpClient::isSameOrigin(current, location)) {
                current = location;
                continue;
            }

            info.downloadUrl = location;
            info.redirected = true;
        } else {
            info.downloadUrl = current;
        }

        if (info.etag.isEmpty()) {
            return Monad::Result<RemoteFileInfo>(QStringLiteral("No ETag found on %1").arg(url.toString()),
                                                 errorCode(TransferErrorCode::Protocol));
        }

        qDebug() << "[TransferPlanner] remote" << url.toString() << "etag" << info.etag
                 << "size" << info.size << "redirected" << info.redirected;
        return Monad::Result<RemoteFileInfo>(info);
    }

    return Monad::Result<RemoteFileInfo>(QStringLiteral("Too many redirects probing %1").arg(url.toString()),
                                         errorCode(TransferErrorCode::Protocol));
}

Monad::Result<TransferPlan> TransferPlanner::plan(const DownloadRequest& request) const
{
    if (!request.repo.isValid()) {
        return Monad::Result<TransferPlan>(QStringLiteral("Invalid repository id \"%1\"").arg(request.repo.repoId()),
                                           errorCode(TransferErrorCode::NotFound));
    }
    if (!ContentStore::isSafeRelativePath(request.path)) {
        return Monad::Result<TransferPlan>(QStringLiteral("Invalid file path \"%1\"").arg(request.path),
                                           errorCode(TransferErrorCode::NotFound));
    }

    const QUrl url = resolveUrl(request);
    const auto located = mStore->locate(request.repo, request.revision, request.path);

    if (mSettings.isOffline()) {
        if (located.hasError()) {
            return Monad::Result<TransferPlan>(QStringLiteral("%1 is not cached and outgoing traffic is disabled").arg(url.toString()),
                                               errorCode(TransferErrorCode::NotCached));
        }
        TransferPlan plan;
        plan.kind = TransferPlan::Kind::CacheHit;
        plan.resolveUrl = url;
        plan.entry = located.value();
        return Monad::Result<TransferPlan>(plan);
    }

    if (!request.forceDownload && !located.hasError() && entryMatchesListing(located.value(), request)) {
        TransferPlan plan;
        plan.kind = TransferPlan::Kind::CacheHit;
        plan.resolveUrl = url;
        plan.entry = located.value();
        return Monad::Result<TransferPlan>(plan);
    }

    const auto remote = fetchRemoteInfo(url);
    if (remote.hasError()) {
        if (!located.hasError() && !request.forceDownload && isRetryableError(remote.errorCode())) {
            qWarning() << "[TransferPlanner] metadata request failed, using cached copy of" << url.toString() << remote.errorMessage();
            TransferPlan plan;
            plan.kind = TransferPlan::Kind::CacheHit;
            plan.resolveUrl = url;
            plan.entry = located.value();
            return Monad::Result<TransferPlan>(plan);
        }
        return Monad::Result<TransferPlan>(remote.errorMessage(), remote.errorCode());
    }

    return Monad::Result<TransferPlan>(planFor(request, url, located, remote.value()));
}

TransferPlan TransferPlanner::planFor(const DownloadRequest& request,
                                      const QUrl& url,
                                      const Monad::Result<CacheEntry>& located,
                                      const RemoteFileInfo& remote) const
{
    TransferPlan plan;
    plan.resolveUrl = url;
    plan.remote = remote;

    if (!request.forceDownload && !located.hasError() && entryMatchesRemote(located.value(), remote)) {
        plan.kind = TransferPlan::Kind::CacheHit;
        plan.entry = located.value();
        return plan;
    }

    const QString urlText = url.toString();
    const QString tempPath = mStore->tempPathFor(urlText + QLatin1Char('\n') + remote.etag);

    if (!request.forceDownload) {
        const auto existing = TransferState::load(tempPath);
        if (!existing.hasError() && existing.value().canResume(urlText, remote.etag)) {
            plan.kind = TransferPlan::Kind::FetchResume;
            plan.state = existing.value();
            qDebug() << "[TransferPlanner] resuming" << urlText << "at" << plan.state.bytesTransferred();
            return plan;
        }
    }

    plan.kind = TransferPlan::Kind::FetchFull;
    plan.state = TransferState(urlText, tempPath, remote.size, remote.etag);
    if (HashUtilities::isSha256Hex(remote.etag)) {
        plan.state.setSha256(remote.etag.toLower());
    }
    return plan;
}

QString TransferPlanner::normalizeEtag(const QByteArray& etag)
{
    QString value = QString::fromUtf8(etag).trimmed();
    if (value.startsWith(QStringLiteral("W/"))) {
        value = value.mid(2);
    }
    if (value.size() >= 2 && value.startsWith(QLatin1Char('"')) && value.endsWith(QLatin1Char('"'))) {
        value = value.mid(1, value.size() - 2);
    }
    return value;
}

bool TransferPlanner::entryMatchesRemote(const CacheEntry& entry, const RemoteFileInfo& remote)
{
    if (remote.etag.isEmpty()) {
        return false;
    }
    if (!entry.etag.isEmpty() && entry.etag == remote.etag) {
        return true;
    }
    return HashUtilities::isSha256Hex(remote.etag)
           && !entry.sha256.isEmpty()
           && entry.sha256.compare(remote.etag, Qt::CaseInsensitive) == 0;
}

bool TransferPlanner::entryMatchesListing(const CacheEntry& entry, const DownloadRequest& request)
{
    if (request.knownSize < 0 || request.knownEtag.isEmpty() || entry.size != request.knownSize) {
        return false;
    }
    const QString etag = normalizeEtag(request.knownEtag.toUtf8());
    return etag == entry.etag || (!entry.sha256.isEmpty() && entry.sha256.compare(etag, Qt::CaseInsensitive) == 0);
}

} // namespace HubTransfer
