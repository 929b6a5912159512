#ifndef TRANSFERPLANNER_H
#define TRANSFERPLANNER_H

#include <QString>
#include <QUrl>

#include <memory>

#include "CacheEntry.h"
#include "HubSettings.h"
#include "RepoRef.h"
#include "TransferState.h"
#include "Monad/Result.h"

namespace HubTransfer {

class ContentStore;
class HttpClient;

struct RemoteFileInfo {
    QString etag;
    qint64 size = -1;

    //Where the bytes live, the resolve url itself or a cdn location
    QUrl downloadUrl;
    bool redirected = false;
    QString commit;
};

struct DownloadRequest {
    RepoRef repo;
    QString revision = QStringLiteral("main");
    QString path;

    bool forceDownload = false;
    bool extract = false;

    //Listing metadata from the repository tree, -1 / empty when unknown
    qint64 knownSize = -1;
    QString knownEtag;
};

struct TransferPlan {
    enum class Kind {
        CacheHit,
        FetchFull,
        FetchResume
    };

    Kind kind = Kind::FetchFull;
    QUrl resolveUrl;
    CacheEntry entry;
    RemoteFileInfo remote;
    TransferState state;

    //Written to a temp file no other writer knows about, never checkpointed
    bool privateTemp = false;
};

class TransferPlanner
{
public:
    TransferPlanner(std::shared_ptr<ContentStore> store,
                    std::shared_ptr<HttpClient> client,
                    HubSettings settings);

    //<endpoint>/<prefix><repo id>/resolve/<revision>/<path>
    QUrl resolveUrl(const DownloadRequest& request) const;

    //HEAD without following cross host redirects
    Monad::Result<RemoteFileInfo> fetchRemoteInfo(const QUrl& url) const;

    Monad::Result<TransferPlan> plan(const DownloadRequest& request) const;

    //Decides between hit, full and resumed fetch once the remote is known
    TransferPlan planFor(const DownloadRequest& request,
                         const QUrl& url,
                         const Monad::Result<CacheEntry>& located,
                         const RemoteFileInfo& remote) const;

    static QString normalizeEtag(const QByteArray& etag);
    static bool entryMatchesRemote(const CacheEntry& entry, const RemoteFileInfo& remote);
    static bool entryMatchesListing(const CacheEntry& entry, const DownloadRequest& request);

private:
    std::shared_ptr<ContentStore> mStore;
    std::shared_ptr<HttpClient> mClient;
    HubSettings mSettings;
};

} // namespace HubTransfer

#endif // TRANSFERPLANNER_H
