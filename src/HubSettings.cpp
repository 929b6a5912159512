//Our includes
#include "HubSettings.h"
#include "HubAuthProvider.h"

//Qt includes
#include <QDebug>
#include <QDir>
#include <QSettings>

using namespace HubTransfer;

static const QString HubGroup = QStringLiteral("hub");
static const QString EndpointKey = QStringLiteral("endpoint");
static const QString CacheDirKey = QStringLiteral("cacheDir");
static const QString TokenKey = QStringLiteral("token");
static const QString OfflineKey = QStringLiteral("offline");
static const QString RequestTimeoutKey = QStringLiteral("requestTimeoutMs");
static const QString MaxRetriesKey = QStringLiteral("maxRetries");
static const QString LargeFileThresholdKey = QStringLiteral("largeFileThreshold");
static const QString CheckpointWindowKey = QStringLiteral("checkpointWindow");
static const QString MaxWorkersKey = QStringLiteral("maxWorkers");
static const QString MaxCacheSizeKey = QStringLiteral("maxCacheSize");
static const QString MaxCacheAgeKey = QStringLiteral("maxCacheAge");

static const QString DefaultEndpoint = QStringLiteral("https://huggingface.co");
static const QByteArray UserAgent = QByteArrayLiteral("hubtransfer/0.1.0");

namespace {

bool isTruthy(const QString& value)
{
    const QString lowered = value.trimmed().toLower();
    return lowered == QStringLiteral("1") || lowered == QStringLiteral("true");
}

QString expandHome(const QString& path)
{
    if (path == QStringLiteral("~")) {
        return QDir::homePath();
    }
    if (path.startsWith(QStringLiteral("~/"))) {
        return QDir::home().filePath(path.mid(2));
    }
    return QDir(path).absolutePath();
}

}

HubSettings::HubSettings()
    : mEndpoint(DefaultEndpoint),
      mCacheDir(defaultCacheDir())
{
}

HubSettings HubSettings::load()
{
    QSettings settings;
    return load(settings, QProcessEnvironment::systemEnvironment());
}

HubSettings HubSettings::load(QSettings& settings, const QProcessEnvironment& environment)
{
    HubSettings hub;

    settings.beginGroup(HubGroup);

    const QString endpoint = settings.value(EndpointKey, environment.value(QStringLiteral("HF_ENDPOINT"))).toString();
    if (!endpoint.isEmpty()) {
        hub.setEndpoint(QUrl(endpoint));
    }

    if (settings.contains(CacheDirKey)) {
        hub.setCacheDir(expandHome(settings.value(CacheDirKey).toString()));
    } else if (environment.contains(QStringLiteral("HF_HUB_CACHE"))) {
        hub.setCacheDir(expandHome(environment.value(QStringLiteral("HF_HUB_CACHE"))));
    } else if (environment.contains(QStringLiteral("HF_HOME"))) {
        hub.setCacheDir(QDir(expandHome(environment.value(QStringLiteral("HF_HOME")))).filePath(QStringLiteral("hub")));
    }

    if (settings.contains(TokenKey)) {
        hub.setToken(settings.value(TokenKey).toString().toUtf8());
    } else {
        hub.setToken(environment.value(QStringLiteral("HF_TOKEN")).toUtf8());
    }

    if (settings.contains(OfflineKey)) {
        hub.setOffline(settings.value(OfflineKey).toBool());
    } else {
        hub.setOffline(isTruthy(environment.value(QStringLiteral("HF_HUB_OFFLINE"))));
    }

    hub.setRequestTimeoutMs(settings.value(RequestTimeoutKey, DefaultRequestTimeoutMs).toInt());
    hub.setMaxRetries(settings.value(MaxRetriesKey, DefaultMaxRetries).toInt());
    hub.setLargeFileThreshold(settings.value(LargeFileThresholdKey, DefaultLargeFileThreshold).toLongLong());
    hub.setCheckpointWindow(settings.value(CheckpointWindowKey, DefaultCheckpointWindow).toLongLong());
    hub.setMaxWorkers(settings.value(MaxWorkersKey, DefaultMaxWorkers).toInt());

    RetentionPolicy retention;
    retention.setMaxSize(settings.value(MaxCacheSizeKey, RetentionPolicy::DefaultMaxSizeBytes).toLongLong());
    retention.setMaxAge(settings.value(MaxCacheAgeKey, -1).toLongLong());
    hub.setRetentionPolicy(retention);

    settings.endGroup();

    qDebug() << "[HubSettings] endpoint" << hub.endpoint().toString()
             << "cacheDir" << hub.cacheDir()
             << "offline" << hub.isOffline();
    return hub;
}

void HubSettings::setEndpoint(const QUrl& endpoint)
{
    QString text = endpoint.toString();
    while (text.endsWith(QLatin1Char('/'))) {
        text.chop(1);
    }
    mEndpoint = QUrl(text);
}

QByteArray HubSettings::userAgent() const
{
    return UserAgent;
}

std::shared_ptr<HubAuthProvider> HubSettings::authProvider() const
{
    return std::make_shared<BearerTokenAuthProvider>(mToken);
}

QString HubSettings::defaultCacheDir()
{
    return QDir::home().filePath(QStringLiteral(".cache/huggingface/hub"));
}
