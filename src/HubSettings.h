#ifndef HUBSETTINGS_H
#define HUBSETTINGS_H

//Qt includes
#include <QProcessEnvironment>
#include <QString>
#include <QUrl>

//Std includes
#include <memory>

//Our includes
#include "RetentionPolicy.h"

class QSettings;

namespace HubTransfer {

class HubAuthProvider;

class HubSettings
{
public:
    static constexpr qint64 MiB = 1024 * 1024;
    static constexpr int DefaultRequestTimeoutMs = 30000;
    static constexpr int DefaultMaxRetries = 3;
    static constexpr qint64 DefaultLargeFileThreshold = 10 * MiB;
    static constexpr qint64 DefaultCheckpointWindow = 10 * MiB;
    static constexpr int DefaultMaxWorkers = 4;
    static constexpr int DefaultLockTimeoutMs = 10000;

    HubSettings();

    //QSettings group "hub" first, then HF_* environment variables, then defaults
    static HubSettings load();
    static HubSettings load(QSettings& settings, const QProcessEnvironment& environment);

    QUrl endpoint() const { return mEndpoint; }
    void setEndpoint(const QUrl& endpoint);

    QString cacheDir() const { return mCacheDir; }
    void setCacheDir(const QString& cacheDir) { mCacheDir = cacheDir; }

    QByteArray token() const { return mToken; }
    void setToken(const QByteArray& token) { mToken = token; }

    bool isOffline() const { return mOffline; }
    void setOffline(bool offline) { mOffline = offline; }

    int requestTimeoutMs() const { return mRequestTimeoutMs; }
    void setRequestTimeoutMs(int ms) { mRequestTimeoutMs = ms; }

    int maxRetries() const { return mMaxRetries; }
    void setMaxRetries(int retries) { mMaxRetries = qMax(0, retries); }

    //Size at which uploads go through the large-object pipeline and
    //downloads keep a resume sidecar
    qint64 largeFileThreshold() const { return mLargeFileThreshold; }
    void setLargeFileThreshold(qint64 bytes) { mLargeFileThreshold = bytes; }

    qint64 checkpointWindow() const { return mCheckpointWindow; }
    void setCheckpointWindow(qint64 bytes) { mCheckpointWindow = qMax<qint64>(1, bytes); }

    int maxWorkers() const { return mMaxWorkers; }
    void setMaxWorkers(int workers) { mMaxWorkers = qMax(1, workers); }

    int lockTimeoutMs() const { return mLockTimeoutMs; }
    void setLockTimeoutMs(int ms) { mLockTimeoutMs = ms; }

    int retryBackoffMs() const { return mRetryBackoffMs; }
    void setRetryBackoffMs(int ms) { mRetryBackoffMs = qMax(0, ms); }

    RetentionPolicy retentionPolicy() const { return mRetention; }
    void setRetentionPolicy(const RetentionPolicy& policy) { mRetention = policy; }

    QByteArray userAgent() const;

    std::shared_ptr<HubAuthProvider> authProvider() const;

    static QString defaultCacheDir();

private:
    QUrl mEndpoint;
    QString mCacheDir;
    QByteArray mToken;
    bool mOffline = false;
    int mRequestTimeoutMs = DefaultRequestTimeoutMs;
    int mMaxRetries = DefaultMaxRetries;
    qint64 mLargeFileThreshold = DefaultLargeFileThreshold;
    qint64 mCheckpointWindow = DefaultCheckpointWindow;
    int mMaxWorkers = DefaultMaxWorkers;
    int mLockTimeoutMs = DefaultLockTimeoutMs;
    int mRetryBackoffMs = 250;
    RetentionPolicy mRetention = RetentionPolicy::defaultPolicy();
};

} // namespace HubTransfer

#endif // HUBSETTINGS_H
