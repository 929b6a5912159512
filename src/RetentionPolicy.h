#ifndef RETENTIONPOLICY_H
#define RETENTIONPOLICY_H

#include <QDateTime>
#include <QtGlobal>

namespace HubTransfer {

class RetentionPolicy
{
public:
    static constexpr qint64 DefaultMaxSizeBytes = 10LL * 1024 * 1024 * 1024;

    RetentionPolicy() = default;
    RetentionPolicy(qint64 maxSizeBytes, qint64 maxAgeSeconds);

    //Negative values disable a bound
    void setMaxSize(qint64 bytes);
    void setMaxAge(qint64 seconds);

    qint64 maxSize() const { return mMaxSize; }
    qint64 maxAge() const { return mMaxAge; }

    bool hasMaxSize() const { return mMaxSize >= 0; }
    bool hasMaxAge() const { return mMaxAge >= 0; }

    bool isExpired(const QDateTime& lastAccess, const QDateTime& now) const;

    static RetentionPolicy defaultPolicy();

private:
    qint64 mMaxSize = -1;
    qint64 mMaxAge = -1;
};

} // namespace HubTransfer

#endif // RETENTIONPOLICY_H
