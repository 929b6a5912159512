#include "RetentionPolicy.h"

namespace HubTransfer {

RetentionPolicy::RetentionPolicy(qint64 maxSizeBytes, qint64 maxAgeSeconds)
    : mMaxSize(maxSizeBytes < 0 ? -1 : maxSizeBytes),
      mMaxAge(maxAgeSeconds < 0 ? -1 : maxAgeSeconds)
{
}

void RetentionPolicy::setMaxSize(qint64 bytes)
{
    mMaxSize = bytes < 0 ? -1 : bytes;
}

void RetentionPolicy::setMaxAge(qint64 seconds)
{
    mMaxAge = seconds < 0 ? -1 : seconds;
}

bool RetentionPolicy::isExpired(const QDateTime& lastAccess, const QDateTime& now) const
{
    if (!hasMaxAge() || !lastAccess.isValid()) {
        return false;
    }
    return lastAccess.secsTo(now) > mMaxAge;
}

RetentionPolicy RetentionPolicy::defaultPolicy()
{
    return RetentionPolicy(DefaultMaxSizeBytes, -1);
}

} // namespace HubTransfer
