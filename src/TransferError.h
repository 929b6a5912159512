#ifndef TRANSFERERROR_H
#define TRANSFERERROR_H

#include <QString>

namespace HubTransfer {

//Error codes carried by Monad::Result::errorCode() across the engine
enum class TransferErrorCode : int {
    None = 0,
    NotCached = 1,
    NetworkFailure,
    Timeout,
    Offline,
    ChecksumMismatch,
    AuthorizationFailure,
    NotFound,
    UnsupportedArchive,
    PartialBatchFailure,
    Protocol,
    Io
};

inline int errorCode(TransferErrorCode code)
{
    return static_cast<int>(code);
}

//Network failures and timeouts keep resumable state and may be retried
inline bool isRetryableError(int code)
{
    const auto transferCode = static_cast<TransferErrorCode>(code);
    return transferCode == TransferErrorCode::NetworkFailure
           || transferCode == TransferErrorCode::Timeout;
}

QString errorCodeName(int code);

} // namespace HubTransfer

#endif // TRANSFERERROR_H
