#include "TransferError.h"

namespace HubTransfer {

QString errorCodeName(int code)
{
    switch (static_cast<TransferErrorCode>(code)) {
    case TransferErrorCode::None:
        return QStringLiteral("None");
    case TransferErrorCode::NotCached:
        return QStringLiteral("NotCached");
    case TransferErrorCode::NetworkFailure:
        return QStringLiteral("NetworkFailure");
    case TransferErrorCode::Timeout:
        return QStringLiteral("Timeout");
    case TransferErrorCode::Offline:
        return QStringLiteral("Offline");
    case TransferErrorCode::ChecksumMismatch:
        return QStringLiteral("ChecksumMismatch");
    case TransferErrorCode::AuthorizationFailure:
        return QStringLiteral("AuthorizationFailure");
    case TransferErrorCode::NotFound:
        return QStringLiteral("NotFound");
    case TransferErrorCode::UnsupportedArchive:
        return QStringLiteral("UnsupportedArchive");
    case TransferErrorCode::PartialBatchFailure:
        return QStringLiteral("PartialBatchFailure");
    case TransferErrorCode::Protocol:
        return QStringLiteral("Protocol");
    case TransferErrorCode::Io:
        return QStringLiteral("Io");
    }
    return QStringLiteral("Unknown(%1)").arg(code);
}

} // namespace HubTransfer
