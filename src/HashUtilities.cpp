#include "HashUtilities.h"
#include "TransferError.h"

#include <QCryptographicHash>
#include <QFile>

namespace HubTransfer {

QString HashUtilities::sha256Hex(const QByteArray& data)
{
    QCryptographicHash hash(QCryptographicHash::Sha256);
    hash.addData(data);
    return QString::fromLatin1(hash.result().toHex());
}

Monad::Result<FileDigest> HashUtilities::sha256HexForFile(const QString& filePath)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        return Monad::Result<FileDigest>(QStringLiteral("Failed to open %1 for hashing: %2")
                                             .arg(filePath, file.errorString()),
                                         errorCode(TransferErrorCode::Io));
    }

    QCryptographicHash hash(QCryptographicHash::Sha256);
    qint64 size = 0;
    while (!file.atEnd()) {
        const QByteArray chunk = file.read(ReadChunkBytes);
        if (chunk.isEmpty() && file.error() != QFile::NoError) {
            return Monad::Result<FileDigest>(file.errorString(), errorCode(TransferErrorCode::Io));
        }
        hash.addData(chunk);
        size += chunk.size();
    }

    FileDigest digest;
    digest.sha256 = QString::fromLatin1(hash.result().toHex());
    digest.size = size;
    return Monad::Result<FileDigest>(digest);
}

bool HashUtilities::isSha256Hex(const QString& value)
{
    if (value.size() != 64) {
        return false;
    }
    for (const QChar ch : value) {
        const ushort c = ch.unicode();
        const bool isDigit = c >= '0' && c <= '9';
        const bool isLowerHex = c >= 'a' && c <= 'f';
        const bool isUpperHex = c >= 'A' && c <= 'F';
        if (!isDigit && !isLowerHex && !isUpperHex) {
            return false;
        }
    }
    return true;
}

QString HashUtilities::shortHash(const QString& sha256)
{
    return sha256.left(8).toLower();
}

} // namespace HubTransfer
