#ifndef HASHUTILITIES_H
#define HASHUTILITIES_H

#include <QByteArray>
#include <QString>

#include "Monad/Result.h"

namespace HubTransfer {

struct FileDigest {
    QString sha256;
    qint64 size = 0;
};

class HashUtilities
{
public:
    static constexpr qint64 ReadChunkBytes = 1024 * 128;

    static QString sha256Hex(const QByteArray& data);
    static Monad::Result<FileDigest> sha256HexForFile(const QString& filePath);

    //True for 64 lowercase or uppercase hex characters
    static bool isSha256Hex(const QString& value);

    //First eight hex characters, used for short directory keys
    static QString shortHash(const QString& sha256);
};

} // namespace HubTransfer

#endif // HASHUTILITIES_H
