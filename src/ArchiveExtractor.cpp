#include "ArchiveExtractor.h"
#include "TransferError.h"

#include <QDebug>
#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QProcess>
#include <QStandardPaths>
#include <QTemporaryFile>
#include <QtEndian>

#include <zlib.h>

namespace {

constexpr qint64 ChunkBytes = 1024 * 128;
constexpr int TarBlockBytes = 512;

constexpr quint32 ZipEndOfCentralDirSignature = 0x06054b50;
constexpr quint32 ZipCentralHeaderSignature = 0x02014b50;
constexpr quint32 ZipLocalHeaderSignature = 0x04034b50;
constexpr int ZipEndOfCentralDirBytes = 22;
constexpr int ZipCentralHeaderBytes = 46;
constexpr int ZipLocalHeaderBytes = 30;
constexpr quint16 ZipMethodStored = 0;
constexpr quint16 ZipMethodDeflate = 8;

Monad::ResultBase archiveError(const QString& message)
{
    return Monad::ResultBase(message, HubTransfer::errorCode(HubTransfer::TransferErrorCode::UnsupportedArchive));
}

Monad::ResultBase ioError(const QString& message)
{
    return Monad::ResultBase(message, HubTransfer::errorCode(HubTransfer::TransferErrorCode::Io));
}

template<typename T>
Monad::Result<T> toResult(const Monad::ResultBase& error)
{
    return Monad::Result<T>(error.errorMessage(), error.errorCode());
}

struct InflateStream {
    z_stream stream{};
    bool initialized = false;

    ~InflateStream()
    {
        if (initialized) {
            inflateEnd(&stream);
        }
    }
};

//Inflates up to maxInput bytes (all when negative) of source into target
Monad::ResultBase inflateInto(QIODevice* source,
                              qint64 maxInput,
                              QIODevice* target,
                              int windowBits,
                              bool multiMember,
                              quint32* crcOut,
                              qint64* writtenOut)
{
    InflateStream inflater;
    if (inflateInit2(&inflater.stream, windowBits) != Z_OK) {
        return archiveError(QStringLiteral("Failed to initialize zlib"));
    }
    inflater.initialized = true;

    QByteArray input;
    QByteArray output(static_cast<int>(ChunkBytes), Qt::Uninitialized);
    qint64 remaining = maxInput;
    uLong crc = crc32(0L, Z_NULL, 0);
    qint64 written = 0;
    int ret = Z_OK;

    forever {
        if (inflater.stream.avail_in == 0) {
            const qint64 want = remaining < 0 ? ChunkBytes : qMin(remaining, ChunkBytes);
            input = want > 0 ? source->read(want) : QByteArray();
            if (input.isEmpty()) {
                break;
            }
            if (remaining > 0) {
                remaining -= input.size();
            }
            inflater.stream.next_in = reinterpret_cast<Bytef*>(input.data());
            inflater.stream.avail_in = static_cast<uInt>(input.size());
        }

        inflater.stream.next_out = reinterpret_cast<Bytef*>(output.data());
        inflater.stream.avail_out = static_cast<uInt>(output.size());
        ret = inflate(&inflater.stream, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END && ret != Z_BUF_ERROR) {
            return archiveError(QStringLiteral("Corrupt compressed data (zlib %1)").arg(ret));
        }

        const qint64 produced = output.size() - static_cast<qint64>(inflater.stream.avail_out);
        if (produced > 0) {
            crc = crc32(crc, reinterpret_cast<const Bytef*>(output.constData()), static_cast<uInt>(produced));
            if (target->write(output.constData(), produced) != produced) {
                return ioError(QStringLiteral("Failed to write extracted data: %1").arg(target->errorString()));
            }
            written += produced;
        }

        if (ret == Z_STREAM_END) {
            const bool moreInput = inflater.stream.avail_in > 0 || (remaining != 0 && !source->atEnd());
            if (multiMember && moreInput) {
                inflateReset(&inflater.stream);
                ret = Z_OK;
                continue;
            }
            break;
        }
    }

    if (ret != Z_STREAM_END) {
        return archiveError(QStringLiteral("Compressed stream is truncated"));
    }

    if (crcOut) {
        *crcOut = static_cast<quint32>(crc);
    }
    if (writtenOut) {
        *writtenOut = written;
    }
    return Monad::ResultBase();
}

Monad::ResultBase copyBytes(QIODevice* source, qint64 size, QIODevice* target, quint32* crcOut)
{
    uLong crc = crc32(0L, Z_NULL, 0);
    qint64 remaining = size;
    while (remaining > 0) {
        const QByteArray chunk = source->read(qMin(remaining, ChunkBytes));
        if (chunk.isEmpty()) {
            return archiveError(QStringLiteral("Archive entry is truncated"));
        }
        crc = crc32(crc, reinterpret_cast<const Bytef*>(chunk.constData()), static_cast<uInt>(chunk.size()));
        if (target && target->write(chunk) != chunk.size()) {
            return ioError(QStringLiteral("Failed to write extracted data: %1").arg(target->errorString()));
        }
        remaining -= chunk.size();
    }
    if (crcOut) {
        *crcOut = static_cast<quint32>(crc);
    }
    return Monad::ResultBase();
}

Monad::ResultBase skipBytes(QIODevice* source, qint64 size)
{
    return copyBytes(source, size, nullptr, nullptr);
}

QString normalizeEntryName(QString name)
{
    name.replace(QLatin1Char('\\'), QLatin1Char('/'));
    while (name.startsWith(QStringLiteral("./"))) {
        name = name.mid(2);
    }
    return name;
}

Monad::Result<QString> targetPathFor(const QString& destination, const QString& entryName)
{
    if (!HubTransfer::ArchiveExtractor::isSafeEntryName(entryName)) {
        return Monad::Result<QString>(QStringLiteral("Archive entry escapes destination: %1").arg(entryName),
                                      HubTransfer::errorCode(HubTransfer::TransferErrorCode::UnsupportedArchive));
    }
    return Monad::Result<QString>(QDir(destination).filePath(QDir::cleanPath(entryName)));
}

Monad::ResultBase openTarget(QFile* file)
{
    if (!QDir().mkpath(QFileInfo(file->fileName()).absolutePath())) {
        return ioError(QStringLiteral("Failed to create directory for %1").arg(file->fileName()));
    }
    if (!file->open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return ioError(QStringLiteral("Failed to open %1: %2").arg(file->fileName(), file->errorString()));
    }
    return Monad::ResultBase();
}

QString tarString(const char* field, int length)
{
    int size = 0;
    while (size < length && field[size] != '\0') {
        ++size;
    }
    return QString::fromUtf8(field, size);
}

qint64 tarNumber(const char* field, int length)
{
    const auto* bytes = reinterpret_cast<const unsigned char*>(field);
    if (bytes[0] & 0x80) {
        //GNU base-256 encoding
        qint64 value = bytes[0] & 0x7f;
        for (int i = 1; i < length; ++i) {
            value = (value << 8) | bytes[i];
        }
        return value;
    }

    qint64 value = 0;
    for (int i = 0; i < length; ++i) {
        const char c = field[i];
        if (c == '\0' || c == ' ') {
            if (value > 0) {
                break;
            }
            continue;
        }
        if (c < '0' || c > '7') {
            return -1;
        }
        value = value * 8 + (c - '0');
    }
    return value;
}

bool tarChecksumMatches(const char* header)
{
    const qint64 expected = tarNumber(header + 148, 8);
    qint64 sum = 0;
    for (int i = 0; i < TarBlockBytes; ++i) {
        const bool inChecksumField = i >= 148 && i < 156;
        sum += inChecksumField ? ' ' : static_cast<unsigned char>(header[i]);
    }
    return expected == sum;
}

//Pax extended header records: "<len> <key>=<value>\n"
QString paxPath(const QByteArray& records)
{
    int offset = 0;
    while (offset < records.size()) {
        const int space = records.indexOf(' ', offset);
        if (space < 0) {
            break;
        }
        bool ok = false;
        const int length = records.mid(offset, space - offset).toInt(&ok);
        if (!ok || length <= 0) {
            break;
        }
        const QByteArray record = records.mid(space + 1, length - (space - offset) - 2);
        const int equals = record.indexOf('=');
        if (equals > 0 && record.left(equals) == "path") {
            return QString::fromUtf8(record.mid(equals + 1));
        }
        offset += length;
    }
    return QString();
}

void finishExtraction(HubTransfer::ArchiveExtractor::Extraction* extraction)
{
    extraction->files.sort();
    extraction->files.removeDuplicates();
}

} // namespace

namespace HubTransfer {

ArchiveExtractor::Format ArchiveExtractor::detectFormat(const QString& path)
{
    const QString lower = path.toLower();
    if (lower.endsWith(QStringLiteral(".tar.gz")) || lower.endsWith(QStringLiteral(".tgz"))) {
        return Format::TarGzip;
    }
    if (lower.endsWith(QStringLiteral(".tar.xz"))) {
        return Format::TarXz;
    }
    if (lower.endsWith(QStringLiteral(".tar"))) {
        return Format::TarPlain;
    }
    if (lower.endsWith(QStringLiteral(".zip"))) {
        return Format::Zip;
    }
    if (lower.endsWith(QStringLiteral(".gz"))) {
        return Format::Gzip;
    }
    return Format::Unknown;
}

QString ArchiveExtractor::formatName(Format format)
{
    switch (format) {
    case Format::Zip:
        return QStringLiteral("zip");
    case Format::TarPlain:
        return QStringLiteral("tar");
    case Format::TarGzip:
        return QStringLiteral("tar.gz");
    case Format::TarXz:
        return QStringLiteral("tar.xz");
    case Format::Gzip:
        return QStringLiteral("gz");
    case Format::Unknown:
        break;
    }
    return QStringLiteral("unknown");
}

QString ArchiveExtractor::defaultExtractPath(const QString& path)
{
    const QString lower = path.toLower();
    auto strip = [&path, &lower](const QString& suffix) -> QString {
        if (lower.endsWith(suffix)) {
            return path.left(path.size() - suffix.size());
        }
        return QString();
    };

    switch (detectFormat(path)) {
    case Format::TarGzip: {
        const QString stripped = strip(QStringLiteral(".tar.gz"));
        return stripped.isEmpty() ? strip(QStringLiteral(".tgz")) : stripped;
    }
    case Format::TarXz:
        return strip(QStringLiteral(".tar.xz"));
    case Format::TarPlain:
        return strip(QStringLiteral(".tar"));
    case Format::Zip:
        return strip(QStringLiteral(".zip"));
    case Format::Gzip:
        return strip(QStringLiteral(".gz"));
    case Format::Unknown:
        break;
    }
    return path;
}

Monad::Result<ArchiveExtractor::Extraction> ArchiveExtractor::extract(const QString& archivePath, const QString& destination)
{
    const Format format = detectFormat(archivePath);
    if (format == Format::Unknown) {
        Extraction extraction;
        extraction.destination = destination;
        return Monad::Result<Extraction>(extraction);
    }

    if (!QFileInfo(archivePath).isFile()) {
        return Monad::Result<Extraction>(QStringLiteral("Archive %1 does not exist").arg(archivePath),
                                         errorCode(TransferErrorCode::Io));
    }

    qDebug() << "[ArchiveExtractor] extracting" << formatName(format) << archivePath << "->" << destination;

    auto run = [&]() -> Monad::Result<Extraction> {
        switch (format) {
        case Format::Zip:
            return extractZip(archivePath, destination);
        case Format::TarPlain: {
            QFile file(archivePath);
            if (!file.open(QIODevice::ReadOnly)) {
                return Monad::Result<Extraction>(QStringLiteral("Failed to open %1: %2").arg(archivePath, file.errorString()),
                                                 errorCode(TransferErrorCode::Io));
            }
            return extractTar(&file, destination);
        }
        case Format::TarGzip: {
            QFile file(archivePath);
            if (!file.open(QIODevice::ReadOnly)) {
                return Monad::Result<Extraction>(QStringLiteral("Failed to open %1: %2").arg(archivePath, file.errorString()),
                                                 errorCode(TransferErrorCode::Io));
            }
            QTemporaryFile tarball;
            if (!tarball.open()) {
                return Monad::Result<Extraction>(QStringLiteral("Failed to create temporary tarball: %1").arg(tarball.errorString()),
                                                 errorCode(TransferErrorCode::Io));
            }
            auto inflated = gunzip(&file, &tarball);
            if (inflated.hasError()) {
                return toResult<Extraction>(inflated);
            }
            tarball.seek(0);
            return extractTar(&tarball, destination);
        }
        case Format::TarXz:
            return extractTarXz(archivePath, destination);
        case Format::Gzip:
            return extractGzip(archivePath, destination);
        case Format::Unknown:
            break;
        }
        return toResult<Extraction>(archiveError(QStringLiteral("Unknown archive format")));
    };

    const auto result = run();
    if (result.hasError()) {
        qWarning() << "[ArchiveExtractor] failed" << archivePath << result.errorMessage();
        return result;
    }

    Extraction extraction = result.value();
    extraction.isArchive = true;
    extraction.format = format;
    extraction.destination = destination;
    return Monad::Result<Extraction>(extraction);
}

bool ArchiveExtractor::isSafeEntryName(const QString& name)
{
    const QString normalized = normalizeEntryName(name);
    if (normalized.isEmpty() || normalized.startsWith(QLatin1Char('/')) || QDir::isAbsolutePath(normalized)) {
        return false;
    }
    if (normalized.size() > 1 && normalized.at(1) == QLatin1Char(':')) {
        return false;
    }
    const QString cleaned = QDir::cleanPath(normalized);
    return cleaned != QStringLiteral("..")
           && !cleaned.startsWith(QStringLiteral("../"))
           && cleaned != QStringLiteral(".");
}

Monad::Result<ArchiveExtractor::Extraction> ArchiveExtractor::extractZip(const QString& archivePath, const QString& destination)
{
    QFile file(archivePath);
    if (!file.open(QIODevice::ReadOnly)) {
        return Monad::Result<Extraction>(QStringLiteral("Failed to open %1: %2").arg(archivePath, file.errorString()),
                                         errorCode(TransferErrorCode::Io));
    }

    const qint64 fileSize = file.size();
    const qint64 tailSize = qMin<qint64>(fileSize, 0xffff + ZipEndOfCentralDirBytes);
    file.seek(fileSize - tailSize);
    const QByteArray tail = file.read(tailSize);

    int eocd = -1;
    for (int i = tail.size() - ZipEndOfCentralDirBytes; i >= 0; --i) {
        if (qFromLittleEndian<quint32>(tail.constData() + i) == ZipEndOfCentralDirSignature) {
            eocd = i;
            break;
        }
    }
    if (eocd < 0) {
        return toResult<Extraction>(archiveError(QStringLiteral("%1 is not a zip archive").arg(archivePath)));
    }

    const char* end = tail.constData() + eocd;
    const quint16 entryCount = qFromLittleEndian<quint16>(end + 10);
    const quint32 directorySize = qFromLittleEndian<quint32>(end + 12);
    const quint32 directoryOffset = qFromLittleEndian<quint32>(end + 16);
    if (entryCount == 0xffff || directoryOffset == 0xffffffff) {
        return toResult<Extraction>(archiveError(QStringLiteral("Zip64 archives are not supported")));
    }

    file.seek(directoryOffset);
    const QByteArray directory = file.read(directorySize);
    if (directory.size() != static_cast<int>(directorySize)) {
        return toResult<Extraction>(archiveError(QStringLiteral("Zip central directory is truncated")));
    }

    if (!QDir().mkpath(destination)) {
        return Monad::Result<Extraction>(QStringLiteral("Failed to create %1").arg(destination),
                                         errorCode(TransferErrorCode::Io));
    }

    Extraction extraction;
    int offset = 0;
    for (int index = 0; index < entryCount; ++index) {
        if (offset + ZipCentralHeaderBytes > directory.size()) {
            return toResult<Extraction>(archiveError(QStringLiteral("Zip central directory is truncated")));
        }
        const char* header = directory.constData() + offset;
        if (qFromLittleEndian<quint32>(header) != ZipCentralHeaderSignature) {
            return toResult<Extraction>(archiveError(QStringLiteral("Bad zip central directory entry")));
        }

        const quint16 flags = qFromLittleEndian<quint16>(header + 8);
        const quint16 method = qFromLittleEndian<quint16>(header + 10);
        const quint32 crc = qFromLittleEndian<quint32>(header + 16);
        const quint32 compressedSize = qFromLittleEndian<quint32>(header + 20);
        const quint32 uncompressedSize = qFromLittleEndian<quint32>(header + 24);
        const quint16 nameLength = qFromLittleEndian<quint16>(header + 28);
        const quint16 extraLength = qFromLittleEndian<quint16>(header + 30);
        const quint16 commentLength = qFromLittleEndian<quint16>(header + 32);
        const quint32 localOffset = qFromLittleEndian<quint32>(header + 42);
        if (offset + ZipCentralHeaderBytes + nameLength + extraLength + commentLength > directory.size()) {
            return toResult<Extraction>(archiveError(QStringLiteral("Zip central directory entry overruns the directory")));
        }
        const QString name = normalizeEntryName(QString::fromUtf8(header + ZipCentralHeaderBytes, nameLength));
        offset += ZipCentralHeaderBytes + nameLength + extraLength + commentLength;

        if (flags & 0x1) {
            return toResult<Extraction>(archiveError(QStringLiteral("Encrypted zip entry %1").arg(name)));
        }

        const auto target = targetPathFor(destination, name);
        if (target.hasError()) {
            return Monad::Result<Extraction>(target.errorMessage(), target.errorCode());
        }

        if (name.endsWith(QLatin1Char('/'))) {
            QDir().mkpath(target.value());
            continue;
        }

        file.seek(localOffset);
        const QByteArray local = file.read(ZipLocalHeaderBytes);
        if (local.size() != ZipLocalHeaderBytes
            || qFromLittleEndian<quint32>(local.constData()) != ZipLocalHeaderSignature) {
            return toResult<Extraction>(archiveError(QStringLiteral("Bad zip local header for %1").arg(name)));
        }
        const quint16 localNameLength = qFromLittleEndian<quint16>(local.constData() + 26);
        const quint16 localExtraLength = qFromLittleEndian<quint16>(local.constData() + 28);
        file.seek(localOffset + ZipLocalHeaderBytes + localNameLength + localExtraLength);

        QFile out(target.value());
        const auto opened = openTarget(&out);
        if (opened.hasError()) {
            return toResult<Extraction>(opened);
        }

        quint32 actualCrc = 0;
        qint64 written = uncompressedSize;
        Monad::ResultBase copied;
        if (method == ZipMethodStored) {
            copied = copyBytes(&file, compressedSize, &out, &actualCrc);
        } else if (method == ZipMethodDeflate) {
            copied = inflateInto(&file, compressedSize, &out, -MAX_WBITS, false, &actualCrc, &written);
        } else {
            copied = archiveError(QStringLiteral("Unsupported zip compression method %1 for %2").arg(method).arg(name));
        }
        out.close();

        if (copied.hasError()) {
            return toResult<Extraction>(copied);
        }
        if (actualCrc != crc || written != uncompressedSize) {
            return toResult<Extraction>(archiveError(QStringLiteral("CRC mismatch for zip entry %1").arg(name)));
        }

        extraction.files.append(QDir::cleanPath(name));
        extraction.totalSize += written;
    }

    finishExtraction(&extraction);
    return Monad::Result<Extraction>(extraction);
}

Monad::Result<ArchiveExtractor::Extraction> ArchiveExtractor::extractTar(QIODevice* source, const QString& destination)
{
    if (!QDir().mkpath(destination)) {
        return Monad::Result<Extraction>(QStringLiteral("Failed to create %1").arg(destination),
                                         errorCode(TransferErrorCode::Io));
    }

    Extraction extraction;
    QString pendingName;

    forever {
        const QByteArray header = source->read(TarBlockBytes);
        if (header.isEmpty()) {
            break;
        }
        if (header.size() != TarBlockBytes) {
            return toResult<Extraction>(archiveError(QStringLiteral("Tar header is truncated")));
        }
        if (header.count('\0') == TarBlockBytes) {
            break;
        }

        const char* raw = header.constData();
        if (!tarChecksumMatches(raw)) {
            return toResult<Extraction>(archiveError(QStringLiteral("Tar header checksum mismatch")));
        }

        const qint64 size = tarNumber(raw + 124, 12);
        if (size < 0) {
            return toResult<Extraction>(archiveError(QStringLiteral("Bad tar entry size")));
        }
        const qint64 padding = (TarBlockBytes - size % TarBlockBytes) % TarBlockBytes;
        const char type = raw[156];

        QString name = tarString(raw, 100);
        const QString prefix = tarString(raw + 345, 155);
        if (QByteArray(raw + 257, 5) == "ustar" && !prefix.isEmpty()) {
            name = prefix + QLatin1Char('/') + name;
        }
        if (!pendingName.isEmpty()) {
            name = pendingName;
            pendingName.clear();
        }
        name = normalizeEntryName(name);

        if (type == 'L' || type == 'x') {
            const QByteArray data = source->read(size);
            if (data.size() != size) {
                return toResult<Extraction>(archiveError(QStringLiteral("Tar extended header is truncated")));
            }
            pendingName = type == 'L' ? tarString(data.constData(), data.size()) : paxPath(data);
            auto skipped = skipBytes(source, padding);
            if (skipped.hasError()) {
                return toResult<Extraction>(skipped);
            }
            continue;
        }

        if (type == '0' || type == '\0' || type == '5') {
            const auto target = targetPathFor(destination, name);
            if (target.hasError()) {
                return Monad::Result<Extraction>(target.errorMessage(), target.errorCode());
            }

            if (type == '5' || name.endsWith(QLatin1Char('/'))) {
                QDir().mkpath(target.value());
            } else {
                QFile out(target.value());
                const auto opened = openTarget(&out);
                if (opened.hasError()) {
                    return toResult<Extraction>(opened);
                }
                auto copied = copyBytes(source, size, &out, nullptr);
                out.close();
                if (copied.hasError()) {
                    return toResult<Extraction>(copied);
                }
                extraction.files.append(QDir::cleanPath(name));
                extraction.totalSize += size;
                auto skipped = skipBytes(source, padding);
                if (skipped.hasError()) {
                    return toResult<Extraction>(skipped);
                }
                continue;
            }
        } else {
            qDebug() << "[ArchiveExtractor] skipping tar entry" << name << "of type" << type;
        }

        auto skipped = skipBytes(source, size + padding);
        if (skipped.hasError()) {
            return toResult<Extraction>(skipped);
        }
    }

    finishExtraction(&extraction);
    return Monad::Result<Extraction>(extraction);
}

Monad::Result<ArchiveExtractor::Extraction> ArchiveExtractor::extractTarXz(const QString& archivePath, const QString& destination)
{
    const QString tar = QStandardPaths::findExecutable(QStringLiteral("tar"));
    if (tar.isEmpty()) {
        return Monad::Result<Extraction>(QStringLiteral("tar executable not found for %1").arg(archivePath),
                                         errorCode(TransferErrorCode::UnsupportedArchive));
    }

    if (!QDir().mkpath(destination)) {
        return Monad::Result<Extraction>(QStringLiteral("Failed to create %1").arg(destination),
                                         errorCode(TransferErrorCode::Io));
    }

    QProcess process;
    process.setProcessChannelMode(QProcess::MergedChannels);
    process.start(tar, {QStringLiteral("-xJf"), archivePath, QStringLiteral("-C"), destination});
    if (!process.waitForStarted() || !process.waitForFinished(-1)) {
        return Monad::Result<Extraction>(QStringLiteral("Failed to run tar: %1").arg(process.errorString()),
                                         errorCode(TransferErrorCode::UnsupportedArchive));
    }

    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        const QString output = QString::fromUtf8(process.readAll()).simplified();
        return Monad::Result<Extraction>(QStringLiteral("tar failed with status %1: %2").arg(process.exitCode()).arg(output),
                                         errorCode(TransferErrorCode::UnsupportedArchive));
    }

    Extraction extraction;
    const QDir root(destination);
    QDirIterator it(destination, QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QString path = it.next();
        extraction.files.append(root.relativeFilePath(path));
        extraction.totalSize += QFileInfo(path).size();
    }

    finishExtraction(&extraction);
    return Monad::Result<Extraction>(extraction);
}

Monad::Result<ArchiveExtractor::Extraction> ArchiveExtractor::extractGzip(const QString& archivePath, const QString& destination)
{
    QFile file(archivePath);
    if (!file.open(QIODevice::ReadOnly)) {
        return Monad::Result<Extraction>(QStringLiteral("Failed to open %1: %2").arg(archivePath, file.errorString()),
                                         errorCode(TransferErrorCode::Io));
    }

    QFile out(destination);
    const auto opened = openTarget(&out);
    if (opened.hasError()) {
        return toResult<Extraction>(opened);
    }

    auto inflated = gunzip(&file, &out);
    out.close();
    if (inflated.hasError()) {
        QFile::remove(destination);
        return toResult<Extraction>(inflated);
    }

    Extraction extraction;
    extraction.files.append(QFileInfo(destination).fileName());
    extraction.totalSize = QFileInfo(destination).size();
    return Monad::Result<Extraction>(extraction);
}

Monad::ResultBase ArchiveExtractor::gunzip(QIODevice* source, QIODevice* target)
{
    return inflateInto(source, -1, target, 16 + MAX_WBITS, true, nullptr, nullptr);
}

} // namespace HubTransfer
