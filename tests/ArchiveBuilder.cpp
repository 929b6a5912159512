//Our includes
#include "ArchiveBuilder.h"

//Qt includes
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QProcess>
#include <QTemporaryDir>
#include <QtEndian>

//Std includes
#include <cstring>

//zlib
#include <zlib.h>

namespace {

void writeOctal(char* field, int width, qint64 value)
{
    const QByteArray text = QByteArray::number(value, 8).rightJustified(width - 1, '0');
    memcpy(field, text.constData(), static_cast<size_t>(width - 1));
    field[width - 1] = '\0';
}

QByteArray deflateRaw(const QByteArray& data, int windowBits)
{
    z_stream stream{};
    deflateInit2(&stream, Z_BEST_COMPRESSION, Z_DEFLATED, windowBits, 8, Z_DEFAULT_STRATEGY);

    QByteArray out;
    out.resize(static_cast<int>(deflateBound(&stream, static_cast<uLong>(data.size()))) + 64);
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.constData()));
    stream.avail_in = static_cast<uInt>(data.size());
    stream.next_out = reinterpret_cast<Bytef*>(out.data());
    stream.avail_out = static_cast<uInt>(out.size());
    deflate(&stream, Z_FINISH);
    out.resize(static_cast<int>(stream.total_out));
    deflateEnd(&stream);
    return out;
}

void append16(QByteArray* out, quint16 value)
{
    char buffer[2];
    qToLittleEndian(value, buffer);
    out->append(buffer, 2);
}

void append32(QByteArray* out, quint32 value)
{
    char buffer[4];
    qToLittleEndian(value, buffer);
    out->append(buffer, 4);
}

} // namespace

QByteArray ArchiveBuilder::tar(const Files& files)
{
    QByteArray out;
    for (auto it = files.constBegin(); it != files.constEnd(); ++it) {
        char header[512];
        memset(header, 0, sizeof(header));

        const QByteArray name = it.key().toUtf8();
        memcpy(header, name.constData(), static_cast<size_t>(qMin(name.size(), 99)));
        writeOctal(header + 100, 8, 0644);
        writeOctal(header + 108, 8, 0);
        writeOctal(header + 116, 8, 0);
        writeOctal(header + 124, 12, it.value().size());
        writeOctal(header + 136, 12, 1700000000);
        header[156] = '0';
        memcpy(header + 257, "ustar", 6);
        memcpy(header + 263, "00", 2);

        memset(header + 148, ' ', 8);
        unsigned int checksum = 0;
        for (unsigned char byte : header) {
            checksum += byte;
        }
        writeOctal(header + 148, 7, checksum);
        header[155] = ' ';

        out.append(header, sizeof(header));
        out.append(it.value());
        const int padding = (512 - it.value().size() % 512) % 512;
        out.append(QByteArray(padding, '\0'));
    }
    out.append(QByteArray(1024, '\0'));
    return out;
}

QByteArray ArchiveBuilder::gzip(const QByteArray& data)
{
    return deflateRaw(data, 16 + MAX_WBITS);
}

QByteArray ArchiveBuilder::zip(const Files& files, bool deflate)
{
    QByteArray out;
    QByteArray directory;
    quint16 count = 0;

    for (auto it = files.constBegin(); it != files.constEnd(); ++it) {
        const QByteArray name = it.key().toUtf8();
        const QByteArray& content = it.value();
        const QByteArray stored = deflate ? deflateRaw(content, -MAX_WBITS) : content;
        const quint32 crc = static_cast<quint32>(crc32(0L,
                                                       reinterpret_cast<const Bytef*>(content.constData()),
                                                       static_cast<uInt>(content.size())));
        const quint16 method = deflate ? 8 : 0;
        const quint32 localOffset = static_cast<quint32>(out.size());

        append32(&out, 0x04034b50);
        append16(&out, 20);
        append16(&out, 0);
        append16(&out, method);
        append16(&out, 0);
        append16(&out, 0);
        append32(&out, crc);
        append32(&out, static_cast<quint32>(stored.size()));
        append32(&out, static_cast<quint32>(content.size()));
        append16(&out, static_cast<quint16>(name.size()));
        append16(&out, 0);
        out.append(name);
        out.append(stored);

        append32(&directory, 0x02014b50);
        append16(&directory, 20);
        append16(&directory, 20);
        append16(&directory, 0);
        append16(&directory, method);
        append16(&directory, 0);
        append16(&directory, 0);
        append32(&directory, crc);
        append32(&directory, static_cast<quint32>(stored.size()));
        append32(&directory, static_cast<quint32>(content.size()));
        append16(&directory, static_cast<quint16>(name.size()));
        append16(&directory, 0);
        append16(&directory, 0);
        append16(&directory, 0);
        append16(&directory, 0);
        append32(&directory, 0);
        append32(&directory, localOffset);
        directory.append(name);
        count++;
    }

    const quint32 directoryOffset = static_cast<quint32>(out.size());
    out.append(directory);

    append32(&out, 0x06054b50);
    append16(&out, 0);
    append16(&out, 0);
    append16(&out, count);
    append16(&out, count);
    append32(&out, static_cast<quint32>(directory.size()));
    append32(&out, directoryOffset);
    append16(&out, 0);
    return out;
}

bool ArchiveBuilder::writeTarXz(const Files& files, const QString& archivePath)
{
    QTemporaryDir staging;
    if (!staging.isValid()) {
        return false;
    }

    QStringList names;
    for (auto it = files.constBegin(); it != files.constEnd(); ++it) {
        const QString path = staging.filePath(it.key());
        QDir().mkpath(QFileInfo(path).absolutePath());
        if (!writeFile(path, it.value())) {
            return false;
        }
        names.append(it.key());
    }

    QProcess process;
    process.setWorkingDirectory(staging.path());
    process.start(QStringLiteral("tar"), QStringList{QStringLiteral("-cJf"), archivePath} + names);
    if (!process.waitForFinished(60000)) {
        return false;
    }
    return process.exitStatus() == QProcess::NormalExit && process.exitCode() == 0;
}

bool ArchiveBuilder::writeFile(const QString& path, const QByteArray& contents)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    return file.write(contents) == contents.size();
}

QByteArray ArchiveBuilder::readFile(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return QByteArray();
    }
    return file.readAll();
}

QByteArray ArchiveBuilder::randomBytes(qint64 size, quint32 seed)
{
    QByteArray data;
    data.resize(static_cast<int>(size));
    quint32 state = seed ? seed : 0x9e3779b9u;
    for (int i = 0; i < data.size(); ++i) {
        state ^= state << 13;
        state ^= state >> 17;
        state ^= state << 5;
        data[i] = static_cast<char>(state & 0xff);
    }
    return data;
}
