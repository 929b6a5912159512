#ifndef ARCHIVEEXTRACTOR_H
#define ARCHIVEEXTRACTOR_H

#include <QString>
#include <QStringList>

#include "Monad/Result.h"

class QIODevice;

namespace HubTransfer {

class ArchiveExtractor
{
public:
    enum class Format {
        Zip,
        TarPlain,
        TarGzip,
        TarXz,
        Gzip,
        Unknown
    };

    struct Extraction {
        bool isArchive = false;
        Format format = Format::Unknown;

        //Directory for tarballs and zips, the output file for a single gzip
        QString destination;

        //Relative to destination, sorted
        QStringList files;
        qint64 totalSize = 0;
    };

    //Longest lowercase suffix wins, .tar.gz and .tgz before .gz
    static Format detectFormat(const QString& path);
    static QString formatName(Format format);

    //Path with the archive suffix stripped, unchanged for non archives
    static QString defaultExtractPath(const QString& path);

    //Unknown formats succeed with isArchive false
    static Monad::Result<Extraction> extract(const QString& archivePath, const QString& destination);

    static bool isSafeEntryName(const QString& name);

private:
    static Monad::Result<Extraction> extractZip(const QString& archivePath, const QString& destination);
    static Monad::Result<Extraction> extractTar(QIODevice* source, const QString& destination);
    static Monad::Result<Extraction> extractTarXz(const QString& archivePath, const QString& destination);
    static Monad::Result<Extraction> extractGzip(const QString& archivePath, const QString& destination);

    static Monad::ResultBase gunzip(QIODevice* source, QIODevice* target);
};

} // namespace HubTransfer

#endif // ARCHIVEEXTRACTOR_H
