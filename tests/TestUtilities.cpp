//Our includes
#include "TestUtilities.h"
#include "hub/HubServer.h"

//Qt includes
#include <QDirIterator>
#include <QFile>
#include <QUrl>
#include <QUuid>

//Catch includes
#include <catch2/catch_test_macros.hpp>

QDir TestUtilities::createUniqueTempDir()
{
    QDir tempDir = QDir::temp();
    auto tempDirId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    REQUIRE(tempDir.mkdir(tempDirId)); //If this fails the folder already exist, remove it, try again
    tempDir.cd(tempDirId);
    return tempDir;
}

HubTransfer::HubSettings TestUtilities::settingsFor(const HubServer& server, const QDir& cacheDir)
{
    HubTransfer::HubSettings settings;
    settings.setEndpoint(QUrl(server.endpoint()));
    settings.setCacheDir(cacheDir.absolutePath());
    settings.setToken(QByteArrayLiteral("test-token"));
    settings.setRequestTimeoutMs(10000);
    settings.setRetryBackoffMs(10);
    settings.setLockTimeoutMs(2000);
    return settings;
}

QByteArray TestUtilities::readFile(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return QByteArray();
    }
    return file.readAll();
}

QStringList TestUtilities::filesUnder(const QString& rootPath)
{
    const QDir root(rootPath);
    QStringList files;
    QDirIterator it(rootPath, QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        files.append(root.relativeFilePath(it.next()));
    }
    files.sort();
    return files;
}

std::ostream& operator<<(std::ostream& os, const QString& string)
{
    os << string.toStdString();
    return os;
}

std::ostream& operator<<(std::ostream& os, const QStringList& list) {
    for (int i = 0; i < list.size(); ++i) {
        os << list.at(i).toStdString();
        if (i != list.size() - 1)
            os << ", ";
    }
    return os;
}
