//Our includes
#include "ProgressState.h"

//Qt includes
#include <QJsonDocument>

static const QString pathKey = QStringLiteral("path");
static const QString currentKey = QStringLiteral("current");
static const QString totalKey = QStringLiteral("total");

using namespace HubTransfer;

ProgressState::ProgressState(QString path, qint64 current, qint64 total) :
    mPath(std::move(path)),
    mCurrent(current),
    mTotal(total)
{
}

double ProgressState::progress() const
{
    if(mTotal <= 0) {
        return 0.0;
    }
    return mCurrent / static_cast<double>(mTotal);
}

QString ProgressState::text() const
{
    if(mTotal <= 0) {
        return mPath + QStringLiteral(": ") + bytesToString(mCurrent);
    }
    return mPath + QStringLiteral(": ")
           + bytesToString(mCurrent)
           + QStringLiteral(" / ")
           + bytesToString(mTotal);
}

QVariantMap ProgressState::data() const
{
    return {
        {pathKey, path()},
        {currentKey, current()},
        {totalKey, total()}
    };
}

QString ProgressState::toJsonString() const
{
    auto doc = QJsonDocument::fromVariant(data());
    return doc.toJson(QJsonDocument::Compact);
}

ProgressState ProgressState::fromJson(const QString &json)
{
    auto doc = QJsonDocument::fromJson(json.toUtf8());
    auto map = doc.toVariant().toMap();
    return ProgressState(map.value(pathKey).toString(),
                         map.value(currentKey).toLongLong(),
                         map.value(totalKey).toLongLong());
}

QString ProgressState::bytesToString(qint64 bytes)
{
    const double next = 1024;
    const double kb = next;
    const double mb = kb * next;
    const double gb = mb * next;

    if(bytes < kb) {
        return QString::number(bytes) + QStringLiteral(" B");
    }

    auto toString = [bytes](double unit, const QString& unitStr) {
        return QString::number(bytes / unit, 'f', 2)
               + QStringLiteral(" ")
               + unitStr;
    };

    if(bytes < mb) {
        return toString(kb, QStringLiteral("KB"));
    } else if(bytes < gb) {
        return toString(mb, QStringLiteral("MB"));
    }
    return toString(gb, QStringLiteral("GB"));
}
