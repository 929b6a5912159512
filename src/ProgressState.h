#ifndef PROGRESSSTATE_H
#define PROGRESSSTATE_H

//Qt includes
#include <QString>
#include <QVariantMap>

//Std includes
#include <functional>

namespace HubTransfer {

class ProgressState
{
public:
    ProgressState() = default;
    ProgressState(QString path, qint64 current, qint64 total);

    QString path() const { return mPath; }
    qint64 current() const { return mCurrent; }
    qint64 total() const { return mTotal; }

    double progress() const;
    bool isComplete() const { return mTotal > 0 && mCurrent >= mTotal; }

    //"path: 1.50 MB / 10.00 MB"
    QString text() const;

    QVariantMap data() const;
    QString toJsonString() const;
    static ProgressState fromJson(const QString& json);

    static QString bytesToString(qint64 bytes);

private:
    QString mPath;
    qint64 mCurrent = 0;
    qint64 mTotal = 0;
};

using ProgressCallback = std::function<void (const ProgressState&)>;

} // namespace HubTransfer

#endif // PROGRESSSTATE_H
