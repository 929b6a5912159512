#include "RepoRef.h"
#include "TransferError.h"

#include <QStringList>

namespace {
const QString Separator = QStringLiteral("--");
}

namespace HubTransfer {

RepoRef::RepoRef(QString repoId, Type type)
    : mRepoId(std::move(repoId)),
      mType(type)
{
}

QString RepoRef::owner() const
{
    const int slash = mRepoId.indexOf(QLatin1Char('/'));
    if (slash < 0) {
        return QString();
    }
    return mRepoId.left(slash);
}

QString RepoRef::name() const
{
    const int slash = mRepoId.indexOf(QLatin1Char('/'));
    if (slash < 0) {
        return mRepoId;
    }
    return mRepoId.mid(slash + 1);
}

bool RepoRef::isValid() const
{
    if (mRepoId.isEmpty() || mRepoId.count(QLatin1Char('/')) > 1) {
        return false;
    }
    if (name().isEmpty() || mRepoId.startsWith(QLatin1Char('/'))) {
        return false;
    }
    return !mRepoId.contains(Separator) && !mRepoId.contains(QStringLiteral(".."));
}

QString RepoRef::cacheFolderName() const
{
    QStringList parts;
    parts << typeName(mType) + QLatin1Char('s');
    if (!owner().isEmpty()) {
        parts << owner();
    }
    parts << name();
    return parts.join(Separator);
}

QString RepoRef::urlPrefix() const
{
    switch (mType) {
    case Type::Model:
        return QString();
    case Type::Dataset:
        return QStringLiteral("datasets/");
    case Type::Space:
        return QStringLiteral("spaces/");
    }
    return QString();
}

QString RepoRef::typeName(Type type)
{
    switch (type) {
    case Type::Model:
        return QStringLiteral("model");
    case Type::Dataset:
        return QStringLiteral("dataset");
    case Type::Space:
        return QStringLiteral("space");
    }
    return QString();
}

Monad::Result<RepoRef> RepoRef::fromCacheFolderName(const QString& folderName)
{
    const QStringList parts = folderName.split(Separator);
    if (parts.size() < 2 || parts.size() > 3) {
        return Monad::Result<RepoRef>(QStringLiteral("Not a repository cache folder: %1").arg(folderName),
                                      errorCode(TransferErrorCode::Protocol));
    }

    const QString kind = parts.first();
    Type type;
    if (kind == QStringLiteral("models")) {
        type = Type::Model;
    } else if (kind == QStringLiteral("datasets")) {
        type = Type::Dataset;
    } else if (kind == QStringLiteral("spaces")) {
        type = Type::Space;
    } else {
        return Monad::Result<RepoRef>(QStringLiteral("Unknown repository kind: %1").arg(kind),
                                      errorCode(TransferErrorCode::Protocol));
    }

    const QString repoId = parts.size() == 3
        ? parts.at(1) + QLatin1Char('/') + parts.at(2)
        : parts.at(1);
    return Monad::Result<RepoRef>(RepoRef(repoId, type));
}

bool RepoRef::operator==(const RepoRef& other) const
{
    return mRepoId == other.mRepoId && mType == other.mType;
}

} // namespace HubTransfer
