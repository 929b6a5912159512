#ifndef REPOREF_H
#define REPOREF_H

#include <QString>

#include "Monad/Result.h"

namespace HubTransfer {

class RepoRef
{
public:
    enum class Type {
        Model,
        Dataset,
        Space
    };

    RepoRef() = default;
    RepoRef(QString repoId, Type type = Type::Model);

    QString repoId() const { return mRepoId; }
    Type type() const { return mType; }

    QString owner() const;
    QString name() const;
    bool isValid() const;

    //models--owner--name, the folder that scopes a repository in the cache
    QString cacheFolderName() const;

    //"" for models, "datasets/" and "spaces/" otherwise
    QString urlPrefix() const;

    static QString typeName(Type type);
    static Monad::Result<RepoRef> fromCacheFolderName(const QString& folderName);

    bool operator==(const RepoRef& other) const;
    bool operator!=(const RepoRef& other) const { return !(*this == other); }

private:
    QString mRepoId;
    Type mType = Type::Model;
};

} // namespace HubTransfer

#endif // REPOREF_H
