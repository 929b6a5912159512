#ifndef HUBAUTHPROVIDER_H
#define HUBAUTHPROVIDER_H

#include <QByteArray>
#include <QUrl>

namespace HubTransfer {

class HubAuthProvider
{
public:
    virtual ~HubAuthProvider() = default;
    virtual QByteArray authorizationHeader(const QUrl& url) const = 0;
};

//Sends "Bearer <token>" to every url, or nothing when the token is empty
class BearerTokenAuthProvider : public HubAuthProvider
{
public:
    explicit BearerTokenAuthProvider(QByteArray token)
        : mToken(std::move(token))
    {
    }

    QByteArray authorizationHeader(const QUrl& url) const override
    {
        Q_UNUSED(url);
        if (mToken.isEmpty()) {
            return QByteArray();
        }
        return QByteArray("Bearer ") + mToken;
    }

private:
    QByteArray mToken;
};

} // namespace HubTransfer

#endif // HUBAUTHPROVIDER_H
