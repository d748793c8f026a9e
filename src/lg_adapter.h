#pragma once

#include <optional>

#include <QJsonObject>
#include <QString>
#include <QUrl>

#include "brand_adapter.h"

namespace tvremote {

// webOS second-screen socket: register (prompt on first use, client key
// afterwards), then one ssap request per connection.
class LgAdapter final : public BrandAdapter
{
public:
    struct Request {
        QString uri;
        QJsonObject payload;
    };

    explicit LgAdapter(const AdapterContext &context);

    Brand brand() const override { return Brand::Lg; }
    DispatchResult send(const TvProfile &profile, RemoteCommand command) override;
    ProbePlan probePlan(const QString &host, bool explicitHost) const override;

    static std::optional<Request> requestFor(RemoteCommand command);
    static QJsonObject registerPayload(const QString &clientKey);

private:
    AttemptResult sendOverSockets(const QString &host, const Request &request, const QString &clientKey) const;
    AttemptResult sendOverUrl(const QUrl &url, const Request &request, const QString &clientKey) const;
};

} // namespace tvremote
