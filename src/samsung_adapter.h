#pragma once

#include <optional>

#include <QString>
#include <QUrl>

#include "brand_adapter.h"

namespace tvremote {

// Socket push remote: one JSON click frame per connection, authorised by a
// token the TV issues after the user accepts the on-screen prompt.
class SamsungAdapter final : public BrandAdapter
{
public:
    explicit SamsungAdapter(const AdapterContext &context);

    Brand brand() const override { return Brand::Samsung; }
    DispatchResult send(const TvProfile &profile, RemoteCommand command) override;
    ProbePlan probePlan(const QString &host, bool explicitHost) const override;

    static std::optional<QString> keyFor(RemoteCommand command);

private:
    AttemptResult sendOverSockets(const QString &host, const QString &key, const QString &token) const;
    AttemptResult sendOverUrl(const QUrl &url, const QString &key, bool hasToken) const;
    AttemptResult sendPinned(const QString &cacheKey, const QString &host, const QString &key, const QString &token) const;
};

} // namespace tvremote
