#pragma once

#include <optional>

#include <QList>
#include <QString>
#include <QUrl>

#include "brand_adapter.h"

namespace tvremote {

// JointSpace REST: {"key": K} posted to the input/key resource of API
// version 6, falling back to version 1.
class PhilipsAdapter final : public BrandAdapter
{
public:
    explicit PhilipsAdapter(const AdapterContext &context);

    Brand brand() const override { return Brand::Philips; }
    DispatchResult send(const TvProfile &profile, RemoteCommand command) override;
    ProbePlan probePlan(const QString &host, bool explicitHost) const override;

    static std::optional<QString> keyFor(RemoteCommand command);

    QList<QUrl> commandUrls(const TvProfile &profile) const;
};

} // namespace tvremote
