#pragma once

#include <optional>

#include <QString>

#include "brand_adapter.h"

namespace tvremote {

// External Control Protocol: POST /keypress/<Key>, no authentication.
class RokuAdapter final : public BrandAdapter
{
public:
    explicit RokuAdapter(const AdapterContext &context);

    Brand brand() const override { return Brand::Roku; }
    DispatchResult send(const TvProfile &profile, RemoteCommand command) override;
    ProbePlan probePlan(const QString &host, bool explicitHost) const override;

    static std::optional<QString> keyFor(RemoteCommand command);
};

} // namespace tvremote
